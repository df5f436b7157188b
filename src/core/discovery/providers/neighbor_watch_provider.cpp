#include "core/discovery/providers/neighbor_watch_provider.hpp"

#include <exception>
#include <string>
#include <utility>

namespace lanscan {
namespace core {
namespace discovery {
namespace providers {

using device::model::Device;
using device::model::DiscoverySource;
using device::mutation::MutationSource;

Device MakeNeighborObservation(const network::NeighborEntry& entry, std::int64_t now_ms,
                               const std::optional<std::string>& existing_id) {
  Device d;
  if (existing_id) d.id = *existing_id;
  d.mac_address = entry.mac;
  d.primary_ip = entry.ip;
  d.ips.insert(entry.ip);
  d.discovery_sources.insert(DiscoverySource::Arp);
  d.last_seen_ms = now_ms;
  return d;
}

std::optional<std::string> NeighborTargetId(const network::NeighborEntry& entry,
                                            const std::optional<Device>& holder) {
  if (!holder || holder->id.empty()) return std::nullopt;
  if (!holder->mac_address || holder->mac_address->empty()) return holder->id;
  if (device::model::NormalizeMac(*holder->mac_address) == device::model::NormalizeMac(entry.mac)) {
    return holder->id;
  }
  return std::nullopt;
}

NeighborWatchProvider::NeighborWatchProvider(Options opt, std::shared_ptr<network::NeighborTable> table,
                                             AddressLookup lookup,
                                             std::shared_ptr<const common::time::Clock> clock,
                                             std::shared_ptr<common::log::Logger> logger)
    : opt_(opt),
      table_(std::move(table)),
      lookup_(std::move(lookup)),
      clock_(std::move(clock)),
      log_(std::move(logger), "arp") {
  if (!clock_) clock_ = std::make_shared<common::time::SystemClock>();
}

NeighborWatchProvider::~NeighborWatchProvider() { Stop(); }

std::string NeighborWatchProvider::Name() const { return "neighbor_watch"; }

bool NeighborWatchProvider::Start(std::shared_ptr<device::mutation::MutationBus> bus) {
  if (!bus || !table_) return false;
  if (running_.exchange(true)) return true;
  token_ = common::CancellationToken();
  thread_ = std::thread(&NeighborWatchProvider::Loop, this, std::move(bus), token_);
  log_.Info("neighbor watch started");
  return true;
}

void NeighborWatchProvider::Stop() {
  if (!running_.exchange(false)) return;
  token_.Cancel();
  if (thread_.joinable()) thread_.join();
  log_.Info("neighbor watch stopped");
}

std::size_t NeighborWatchProvider::PollOnce(device::mutation::MutationBus& bus) {
  std::size_t emitted = 0;
  const std::int64_t now = clock_->NowMs();
  for (const auto& e : table_->Read()) {
    auto it = known_.find(e.ip);
    if (it != known_.end() && it->second == e.mac) continue;
    known_[e.ip] = e.mac;

    std::optional<std::string> existing;
    if (lookup_) existing = NeighborTargetId(e, lookup_(e.ip));
    bus.Emit(device::mutation::Observation(MakeNeighborObservation(e, now, existing), MutationSource::Arp));
    ++emitted;
  }
  return emitted;
}

void NeighborWatchProvider::Loop(std::shared_ptr<device::mutation::MutationBus> bus,
                                 common::CancellationToken token) {
  do {
    try {
      const std::size_t n = PollOnce(*bus);
      if (n > 0) log_.Debug("neighbor watch emitted " + std::to_string(n));
    } catch (const std::exception& ex) {
      log_.Error(std::string("neighbor poll failed: ") + ex.what());
    }
  } while (token.SleepFor(opt_.poll_interval_ms));
}

}  // namespace providers
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
