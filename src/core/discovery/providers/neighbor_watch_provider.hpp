#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/cancellation.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/discovery/network/neighbor_table.hpp"
#include "core/discovery/providers/provider_base.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace providers {

// Looks up the record that already holds an address, if any.
using AddressLookup = std::function<std::optional<device::model::Device>(const std::string& ip)>;

// Record a neighbor entry should update: the holder of its address when that record
// has no MAC yet or the same one. A holder with another MAC is a different device.
std::optional<std::string> NeighborTargetId(const network::NeighborEntry& entry,
                                            const std::optional<device::model::Device>& holder);

// Arp observation for one neighbor entry. With existing_id the change targets that
// record instead of a MAC-keyed one.
device::model::Device MakeNeighborObservation(const network::NeighborEntry& entry, std::int64_t now_ms,
                                              const std::optional<std::string>& existing_id);

// Polls the neighbor table and reports new or changed entries.
class NeighborWatchProvider final : public DiscoveryProvider {
public:
  struct Options {
    std::int64_t poll_interval_ms = 5000;
  };

  NeighborWatchProvider(Options opt, std::shared_ptr<network::NeighborTable> table,
                        AddressLookup lookup = nullptr,
                        std::shared_ptr<const common::time::Clock> clock = nullptr,
                        std::shared_ptr<common::log::Logger> logger = nullptr);
  ~NeighborWatchProvider() override;

  std::string Name() const override;
  bool Start(std::shared_ptr<device::mutation::MutationBus> bus) override;
  void Stop() override;
  bool Running() const override { return running_.load(); }

  // One poll; returns how many observations were emitted.
  std::size_t PollOnce(device::mutation::MutationBus& bus);

private:
  void Loop(std::shared_ptr<device::mutation::MutationBus> bus, common::CancellationToken token);

private:
  Options opt_;
  std::shared_ptr<network::NeighborTable> table_;
  AddressLookup lookup_;
  std::shared_ptr<const common::time::Clock> clock_;
  common::log::TaggedLogger log_;

  std::map<std::string, std::string> known_;  // ip -> mac, touched only by the poll thread
  std::atomic<bool> running_{false};
  common::CancellationToken token_;
  std::thread thread_;
};

}  // namespace providers
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
