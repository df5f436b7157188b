#include "core/discovery/scheduler/ping_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include "core/common/utils/json_utils.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace scheduler {

using device::model::Device;
using device::model::DiscoverySource;
using device::mutation::MutationSource;

PingScheduler::PingScheduler(Options opt, std::shared_ptr<probe::ReachabilityProbe> probe,
                             std::shared_ptr<device::mutation::MutationBus> bus,
                             std::shared_ptr<const common::time::Clock> clock,
                             std::shared_ptr<common::log::Logger> logger)
    : opt_(opt),
      probe_(std::move(probe)),
      bus_(std::move(bus)),
      clock_(std::move(clock)),
      log_(std::move(logger), "ping") {
  if (opt_.max_concurrent == 0) opt_.max_concurrent = 1;
  if (!clock_) clock_ = std::make_shared<common::time::SystemClock>();
}

bool PingScheduler::ProbeHost(const std::string& host, const probe::ProbeConfig& config,
                              const common::CancellationToken& token) {
  bool replied = false;
  probe_->Probe(host, config, token, [&](const probe::ProbeAttempt& a) {
    if (!a.success) {
      log_.Trace("timeout " + host + " seq=" + std::to_string(a.sequence));
      return true;
    }
    Device d;
    d.primary_ip = host;
    d.ips.insert(host);
    d.rtt_millis = a.rtt_millis;
    d.discovery_sources.insert(DiscoverySource::Ping);
    d.last_seen_ms = clock_->NowMs();
    bus_->Emit(device::mutation::Observation(std::move(d), MutationSource::Ping));
    log_.Debug("reply " + host + " rtt=" + common::json::Number(a.rtt_millis) + "ms");
    replied = true;
    return false;
  });
  return replied;
}

std::size_t PingScheduler::Enqueue(const std::vector<std::string>& hosts, const probe::ProbeConfig& config,
                                   const common::CancellationToken& token, ScanProgress* progress) {
  if (hosts.empty() || !probe_ || !bus_) return 0;

  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> successes{0};
  auto worker = [&]() {
    for (;;) {
      if (token.IsCancelled()) return;
      const std::size_t i = next.fetch_add(1);
      if (i >= hosts.size()) return;

      bool ok = false;
      try {
        ok = ProbeHost(hosts[i], config, token);
      } catch (const std::exception& ex) {
        log_.Warn("probe " + hosts[i] + " failed: " + ex.what());
      }
      if (ok) successes.fetch_add(1);
      if (progress != nullptr) progress->RecordCompleted(ok);
    }
  };

  const std::size_t n_workers = std::min(opt_.max_concurrent, hosts.size());
  log_.Info("probing " + std::to_string(hosts.size()) + " hosts with " + std::to_string(n_workers) +
            " workers");
  std::vector<std::thread> pool;
  pool.reserve(n_workers);
  for (std::size_t i = 0; i < n_workers; ++i) pool.emplace_back(worker);
  for (auto& t : pool) t.join();

  const std::size_t replied = successes.load();
  log_.Info("probe sweep done, " + std::to_string(replied) + " hosts replied" +
            (token.IsCancelled() ? " (cancelled)" : ""));
  return replied;
}

}  // namespace scheduler
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
