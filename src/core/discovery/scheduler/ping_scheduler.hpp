#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/cancellation.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/mutation/mutation_bus.hpp"
#include "core/discovery/probe/reachability_probe.hpp"
#include "core/discovery/scheduler/scan_progress.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace scheduler {

// Probes a host list with at most max_concurrent probes in flight. The first
// successful attempt per host becomes a Ping observation on the bus; timeouts are dropped.
class PingScheduler {
public:
  struct Options {
    std::size_t max_concurrent = 32;
  };

  PingScheduler(Options opt, std::shared_ptr<probe::ReachabilityProbe> probe,
                std::shared_ptr<device::mutation::MutationBus> bus,
                std::shared_ptr<const common::time::Clock> clock = nullptr,
                std::shared_ptr<common::log::Logger> logger = nullptr);

  // Blocks until every host has been probed or the token is cancelled; hosts not yet
  // started at cancellation are abandoned. Returns how many hosts replied.
  std::size_t Enqueue(const std::vector<std::string>& hosts, const probe::ProbeConfig& config,
                      const common::CancellationToken& token, ScanProgress* progress = nullptr);

  std::size_t MaxConcurrent() const { return opt_.max_concurrent; }

private:
  bool ProbeHost(const std::string& host, const probe::ProbeConfig& config,
                 const common::CancellationToken& token);

private:
  Options opt_;
  std::shared_ptr<probe::ReachabilityProbe> probe_;
  std::shared_ptr<device::mutation::MutationBus> bus_;
  std::shared_ptr<const common::time::Clock> clock_;
  common::log::TaggedLogger log_;
};

}  // namespace scheduler
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
