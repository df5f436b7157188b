#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/cancellation.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/snapshot_reconciler.hpp"
#include "core/device/mutation/mutation_bus.hpp"
#include "core/discovery/network/host_enumerator.hpp"
#include "core/discovery/network/neighbor_table.hpp"
#include "core/discovery/probe/reachability_probe.hpp"
#include "core/discovery/providers/provider_base.hpp"
#include "core/discovery/scheduler/ping_scheduler.hpp"
#include "core/discovery/scheduler/scan_progress.hpp"

namespace lanscan {
namespace core {
namespace discovery {

struct ScanRequest {
  std::vector<std::string> hosts;
  probe::ProbeConfig probe;
  double warmup_sec = 1.0;
  bool auto_enumerate = true;
  std::size_t max_auto_hosts = 254;
};

struct ControlState {
  bool passive_active = false;
  bool scanning = false;
};

struct DiscoveryOrchestratorOptions {
  std::int64_t arp_settle_ms = 1000;
  std::int64_t drain_timeout_ms = 2000;
};

// Sequences one sweep: enumerate, warm up passive discovery, probe, then prime and
// refresh neighbor data. Without ICMP, neighbor priming stands in for probing.
class DiscoveryOrchestrator {
public:
  struct Collaborators {
    std::shared_ptr<device::mutation::MutationBus> bus;
    std::shared_ptr<device::manager::SnapshotReconciler> reconciler;
    std::shared_ptr<scheduler::PingScheduler> scheduler;
    std::shared_ptr<probe::ReachabilityProbe> probe;
    std::shared_ptr<network::HostEnumerator> enumerator;
    std::shared_ptr<network::NeighborTable> neighbors;
    std::shared_ptr<network::NeighborPrimer> primer;
    std::shared_ptr<scheduler::ScanProgress> progress;
    std::shared_ptr<const common::time::Clock> clock;
  };

  using Options = DiscoveryOrchestratorOptions;

  DiscoveryOrchestrator(Collaborators c, Options opt = {},
                        std::shared_ptr<common::log::Logger> logger = nullptr);
  ~DiscoveryOrchestrator();

  DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
  DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

  void AddPassiveProvider(std::shared_ptr<providers::DiscoveryProvider> provider);

  bool StartBonjour();
  void StopBonjour();

  // Starts a sweep on its own thread; a running sweep is cancelled first.
  bool StartScan(ScanRequest request);
  void StopScan();

  // Waits for the current sweep to end. True if no sweep is running on return.
  bool WaitForScan(std::int64_t timeout_ms);

  ControlState CurrentState() const;
  scheduler::ScanPhase Phase() const;
  std::shared_ptr<scheduler::ScanProgress> Progress() const { return c_.progress; }

private:
  void RunCycle(ScanRequest request, common::CancellationToken token);
  void EnterPhase(scheduler::ScanPhase phase);
  // Primes the neighbor table, waits for it to settle, then folds it in.
  void PrimeAndRefresh(const std::vector<std::string>& hosts, const common::CancellationToken& token,
                       bool count_progress);
  std::size_t RefreshNeighbors(const std::vector<std::string>& hosts, bool count_progress);
  void JoinScanLocked();

private:
  Collaborators c_;
  Options opt_;
  common::log::TaggedLogger log_;

  mutable std::mutex ctl_mu_;
  std::vector<std::shared_ptr<providers::DiscoveryProvider>> passive_;
  bool passive_active_ = false;

  // Serializes StartScan/StopScan and is held across the join, so ctl_mu_ never is.
  std::mutex scan_mu_;
  std::thread scan_thread_;
  common::CancellationToken scan_token_;
  std::atomic<bool> scanning_{false};
  std::mutex done_mu_;
  std::condition_variable done_cv_;
};

}  // namespace discovery
}  // namespace core
}  // namespace lanscan
