#include "core/discovery/discovery_orchestrator.hpp"

#include <chrono>
#include <exception>
#include <set>
#include <string>
#include <utility>

#include "core/discovery/providers/neighbor_watch_provider.hpp"

namespace lanscan {
namespace core {
namespace discovery {

using scheduler::ScanPhase;

DiscoveryOrchestrator::DiscoveryOrchestrator(Collaborators c, Options opt,
                                             std::shared_ptr<common::log::Logger> logger)
    : c_(std::move(c)), opt_(opt), log_(std::move(logger), "discovery") {
  if (!c_.progress) c_.progress = std::make_shared<scheduler::ScanProgress>();
  if (!c_.clock) c_.clock = std::make_shared<common::time::SystemClock>();
}

DiscoveryOrchestrator::~DiscoveryOrchestrator() {
  StopScan();
  StopBonjour();
}

void DiscoveryOrchestrator::AddPassiveProvider(std::shared_ptr<providers::DiscoveryProvider> provider) {
  if (!provider) return;
  std::lock_guard<std::mutex> lk(ctl_mu_);
  passive_.push_back(provider);
  if (passive_active_ && !provider->Running()) provider->Start(c_.bus);
}

bool DiscoveryOrchestrator::StartBonjour() {
  std::lock_guard<std::mutex> lk(ctl_mu_);
  if (passive_active_) return true;
  std::size_t started = 0;
  for (const auto& p : passive_) {
    if (p->Start(c_.bus)) {
      ++started;
    } else {
      log_.Warn("passive provider " + p->Name() + " failed to start");
    }
  }
  passive_active_ = true;
  log_.Info("passive discovery on, providers=" + std::to_string(started));
  return true;
}

void DiscoveryOrchestrator::StopBonjour() {
  std::lock_guard<std::mutex> lk(ctl_mu_);
  if (!passive_active_) return;
  for (const auto& p : passive_) p->Stop();
  passive_active_ = false;
  log_.Info("passive discovery off");
}

bool DiscoveryOrchestrator::StartScan(ScanRequest request) {
  std::lock_guard<std::mutex> lk(scan_mu_);
  if (scanning_.load()) {
    log_.Info("restarting sweep");
    scan_token_.Cancel();
  }
  JoinScanLocked();

  scan_token_ = common::CancellationToken();
  scanning_.store(true);
  c_.progress->Reset();
  scan_thread_ = std::thread(&DiscoveryOrchestrator::RunCycle, this, std::move(request), scan_token_);
  return true;
}

void DiscoveryOrchestrator::StopScan() {
  std::lock_guard<std::mutex> lk(scan_mu_);
  if (!scan_thread_.joinable()) return;
  scan_token_.Cancel();
  JoinScanLocked();
  if (!c_.progress->Snapshot().finished) c_.progress->Finish();
  log_.Info("sweep stopped");
}

void DiscoveryOrchestrator::JoinScanLocked() {
  if (scan_thread_.joinable()) scan_thread_.join();
}

bool DiscoveryOrchestrator::WaitForScan(std::int64_t timeout_ms) {
  std::unique_lock<std::mutex> lk(done_mu_);
  return done_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                           [this] { return !scanning_.load(); });
}

ControlState DiscoveryOrchestrator::CurrentState() const {
  ControlState s;
  {
    std::lock_guard<std::mutex> lk(ctl_mu_);
    s.passive_active = passive_active_;
  }
  s.scanning = scanning_.load();
  return s;
}

ScanPhase DiscoveryOrchestrator::Phase() const { return c_.progress->Snapshot().phase; }

void DiscoveryOrchestrator::EnterPhase(ScanPhase phase) {
  c_.progress->SetPhase(phase);
  log_.Info(std::string("phase ") + scheduler::ToString(phase));
}

void DiscoveryOrchestrator::RunCycle(ScanRequest request, common::CancellationToken token) {
  try {
    std::vector<std::string> hosts = std::move(request.hosts);
    if (hosts.empty() && request.auto_enumerate && c_.enumerator) {
      EnterPhase(ScanPhase::Enumerating);
      hosts = c_.enumerator->Enumerate(request.max_auto_hosts);
    }
    if (c_.enumerator && c_.reconciler) c_.reconciler->SetActiveNetworks(c_.enumerator->ActiveNetworks());

    c_.progress->Begin(hosts.size());
    if (hosts.empty()) {
      log_.Info("no hosts to scan");
    } else if (c_.probe && c_.scheduler && c_.probe->Available()) {
      EnterPhase(ScanPhase::MdnsWarmup);
      if (token.SleepFor(common::time::SecondsToMs(request.warmup_sec))) {
        EnterPhase(ScanPhase::Pinging);
        c_.scheduler->Enqueue(hosts, request.probe, token, c_.progress.get());
      }
      if (!token.IsCancelled()) PrimeAndRefresh(hosts, token, false);
    } else {
      PrimeAndRefresh(hosts, token, true);
    }
  } catch (const std::exception& ex) {
    log_.Error(std::string("sweep failed: ") + ex.what());
  }

  c_.progress->Finish();
  log_.Info(std::string("sweep ") + (token.IsCancelled() ? "cancelled" : "finished"));
  {
    std::lock_guard<std::mutex> lk(done_mu_);
    scanning_.store(false);
  }
  done_cv_.notify_all();
}

void DiscoveryOrchestrator::PrimeAndRefresh(const std::vector<std::string>& hosts,
                                            const common::CancellationToken& token, bool count_progress) {
  EnterPhase(ScanPhase::ArpPriming);
  if (c_.primer) c_.primer->Prime(hosts, token);
  if (!token.SleepFor(opt_.arp_settle_ms)) return;
  EnterPhase(ScanPhase::ArpRefresh);
  RefreshNeighbors(hosts, count_progress);
}

std::size_t DiscoveryOrchestrator::RefreshNeighbors(const std::vector<std::string>& hosts,
                                                    bool count_progress) {
  if (c_.reconciler && !c_.reconciler->Drain(opt_.drain_timeout_ms)) {
    log_.Warn("reconciler did not drain before neighbor refresh");
  }

  std::set<std::string> found;
  if (c_.neighbors && c_.bus) {
    const std::set<std::string> wanted(hosts.begin(), hosts.end());
    const std::int64_t now = c_.clock->NowMs();
    for (const auto& e : c_.neighbors->Read()) {
      if (wanted.count(e.ip) == 0) continue;
      std::optional<device::model::Device> holder;
      device::model::Device d;
      if (c_.reconciler && c_.reconciler->FindByAddress(e.ip, d)) holder = std::move(d);
      const std::optional<std::string> existing = providers::NeighborTargetId(e, holder);
      c_.bus->Emit(device::mutation::Observation(providers::MakeNeighborObservation(e, now, existing),
                                                 device::mutation::MutationSource::Arp));
      found.insert(e.ip);
    }
  }
  if (count_progress) {
    for (const auto& h : hosts) c_.progress->RecordCompleted(found.count(h) != 0);
  }
  log_.Info("neighbor refresh matched " + std::to_string(found.size()) + " of " +
            std::to_string(hosts.size()) + " hosts");
  return found.size();
}

}  // namespace discovery
}  // namespace core
}  // namespace lanscan
