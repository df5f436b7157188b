#include "core/discovery/scheduler/scan_progress.hpp"

#include <utility>

#include "core/common/utils/json_utils.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace scheduler {

namespace json = common::json;

const char* ToString(ScanPhase p) {
  switch (p) {
    case ScanPhase::Idle: return "idle";
    case ScanPhase::Enumerating: return "enumerating";
    case ScanPhase::MdnsWarmup: return "mdnsWarmup";
    case ScanPhase::Pinging: return "pinging";
    case ScanPhase::ArpPriming: return "arpPriming";
    case ScanPhase::ArpRefresh: return "arpRefresh";
    case ScanPhase::Finished: return "finished";
  }
  return "idle";
}

std::string ProgressSnapshot::ToJson() const {
  return json::Object({
      {"phase", json::Quote(ToString(phase))},
      {"totalHosts", json::Number(total_hosts)},
      {"completedHosts", json::Number(completed_hosts)},
      {"successHosts", json::Number(success_hosts)},
      {"started", json::Bool(started)},
      {"finished", json::Bool(finished)},
  });
}

void ScanProgress::SetListener(Listener l) {
  std::lock_guard<std::mutex> lk(mu_);
  listener_ = std::move(l);
}

void ScanProgress::Reset() {
  ProgressSnapshot s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    state_ = ProgressSnapshot{};
    s = state_;
  }
  Notify(s);
}

void ScanProgress::Begin(std::size_t total_hosts) {
  ProgressSnapshot s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const ScanPhase phase = state_.phase;
    state_ = ProgressSnapshot{};
    state_.total_hosts = total_hosts;
    state_.started = true;
    state_.phase = phase;
    s = state_;
  }
  Notify(s);
}

void ScanProgress::SetTotal(std::size_t total_hosts) {
  ProgressSnapshot s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    state_.total_hosts = total_hosts;
    s = state_;
  }
  Notify(s);
}

void ScanProgress::SetPhase(ScanPhase phase) {
  ProgressSnapshot s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_.phase == phase) return;
    state_.phase = phase;
    s = state_;
  }
  Notify(s);
}

void ScanProgress::RecordCompleted(bool success) {
  ProgressSnapshot s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++state_.completed_hosts;
    if (success) ++state_.success_hosts;
    s = state_;
  }
  Notify(s);
}

void ScanProgress::Finish() {
  ProgressSnapshot s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    state_.finished = true;
    state_.phase = ScanPhase::Finished;
    s = state_;
  }
  Notify(s);
}

ProgressSnapshot ScanProgress::Snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

void ScanProgress::Notify(const ProgressSnapshot& s) {
  Listener l;
  {
    std::lock_guard<std::mutex> lk(mu_);
    l = listener_;
  }
  if (l) l(s);
}

}  // namespace scheduler
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
