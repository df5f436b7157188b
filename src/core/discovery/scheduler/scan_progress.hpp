#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace lanscan {
namespace core {
namespace discovery {
namespace scheduler {

enum class ScanPhase { Idle, Enumerating, MdnsWarmup, Pinging, ArpPriming, ArpRefresh, Finished };

const char* ToString(ScanPhase p);

struct ProgressSnapshot {
  std::size_t total_hosts = 0;
  std::size_t completed_hosts = 0;
  std::size_t success_hosts = 0;
  bool started = false;
  bool finished = false;
  ScanPhase phase = ScanPhase::Idle;

  std::string ToJson() const;
};

// Observable progress of the current sweep. Listeners run on the updating thread
// and must not call back into this object.
class ScanProgress {
public:
  using Listener = std::function<void(const ProgressSnapshot&)>;

  void SetListener(Listener l);

  void Reset();
  void Begin(std::size_t total_hosts);
  void SetTotal(std::size_t total_hosts);
  void SetPhase(ScanPhase phase);
  void RecordCompleted(bool success);
  void Finish();

  ProgressSnapshot Snapshot() const;

private:
  void Notify(const ProgressSnapshot& s);

private:
  mutable std::mutex mu_;
  ProgressSnapshot state_;
  Listener listener_;
};

}  // namespace scheduler
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
