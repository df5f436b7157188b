#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace lanscan::core::common {

// Shared stop flag handed to long-running tasks. Copies observe the same state.
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void Cancel() {
    {
      std::lock_guard<std::mutex> lk(state_->mu);
      state_->cancelled.store(true);
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const { return state_->cancelled.load(); }

  // Sleeps for up to `ms`; returns false if cancelled before the time elapsed.
  bool SleepFor(std::int64_t ms) const {
    if (ms <= 0) return !IsCancelled();
    std::unique_lock<std::mutex> lk(state_->mu);
    return !state_->cv.wait_for(lk, std::chrono::milliseconds(ms),
                                [this] { return state_->cancelled.load(); });
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::condition_variable cv;
  };

  std::shared_ptr<State> state_;
};

}  // namespace lanscan::core::common
