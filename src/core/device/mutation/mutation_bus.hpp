#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/device/mutation/mutation.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace mutation {

// One subscriber's ordered, unbounded queue. Producers never block on it.
class Subscription {
public:
  Subscription() = default;
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Waits up to timeout_ms for the next mutation. Returns false on timeout or
  // once the subscription is closed and empty.
  bool Next(Mutation& out, std::int64_t timeout_ms);
  bool TryNext(Mutation& out);

  void Deliver(Mutation m);
  void Close();
  bool Closed() const;

  std::size_t Pending() const;
  std::uint64_t Delivered() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Mutation> queue_;
  std::uint64_t delivered_ = 0;
  bool closed_ = false;
};

class MutationBus {
public:
  static constexpr std::size_t kDefaultBufferSize = 256;

  explicit MutationBus(std::size_t buffer_size = kDefaultBufferSize,
                       std::shared_ptr<common::log::Logger> logger = nullptr);

  void Emit(Mutation m);

  // With include_buffered the subscriber first receives the replay buffer,
  // oldest first, then every mutation emitted afterwards.
  std::shared_ptr<Subscription> Subscribe(bool include_buffered = false);

  void ClearBuffer();
  std::size_t BufferedCount() const;
  std::size_t BufferCapacity() const { return capacity_; }
  std::size_t SubscriberCount() const;

  // Closes every live subscription; used on shutdown to release blocked readers.
  void CloseAll();

private:
  void PruneClosedLocked();

private:
  const std::size_t capacity_;
  common::log::TaggedLogger log_;

  mutable std::mutex mu_;
  std::deque<Mutation> buffer_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
};

}  // namespace mutation
}  // namespace device
}  // namespace core
}  // namespace lanscan
