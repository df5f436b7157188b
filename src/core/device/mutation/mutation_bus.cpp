#include "core/device/mutation/mutation_bus.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace lanscan {
namespace core {
namespace device {
namespace mutation {

bool Subscription::Next(Mutation& out, std::int64_t timeout_ms) {
  std::unique_lock<std::mutex> lk(mu_);
  const bool ready = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                                  [this] { return !queue_.empty() || closed_; });
  if (!ready || queue_.empty()) return false;
  out = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

bool Subscription::TryNext(Mutation& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (queue_.empty()) return false;
  out = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

void Subscription::Deliver(Mutation m) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    queue_.push_back(std::move(m));
    ++delivered_;
  }
  cv_.notify_one();
}

void Subscription::Close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t Subscription::Pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

std::uint64_t Subscription::Delivered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return delivered_;
}

MutationBus::MutationBus(std::size_t buffer_size, std::shared_ptr<common::log::Logger> logger)
    : capacity_(buffer_size), log_(std::move(logger), "bus") {}

void MutationBus::Emit(Mutation m) {
  std::lock_guard<std::mutex> lk(mu_);
  PruneClosedLocked();
  for (const auto& sub : subscribers_) sub->Deliver(m);
  if (capacity_ == 0) return;
  buffer_.push_back(std::move(m));
  while (buffer_.size() > capacity_) buffer_.pop_front();
}

std::shared_ptr<Subscription> MutationBus::Subscribe(bool include_buffered) {
  auto sub = std::make_shared<Subscription>();
  std::lock_guard<std::mutex> lk(mu_);
  if (include_buffered) {
    for (const auto& m : buffer_) sub->Deliver(m);
  }
  subscribers_.push_back(sub);
  log_.Debug("subscriber added, replayed=" + std::to_string(include_buffered ? buffer_.size() : 0));
  return sub;
}

void MutationBus::ClearBuffer() {
  std::lock_guard<std::mutex> lk(mu_);
  buffer_.clear();
}

std::size_t MutationBus::BufferedCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return buffer_.size();
}

std::size_t MutationBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& sub : subscribers_) {
    if (!sub->Closed()) ++n;
  }
  return n;
}

void MutationBus::CloseAll() {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& sub : subscribers_) sub->Close();
  subscribers_.clear();
}

void MutationBus::PruneClosedLocked() {
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [](const std::shared_ptr<Subscription>& s) { return s->Closed(); }),
                     subscribers_.end());
}

}  // namespace mutation
}  // namespace device
}  // namespace core
}  // namespace lanscan
