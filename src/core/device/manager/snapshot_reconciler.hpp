#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/cancellation.hpp"
#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/classifier.hpp"
#include "core/device/manager/device_manager.hpp"
#include "core/device/manager/name_resolver.hpp"
#include "core/device/mutation/mutation_bus.hpp"
#include "core/device/persistence/persistence.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace manager {

struct ReconcilerOptions {
  std::string persistence_key = "lanscan:devices:v1";
  std::int64_t offline_check_ms = 60 * 1000;
  std::int64_t online_grace_ms = 300 * 1000;
  bool mark_offline_on_restore = true;
};

// Sole owner of the canonical device collection. Observations arrive on the input
// bus (or through the direct Upsert calls), are folded one at a time under a single
// mutex, persisted, and re-published on the output bus.
class SnapshotReconciler {
public:
  SnapshotReconciler(std::shared_ptr<mutation::MutationBus> input,
                     std::shared_ptr<mutation::MutationBus> output,
                     std::shared_ptr<persistence::DevicePersistence> persistence,
                     std::shared_ptr<const Classifier> classifier,
                     std::shared_ptr<const common::time::Clock> clock,
                     ReconcilerOptions options = {},
                     std::shared_ptr<common::log::Logger> logger = nullptr);
  ~SnapshotReconciler();

  SnapshotReconciler(const SnapshotReconciler&) = delete;
  SnapshotReconciler& operator=(const SnapshotReconciler&) = delete;

  // Null restores the default, which derives no names.
  void SetNameResolver(std::shared_ptr<const NameResolver> resolver);

  // Loads the persisted list; call before Start.
  std::size_t Restore();

  // Subscribes to the input bus and starts the fold worker and the offline sweep.
  bool Start();
  void Stop();
  bool Running() const { return running_.load(); }

  void Upsert(const model::Device& device,
              mutation::MutationSource source = mutation::MutationSource::Manual);
  void UpsertMany(const std::vector<model::Device>& devices, mutation::MutationSource source);

  // Folds one mutation synchronously.
  void Apply(const mutation::Mutation& m);

  void RefreshClassifications();
  void RemoveAll();
  void ClearAllData();
  bool SaveSnapshotNow();

  // Forces devices not seen within the grace window offline. Returns how many flipped.
  std::size_t SweepOffline();

  // Broadcast and network addresses of these subnets are never recorded.
  void SetActiveNetworks(std::vector<common::net::Ipv4Network> networks);
  bool IsExcludedAddress(const std::string& ip) const;

  std::vector<model::Device> Devices() const;
  bool Get(const std::string& id, model::Device& out) const;
  bool FindByAddress(const std::string& ip, model::Device& out) const;
  std::string ToJsonList() const;
  bool ToJsonOne(const std::string& id, std::string& out_json) const;

  // Output feed. With include_snapshot the first item is a Snapshot of the current list.
  std::shared_ptr<mutation::Subscription> Subscribe(bool include_snapshot);

  // Waits until every mutation delivered so far on the input bus has been folded.
  bool Drain(std::int64_t timeout_ms);

  bool PersistenceDegraded() const { return degraded_.load(); }
  std::int64_t GraceMs() const { return options_.online_grace_ms; }
  std::int64_t NowMs() const { return clock_->NowMs(); }

private:
  void WorkerLoop();
  void SweepLoop(common::CancellationToken token);

  void FoldChangeLocked(const mutation::ChangeMutation& c);
  void FoldProbeLocked(const mutation::ChangeMutation& c);
  void MergeLocked(model::Device incoming, mutation::MutationSource source);
  // Re-derives auto_name; true when it changed.
  bool ResolveNameLocked(model::Device& d);
  void ReplaceAllLocked(const std::vector<model::Device>& devices);

  // Strips unusable addresses. False when the observation had nothing else to go on.
  bool SanitizeLocked(model::Device& d) const;
  bool IsExcludedLocked(const std::string& ip) const;

  void PersistLocked();
  void EmitChangeLocked(std::optional<model::Device> before, model::Device after,
                        mutation::FieldSet changed, mutation::MutationSource source);

private:
  std::shared_ptr<mutation::MutationBus> input_;
  std::shared_ptr<mutation::MutationBus> output_;
  std::shared_ptr<persistence::DevicePersistence> persistence_;
  std::shared_ptr<const Classifier> classifier_;
  std::shared_ptr<const NameResolver> resolver_;
  std::shared_ptr<const common::time::Clock> clock_;
  ReconcilerOptions options_;
  common::log::TaggedLogger log_;

  mutable std::mutex mu_;
  DeviceRegistry registry_;
  std::vector<common::net::Ipv4Network> networks_;
  std::atomic<bool> degraded_{false};

  std::shared_ptr<mutation::Subscription> sub_;
  std::atomic<bool> running_{false};
  common::CancellationToken stop_;
  std::thread worker_;
  std::thread sweeper_;

  std::mutex drain_mu_;
  std::condition_variable drain_cv_;
  std::uint64_t folded_ = 0;
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace lanscan
