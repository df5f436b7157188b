#include "core/device/manager/snapshot_reconciler.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <variant>

namespace lanscan {
namespace core {
namespace device {
namespace manager {

namespace net = common::net;
using mutation::ChangeMutation;
using mutation::DeviceField;
using mutation::MutationSource;
using mutation::SnapshotMutation;

namespace {

bool NonEmpty(const std::optional<std::string>& s) { return s.has_value() && !s->empty(); }

}  // namespace

SnapshotReconciler::SnapshotReconciler(std::shared_ptr<mutation::MutationBus> input,
                                       std::shared_ptr<mutation::MutationBus> output,
                                       std::shared_ptr<persistence::DevicePersistence> persistence,
                                       std::shared_ptr<const Classifier> classifier,
                                       std::shared_ptr<const common::time::Clock> clock,
                                       ReconcilerOptions options,
                                       std::shared_ptr<common::log::Logger> logger)
    : input_(std::move(input)),
      output_(std::move(output)),
      persistence_(std::move(persistence)),
      classifier_(std::move(classifier)),
      clock_(std::move(clock)),
      options_(std::move(options)),
      log_(std::move(logger), "snapshot") {
  if (!classifier_) classifier_ = std::make_shared<UnknownClassifier>();
  resolver_ = std::make_shared<NullNameResolver>();
  if (!clock_) clock_ = std::make_shared<common::time::SystemClock>();
}

SnapshotReconciler::~SnapshotReconciler() { Stop(); }

void SnapshotReconciler::SetNameResolver(std::shared_ptr<const NameResolver> resolver) {
  std::lock_guard<std::mutex> lk(mu_);
  resolver_ = resolver ? std::move(resolver) : std::make_shared<NullNameResolver>();
}

std::size_t SnapshotReconciler::Restore() {
  if (!persistence_) return 0;
  std::vector<model::Device> loaded = persistence_->Load(options_.persistence_key);

  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (auto& d : loaded) {
    model::AssignIdentity(d);
    if (options_.mark_offline_on_restore) d.is_online_override = false;
    registry_.Put(std::move(d));
    ++n;
  }
  log_.Info("restored " + std::to_string(n) + " devices");
  return n;
}

bool SnapshotReconciler::Start() {
  if (running_.load()) return false;
  sub_ = input_->Subscribe(false);
  {
    std::lock_guard<std::mutex> lk(drain_mu_);
    folded_ = 0;
  }
  stop_ = common::CancellationToken();
  running_.store(true);
  worker_ = std::thread(&SnapshotReconciler::WorkerLoop, this);
  if (options_.offline_check_ms > 0) {
    sweeper_ = std::thread(&SnapshotReconciler::SweepLoop, this, stop_);
  }
  log_.Info("started, offline check every " + std::to_string(options_.offline_check_ms) + " ms");
  return true;
}

void SnapshotReconciler::Stop() {
  if (!running_.exchange(false)) return;
  stop_.Cancel();
  if (sub_) sub_->Close();
  if (worker_.joinable()) worker_.join();
  if (sweeper_.joinable()) sweeper_.join();
  log_.Info("stopped");
}

void SnapshotReconciler::WorkerLoop() {
  while (running_.load()) {
    mutation::Mutation m;
    if (!sub_->Next(m, 200)) {
      if (sub_->Closed()) break;
      continue;
    }
    try {
      Apply(m);
    } catch (const std::exception& ex) {
      log_.Error(std::string("fold failed: ") + ex.what());
    }
    {
      std::lock_guard<std::mutex> lk(drain_mu_);
      ++folded_;
    }
    drain_cv_.notify_all();
  }
}

void SnapshotReconciler::SweepLoop(common::CancellationToken token) {
  while (token.SleepFor(options_.offline_check_ms)) {
    try {
      SweepOffline();
    } catch (const std::exception& ex) {
      log_.Error(std::string("offline sweep failed: ") + ex.what());
    }
  }
}

bool SnapshotReconciler::Drain(std::int64_t timeout_ms) {
  if (!sub_) return true;
  const std::uint64_t target = sub_->Delivered();
  std::unique_lock<std::mutex> lk(drain_mu_);
  return drain_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                            [&] { return folded_ >= target; });
}

void SnapshotReconciler::Upsert(const model::Device& device, MutationSource source) {
  ChangeMutation c;
  c.after = device;
  c.changed = mutation::AllFields();
  c.source = source;
  std::lock_guard<std::mutex> lk(mu_);
  FoldChangeLocked(c);
}

void SnapshotReconciler::UpsertMany(const std::vector<model::Device>& devices, MutationSource source) {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& d : devices) {
    ChangeMutation c;
    c.after = d;
    c.changed = mutation::AllFields();
    c.source = source;
    FoldChangeLocked(c);
  }
}

void SnapshotReconciler::Apply(const mutation::Mutation& m) {
  std::lock_guard<std::mutex> lk(mu_);
  if (const auto* snap = std::get_if<SnapshotMutation>(&m)) {
    ReplaceAllLocked(snap->devices);
  } else {
    FoldChangeLocked(std::get<ChangeMutation>(m));
  }
}

void SnapshotReconciler::FoldChangeLocked(const ChangeMutation& c) {
  if (c.source == MutationSource::Ping) {
    FoldProbeLocked(c);
    return;
  }
  MergeLocked(c.after, c.source);
}

void SnapshotReconciler::FoldProbeLocked(const ChangeMutation& c) {
  const model::Device& d = c.after;
  std::string ip;
  if (NonEmpty(d.primary_ip)) {
    ip = *d.primary_ip;
  } else if (!d.ips.empty()) {
    ip = *d.ips.begin();
  }
  if (ip.empty()) return;

  if (!d.rtt_millis) {
    log_.Trace("probe failure for " + ip + " ignored");
    return;
  }
  if (IsExcludedLocked(ip)) {
    log_.Debug("probe reply from " + ip + " discarded, not a host address");
    return;
  }

  model::Device incoming = d;
  model::Device existing;
  if (registry_.FindByAddress(ip, existing)) incoming.id = existing.id;
  MergeLocked(std::move(incoming), MutationSource::Ping);
}

void SnapshotReconciler::MergeLocked(model::Device incoming, MutationSource source) {
  if (!SanitizeLocked(incoming)) {
    log_.Debug(std::string("observation from ") + mutation::ToString(source) +
               " dropped, no usable identity");
    return;
  }
  if (const auto tag = mutation::DiscoveryTagFor(source)) incoming.discovery_sources.insert(*tag);

  // An explicit id never carries a different MAC onto a MAC-identified record.
  if (!incoming.id.empty() && NonEmpty(incoming.mac_address)) {
    model::Device holder;
    if (registry_.Get(incoming.id, holder) && NonEmpty(holder.mac_address) &&
        model::NormalizeMac(*holder.mac_address) != model::NormalizeMac(*incoming.mac_address)) {
      log_.Debug("mac " + model::NormalizeMac(*incoming.mac_address) + " does not belong to " +
                 incoming.id + ", keyed by mac instead");
      incoming.id.clear();
    }
  }
  model::AssignIdentity(incoming);

  auto r = registry_.Merge(incoming, clock_->NowMs());
  bool touched = false;
  if (r.created || mutation::Intersects(r.changed, mutation::ClassificationRelevantFields())) {
    model::Classification cls = classifier_->Classify(r.after);
    if (!r.after.classification || *r.after.classification != cls) {
      r.after.classification = std::move(cls);
      r.changed.insert(DeviceField::Classification);
      touched = true;
    }
  }
  if (ResolveNameLocked(r.after)) {
    r.changed.insert(DeviceField::AutoName);
    touched = true;
  }
  if (touched) registry_.Put(r.after);
  if (!r.created && r.changed.empty()) return;

  if (r.created) log_.Debug("new device " + r.after.id);
  PersistLocked();
  EmitChangeLocked(std::move(r.before), std::move(r.after), std::move(r.changed), source);
}

bool SnapshotReconciler::ResolveNameLocked(model::Device& d) {
  std::optional<std::string> name = resolver_->Resolve(d);
  if (!NonEmpty(name) || name == d.auto_name) return false;
  log_.Debug("auto name " + *name + " for " + d.id);
  d.auto_name = std::move(name);
  return true;
}

void SnapshotReconciler::ReplaceAllLocked(const std::vector<model::Device>& devices) {
  registry_.Clear();
  const std::int64_t now = clock_->NowMs();
  for (auto d : devices) {
    if (!SanitizeLocked(d)) continue;
    model::AssignIdentity(d);
    if (registry_.Has(d.id)) {
      registry_.Merge(d, now);
      continue;
    }
    if (!d.first_seen_ms) d.first_seen_ms = now;
    registry_.Put(std::move(d));
  }
  PersistLocked();
  output_->Emit(SnapshotMutation{registry_.List()});
  log_.Info("replaced canonical list, " + std::to_string(registry_.Size()) + " devices");
}

bool SnapshotReconciler::IsExcludedAddress(const std::string& ip) const {
  std::lock_guard<std::mutex> lk(mu_);
  return IsExcludedLocked(ip);
}

bool SnapshotReconciler::IsExcludedLocked(const std::string& ip) const {
  if (ip.empty() || net::IsLoopback(ip)) return true;
  const auto v = net::ParseIpv4(ip);
  if (!v) return false;
  if (*v == 0 || *v == 0xffffffffu) return true;
  if ((*v & 0xffu) == 0xffu) return true;
  for (const auto& n : networks_) {
    if (n.netmask >= 0xfffffffeu) continue;
    if (!n.Contains(*v)) continue;
    if (*v == n.Broadcast() || *v == n.network_address) return true;
  }
  return false;
}

bool SnapshotReconciler::SanitizeLocked(model::Device& d) const {
  if (!d.id.empty() && net::IsIpv4(d.id) && IsExcludedLocked(d.id)) return false;

  if (d.mac_address && model::NormalizeMac(*d.mac_address).empty()) d.mac_address.reset();
  if (d.hostname && d.hostname->empty()) d.hostname.reset();

  const bool address_only = d.id.empty() && !d.mac_address && !d.hostname;
  const bool had_address = NonEmpty(d.primary_ip) || !d.ips.empty();

  if (d.primary_ip && IsExcludedLocked(*d.primary_ip)) d.primary_ip.reset();
  for (auto it = d.ips.begin(); it != d.ips.end();) {
    if (IsExcludedLocked(*it)) {
      it = d.ips.erase(it);
    } else {
      ++it;
    }
  }
  if (!d.primary_ip && !d.ips.empty()) d.primary_ip = net::BestDisplayIp(d.ips);

  if (address_only && had_address && !d.primary_ip) return false;
  return true;
}

void SnapshotReconciler::PersistLocked() {
  if (!persistence_) return;
  const bool ok = persistence_->Save(registry_.List(), options_.persistence_key);
  if (!ok) {
    degraded_.store(true);
    log_.Warn("persistence degraded, save failed for " + options_.persistence_key);
    return;
  }
  if (degraded_.exchange(false)) log_.Info("persistence recovered");
}

void SnapshotReconciler::EmitChangeLocked(std::optional<model::Device> before, model::Device after,
                                          mutation::FieldSet changed, MutationSource source) {
  ChangeMutation c;
  c.before = std::move(before);
  c.after = std::move(after);
  c.changed = std::move(changed);
  c.source = source;
  output_->Emit(std::move(c));
}

void SnapshotReconciler::RefreshClassifications() {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (auto d : registry_.List()) {
    model::Device before = d;
    mutation::FieldSet changed;
    model::Classification cls = classifier_->Classify(d);
    if (!d.classification || *d.classification != cls) {
      d.classification = std::move(cls);
      changed.insert(DeviceField::Classification);
    }
    if (ResolveNameLocked(d)) changed.insert(DeviceField::AutoName);
    if (changed.empty()) continue;
    registry_.Put(d);
    EmitChangeLocked(std::move(before), std::move(d), std::move(changed), MutationSource::Classification);
    ++n;
  }
  if (n > 0) PersistLocked();
  log_.Info("reclassified " + std::to_string(n) + " devices");
}

std::size_t SnapshotReconciler::SweepOffline() {
  std::lock_guard<std::mutex> lk(mu_);
  const std::int64_t now = clock_->NowMs();
  std::size_t n = 0;
  for (auto d : registry_.List()) {
    if (d.is_online_override) continue;
    if (d.last_seen_ms && now - *d.last_seen_ms < options_.online_grace_ms) continue;
    model::Device before = d;
    d.is_online_override = false;
    registry_.Put(d);
    EmitChangeLocked(std::move(before), std::move(d), {DeviceField::IsOnlineOverride},
                     MutationSource::Offline);
    ++n;
  }
  if (n > 0) {
    PersistLocked();
    log_.Info("marked " + std::to_string(n) + " devices offline");
  }
  return n;
}

void SnapshotReconciler::RemoveAll() {
  std::lock_guard<std::mutex> lk(mu_);
  registry_.Clear();
  PersistLocked();
  output_->Emit(SnapshotMutation{});
  log_.Info("removed all devices");
}

void SnapshotReconciler::ClearAllData() {
  std::lock_guard<std::mutex> lk(mu_);
  registry_.Clear();
  input_->ClearBuffer();
  output_->ClearBuffer();
  PersistLocked();
  output_->Emit(SnapshotMutation{});
  log_.Info("cleared all data");
}

bool SnapshotReconciler::SaveSnapshotNow() {
  std::lock_guard<std::mutex> lk(mu_);
  PersistLocked();
  return !degraded_.load();
}

void SnapshotReconciler::SetActiveNetworks(std::vector<net::Ipv4Network> networks) {
  std::lock_guard<std::mutex> lk(mu_);
  networks_ = std::move(networks);
}

std::vector<model::Device> SnapshotReconciler::Devices() const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.List();
}

bool SnapshotReconciler::Get(const std::string& id, model::Device& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.Get(id, out);
}

bool SnapshotReconciler::FindByAddress(const std::string& ip, model::Device& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.FindByAddress(ip, out);
}

std::string SnapshotReconciler::ToJsonList() const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.ToJsonList(clock_->NowMs(), options_.online_grace_ms);
}

bool SnapshotReconciler::ToJsonOne(const std::string& id, std::string& out_json) const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.ToJsonOne(id, clock_->NowMs(), options_.online_grace_ms, out_json);
}

std::shared_ptr<mutation::Subscription> SnapshotReconciler::Subscribe(bool include_snapshot) {
  std::lock_guard<std::mutex> lk(mu_);
  auto sub = output_->Subscribe(false);
  if (include_snapshot) sub->Deliver(SnapshotMutation{registry_.List()});
  return sub;
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace lanscan
