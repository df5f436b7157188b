#include "core/device/manager/device_manager.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "core/common/utils/network_utils.hpp"
#include "core/device/model/device_codec.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace manager {

namespace {

int StatusRank(model::PortStatus s) {
  switch (s) {
    case model::PortStatus::Open: return 2;
    case model::PortStatus::Filtered: return 1;
    case model::PortStatus::Closed: return 0;
  }
  return 0;
}

bool NonEmpty(const std::optional<std::string>& s) { return s.has_value() && !s->empty(); }

void OverwriteIfPresent(std::optional<std::string>& dst, const std::optional<std::string>& src) {
  if (NonEmpty(src)) dst = src;
}

bool DisplayLess(const model::Device& a, const model::Device& b) {
  const auto ia = model::BestDisplayIp(a);
  const auto ib = model::BestDisplayIp(b);
  if (ia && ib) {
    if (*ia != *ib) return common::net::IpLess(*ia, *ib);
  } else if (ia || ib) {
    return ia.has_value();
  }
  return a.id < b.id;
}

}  // namespace

bool DeviceRegistry::Has(const std::string& id) const { return by_id_.find(id) != by_id_.end(); }

bool DeviceRegistry::Get(const std::string& id, model::Device& out) const {
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) return false;
  out = it->second;
  return true;
}

std::vector<model::Device> DeviceRegistry::List() const {
  std::vector<model::Device> out;
  out.reserve(by_id_.size());
  for (const auto& kv : by_id_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), DisplayLess);
  return out;
}

bool DeviceRegistry::FindByAddress(const std::string& ip, model::Device& out) const {
  if (ip.empty()) return false;
  const model::Device* any = nullptr;
  for (const auto& kv : by_id_) {
    const auto& d = kv.second;
    if (d.primary_ip && *d.primary_ip == ip) {
      out = d;
      return true;
    }
    if (any == nullptr && d.ips.count(ip) != 0) any = &d;
  }
  if (any == nullptr) return false;
  out = *any;
  return true;
}

std::vector<model::NetworkService> DeviceRegistry::MergeServices(
    const std::vector<model::NetworkService>& a, const std::vector<model::NetworkService>& b) {
  using Key = std::pair<model::ServiceType, std::optional<int>>;
  std::map<Key, model::NetworkService> merged;
  auto take = [&merged](const model::NetworkService& s) {
    const Key key{s.type, s.port};
    auto it = merged.find(key);
    if (it == merged.end()) {
      merged.emplace(key, s);
    } else if (s.name.size() > it->second.name.size()) {
      it->second = s;
    }
  };
  for (const auto& s : a) take(s);
  for (const auto& s : b) take(s);

  std::vector<model::NetworkService> out;
  out.reserve(merged.size());
  for (auto& kv : merged) out.push_back(std::move(kv.second));
  return out;
}

std::vector<model::Port> DeviceRegistry::MergePorts(const std::vector<model::Port>& a,
                                                    const std::vector<model::Port>& b) {
  std::map<int, model::Port> merged;
  auto take = [&merged](const model::Port& p) {
    auto it = merged.find(p.number);
    if (it == merged.end()) {
      merged.emplace(p.number, p);
      return;
    }
    model::Port& cur = it->second;
    if (StatusRank(p.status) < StatusRank(cur.status)) return;
    model::Port next = p;
    if (next.service_name.empty()) next.service_name = cur.service_name;
    if (next.description.empty()) next.description = cur.description;
    if (!next.last_seen_open_ms) next.last_seen_open_ms = cur.last_seen_open_ms;
    cur = std::move(next);
  };
  for (const auto& p : a) take(p);
  for (const auto& p : b) take(p);

  std::vector<model::Port> out;
  out.reserve(merged.size());
  for (auto& kv : merged) out.push_back(std::move(kv.second));
  return out;
}

void DeviceRegistry::MergeInto(model::Device& existing, const model::Device& incoming,
                               std::int64_t now_ms) {
  existing.ips.insert(incoming.ips.begin(), incoming.ips.end());
  if (NonEmpty(incoming.primary_ip)) {
    if (!NonEmpty(existing.primary_ip)) existing.primary_ip = incoming.primary_ip;
    existing.ips.insert(*incoming.primary_ip);
  }

  OverwriteIfPresent(existing.hostname, incoming.hostname);
  // A record keyed by one MAC never takes another device's MAC.
  if (!NonEmpty(existing.mac_address)) OverwriteIfPresent(existing.mac_address, incoming.mac_address);
  OverwriteIfPresent(existing.vendor, incoming.vendor);
  OverwriteIfPresent(existing.model_hint, incoming.model_hint);
  if (incoming.rtt_millis) existing.rtt_millis = incoming.rtt_millis;

  existing.services = MergeServices(existing.services, incoming.services);
  existing.open_ports = MergePorts(existing.open_ports, incoming.open_ports);
  existing.discovery_sources.insert(incoming.discovery_sources.begin(),
                                    incoming.discovery_sources.end());
  for (const auto& kv : incoming.fingerprints) {
    if (!kv.second.empty()) existing.fingerprints[kv.first] = kv.second;
  }
  if (!incoming.fingerprints.empty()) {
    const model::VendorModel derived = model::ExtractVendorModel(existing.fingerprints);
    if (!NonEmpty(existing.vendor) && NonEmpty(derived.vendor)) existing.vendor = derived.vendor;
    if (!NonEmpty(existing.model_hint) && NonEmpty(derived.model)) existing.model_hint = derived.model;
  }

  existing.is_online_override = incoming.is_online_override;

  if (!existing.first_seen_ms) existing.first_seen_ms = incoming.first_seen_ms.value_or(now_ms);
  const std::int64_t seen = incoming.last_seen_ms.value_or(now_ms);
  if (!existing.last_seen_ms || seen > *existing.last_seen_ms) existing.last_seen_ms = seen;
}

DeviceRegistry::MergeResult DeviceRegistry::Merge(const model::Device& incoming, std::int64_t now_ms) {
  MergeResult r;
  auto it = by_id_.find(incoming.id);
  if (it == by_id_.end()) {
    model::Device d;
    d.id = incoming.id;
    MergeInto(d, incoming, now_ms);
    d.first_seen_ms = now_ms;
    if (!d.primary_ip) d.primary_ip = common::net::BestDisplayIp(d.ips);
    r.after = d;
    r.changed = mutation::AllFields();
    r.created = true;
    by_id_.emplace(d.id, std::move(d));
    return r;
  }

  r.before = it->second;
  MergeInto(it->second, incoming, now_ms);
  r.after = it->second;
  r.changed = mutation::Differences(*r.before, r.after);
  return r;
}

std::optional<model::Device> DeviceRegistry::Put(model::Device device) {
  std::optional<model::Device> previous;
  auto it = by_id_.find(device.id);
  if (it != by_id_.end()) {
    previous = std::move(it->second);
    it->second = std::move(device);
  } else {
    const std::string id = device.id;
    by_id_.emplace(id, std::move(device));
  }
  return previous;
}

void DeviceRegistry::Clear() { by_id_.clear(); }

std::string DeviceRegistry::ToJsonList(std::int64_t now_ms, std::int64_t grace_ms) const {
  return model::DeviceViewsToJson(List(), now_ms, grace_ms);
}

bool DeviceRegistry::ToJsonOne(const std::string& id, std::int64_t now_ms, std::int64_t grace_ms,
                               std::string& out_json) const {
  model::Device d;
  if (!Get(id, d)) return false;
  out_json = model::DeviceViewToJson(d, now_ms, grace_ms);
  return true;
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace lanscan
