#include "core/device/model/device_codec.hpp"

#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include "core/common/utils/json_utils.hpp"
#include "core/device/model/device_status.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace model {

namespace json = common::json;

namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;

void PutString(Fields& f, const char* key, const std::optional<std::string>& v) {
  if (v) f.emplace_back(key, json::Quote(*v));
}

void PutMs(Fields& f, const char* key, const std::optional<std::int64_t>& v) {
  if (v) f.emplace_back(key, json::Number(*v));
}

std::string StringArray(const std::vector<std::string>& items) {
  std::vector<std::string> encoded;
  encoded.reserve(items.size());
  for (const auto& s : items) encoded.push_back(json::Quote(s));
  return json::Array(encoded);
}

std::string ServiceToJson(const NetworkService& s) {
  Fields f;
  f.emplace_back("type", json::Quote(ToString(s.type)));
  f.emplace_back("name", json::Quote(s.name));
  PutString(f, "rawType", s.raw_type);
  if (s.port) f.emplace_back("port", json::Number(*s.port));
  f.emplace_back("isStandardPort", json::Bool(s.is_standard_port));
  return json::Object(f);
}

std::string PortToJson(const Port& p) {
  Fields f;
  f.emplace_back("number", json::Number(p.number));
  f.emplace_back("transport", json::Quote(p.transport));
  f.emplace_back("serviceName", json::Quote(p.service_name));
  f.emplace_back("description", json::Quote(p.description));
  f.emplace_back("status", json::Quote(ToString(p.status)));
  PutMs(f, "lastSeenOpen", p.last_seen_open_ms);
  return json::Object(f);
}

std::string ClassificationToJson(const Classification& c) {
  Fields f;
  if (c.form_factor) f.emplace_back("formFactor", json::Quote(ToString(*c.form_factor)));
  PutString(f, "rawType", c.raw_type);
  f.emplace_back("confidence", json::Quote(ToString(c.confidence)));
  f.emplace_back("reason", json::Quote(c.reason));
  f.emplace_back("sources", StringArray(c.sources));
  return json::Object(f);
}

Fields DeviceFields(const Device& d) {
  Fields f;
  f.emplace_back("id", json::Quote(d.id));
  PutString(f, "primaryIP", d.primary_ip);
  f.emplace_back("ips", StringArray(std::vector<std::string>(d.ips.begin(), d.ips.end())));
  PutString(f, "hostname", d.hostname);
  PutString(f, "vendor", d.vendor);
  PutString(f, "macAddress", d.mac_address);
  PutString(f, "modelHint", d.model_hint);

  std::vector<std::string> services;
  services.reserve(d.services.size());
  for (const auto& s : d.services) services.push_back(ServiceToJson(s));
  f.emplace_back("services", json::Array(services));

  std::vector<std::string> ports;
  ports.reserve(d.open_ports.size());
  for (const auto& p : d.open_ports) ports.push_back(PortToJson(p));
  f.emplace_back("openPorts", json::Array(ports));

  std::vector<std::string> sources;
  for (const auto s : d.discovery_sources) sources.push_back(ToString(s));
  f.emplace_back("discoverySources", StringArray(sources));

  Fields fp;
  for (const auto& kv : d.fingerprints) fp.emplace_back(kv.first, json::Quote(kv.second));
  f.emplace_back("fingerprints", json::Object(fp));

  if (d.classification) f.emplace_back("classification", ClassificationToJson(*d.classification));
  PutMs(f, "firstSeen", d.first_seen_ms);
  PutMs(f, "lastSeen", d.last_seen_ms);
  if (d.is_online_override) f.emplace_back("isOnlineOverride", json::Bool(*d.is_online_override));
  if (d.rtt_millis) f.emplace_back("rttMillis", json::Number(*d.rtt_millis));
  PutString(f, "autoName", d.auto_name);
  return f;
}

// ---- decoding ----

std::string Str(ryml::ConstNodeRef n) {
  if (!n.has_val()) return {};
  const c4::csubstr v = n.val();
  return std::string(v.str, v.len);
}

// Only a plain scalar can be null; "null" in quotes is a string.
bool IsNull(ryml::ConstNodeRef n) {
  if (!n.has_val() || n.is_val_quoted()) return false;
  const std::string v = Str(n);
  return v == "null" || v == "~";
}

std::optional<ryml::ConstNodeRef> Child(ryml::ConstNodeRef n, const char* key) {
  if (!n.is_map()) return std::nullopt;
  const c4::csubstr k = ryml::to_csubstr(key);
  if (!n.has_child(k)) return std::nullopt;
  ryml::ConstNodeRef c = n[k];
  if (IsNull(c)) return std::nullopt;
  return c;
}

std::optional<std::string> OptString(ryml::ConstNodeRef n, const char* key) {
  const auto c = Child(n, key);
  if (!c || !c->has_val()) return std::nullopt;
  return Str(*c);
}

std::optional<double> OptDouble(ryml::ConstNodeRef n, const char* key) {
  const auto s = OptString(n, key);
  if (!s || s->empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s->c_str(), &end);
  if (end == s->c_str() || *end != '\0') return std::nullopt;
  return v;
}

std::optional<std::int64_t> OptInt64(ryml::ConstNodeRef n, const char* key) {
  const auto v = OptDouble(n, key);
  if (!v) return std::nullopt;
  return static_cast<std::int64_t>(*v);
}

std::optional<bool> OptBool(ryml::ConstNodeRef n, const char* key) {
  const auto s = OptString(n, key);
  if (!s) return std::nullopt;
  if (*s == "true") return true;
  if (*s == "false") return false;
  return std::nullopt;
}

std::vector<std::string> StringList(ryml::ConstNodeRef n, const char* key) {
  std::vector<std::string> out;
  const auto c = Child(n, key);
  if (!c || !c->is_seq()) return out;
  for (ryml::ConstNodeRef item : c->children()) {
    if (item.has_val()) out.push_back(Str(item));
  }
  return out;
}

NetworkService ServiceFromNode(ryml::ConstNodeRef n) {
  NetworkService s;
  const auto type = OptString(n, "type");
  if (!type || !ParseServiceType(*type, s.type)) s.type = ServiceType::Other;
  s.name = OptString(n, "name").value_or("");
  s.raw_type = OptString(n, "rawType");
  if (const auto port = OptInt64(n, "port")) s.port = static_cast<int>(*port);
  s.is_standard_port = OptBool(n, "isStandardPort").value_or(false);
  return s;
}

bool PortFromNode(ryml::ConstNodeRef n, Port& p) {
  const auto number = OptInt64(n, "number");
  if (!number) return false;
  p.number = static_cast<int>(*number);
  p.transport = OptString(n, "transport").value_or("tcp");
  p.service_name = OptString(n, "serviceName").value_or("");
  p.description = OptString(n, "description").value_or("");
  const auto status = OptString(n, "status");
  if (!status || !ParsePortStatus(*status, p.status)) p.status = PortStatus::Closed;
  p.last_seen_open_ms = OptInt64(n, "lastSeenOpen");
  return true;
}

Classification ClassificationFromNode(ryml::ConstNodeRef n) {
  Classification c;
  DeviceFormFactor ff = DeviceFormFactor::Unknown;
  if (const auto s = OptString(n, "formFactor")) {
    if (ParseFormFactor(*s, ff)) c.form_factor = ff;
  }
  c.raw_type = OptString(n, "rawType");
  const auto conf = OptString(n, "confidence");
  if (!conf || !ParseConfidence(*conf, c.confidence)) c.confidence = ClassificationConfidence::Unknown;
  c.reason = OptString(n, "reason").value_or("");
  c.sources = StringList(n, "sources");
  return c;
}

bool DeviceFromNode(ryml::ConstNodeRef n, Device& d) {
  if (!n.is_map()) return false;
  d = Device{};
  d.id = OptString(n, "id").value_or("");
  if (d.id.empty()) return false;
  d.primary_ip = OptString(n, "primaryIP");
  for (auto& ip : StringList(n, "ips")) d.ips.insert(std::move(ip));
  d.hostname = OptString(n, "hostname");
  d.vendor = OptString(n, "vendor");
  d.mac_address = OptString(n, "macAddress");
  d.model_hint = OptString(n, "modelHint");

  if (const auto services = Child(n, "services")) {
    if (services->is_seq()) {
      for (ryml::ConstNodeRef s : services->children()) {
        if (s.is_map()) d.services.push_back(ServiceFromNode(s));
      }
    }
  }
  if (const auto ports = Child(n, "openPorts")) {
    if (ports->is_seq()) {
      for (ryml::ConstNodeRef pn : ports->children()) {
        Port p;
        if (pn.is_map() && PortFromNode(pn, p)) d.open_ports.push_back(std::move(p));
      }
    }
  }
  for (const auto& s : StringList(n, "discoverySources")) {
    DiscoverySource src = DiscoverySource::Unknown;
    if (!ParseDiscoverySource(s, src)) src = DiscoverySource::Unknown;
    d.discovery_sources.insert(src);
  }
  if (const auto fp = Child(n, "fingerprints")) {
    if (fp->is_map()) {
      for (ryml::ConstNodeRef kv : fp->children()) {
        if (!kv.has_key() || !kv.has_val()) continue;
        const c4::csubstr k = kv.key();
        d.fingerprints[std::string(k.str, k.len)] = Str(kv);
      }
    }
  }
  if (const auto c = Child(n, "classification")) {
    if (c->is_map()) d.classification = ClassificationFromNode(*c);
  }
  d.first_seen_ms = OptInt64(n, "firstSeen");
  d.last_seen_ms = OptInt64(n, "lastSeen");
  d.is_online_override = OptBool(n, "isOnlineOverride");
  d.rtt_millis = OptDouble(n, "rttMillis");
  d.auto_name = OptString(n, "autoName");
  return true;
}

}  // namespace

std::string DeviceToJson(const Device& d) { return json::Object(DeviceFields(d)); }

std::string DevicesToJson(const std::vector<Device>& devices) {
  std::vector<std::string> items;
  items.reserve(devices.size());
  for (const auto& d : devices) items.push_back(DeviceToJson(d));
  return json::Array(items);
}

std::string DeviceViewToJson(const Device& d, std::int64_t now_ms, std::int64_t grace_ms) {
  Fields f = DeviceFields(d);
  PutString(f, "displayIP", BestDisplayIp(d));
  f.emplace_back("online", json::Bool(IsOnline(d, now_ms, grace_ms)));
  return json::Object(f);
}

std::string DeviceViewsToJson(const std::vector<Device>& devices, std::int64_t now_ms,
                              std::int64_t grace_ms) {
  std::vector<std::string> items;
  items.reserve(devices.size());
  for (const auto& d : devices) items.push_back(DeviceViewToJson(d, now_ms, grace_ms));
  return json::Array(items);
}

bool DevicesFromJson(const std::string& text, std::vector<Device>& out, std::string& err) {
  out.clear();
  try {
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(text));
    const ryml::ConstNodeRef root = tree.crootref();
    if (!root.valid() || !root.is_seq()) {
      err = "expected a JSON array of devices";
      return false;
    }
    for (ryml::ConstNodeRef n : root.children()) {
      Device d;
      if (DeviceFromNode(n, d)) out.push_back(std::move(d));
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

bool DeviceFromJson(const std::string& text, Device& out, std::string& err) {
  try {
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(text));
    const ryml::ConstNodeRef root = tree.crootref();
    if (!root.valid() || !DeviceFromNode(root, out)) {
      err = "expected a JSON device object with an id";
      return false;
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace lanscan
