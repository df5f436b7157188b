#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lanscan {
namespace core {
namespace device {
namespace model {

enum class DeviceFormFactor {
  Router,
  Computer,
  Laptop,
  Tv,
  Printer,
  GameConsole,
  Phone,
  Tablet,
  Accessory,
  Iot,
  Server,
  Camera,
  Speaker,
  Hub,
  Unknown
};

enum class ClassificationConfidence { Unknown, Low, Medium, High };

enum class DiscoverySource { Mdns, Arp, Ping, Ssdp, PortScan, HttpProbe, ReverseDns, Manual, Unknown };

enum class ServiceType {
  Http,
  Https,
  Ssh,
  Dns,
  Dhcp,
  Smb,
  Ftp,
  Vnc,
  Airplay,
  AirplayAudio,
  Homekit,
  Chromecast,
  Spotify,
  Printer,
  Ipp,
  Telnet,
  Other
};

enum class PortStatus { Open, Closed, Filtered };

struct Classification {
  std::optional<DeviceFormFactor> form_factor;
  std::optional<std::string> raw_type;
  ClassificationConfidence confidence = ClassificationConfidence::Unknown;
  std::string reason;
  std::vector<std::string> sources;

  bool operator==(const Classification& o) const {
    return form_factor == o.form_factor && raw_type == o.raw_type && confidence == o.confidence &&
           reason == o.reason && sources == o.sources;
  }
  bool operator!=(const Classification& o) const { return !(*this == o); }
};

struct NetworkService {
  ServiceType type = ServiceType::Other;
  std::string name;
  std::optional<std::string> raw_type;
  std::optional<int> port;
  bool is_standard_port = false;

  bool operator==(const NetworkService& o) const {
    return type == o.type && name == o.name && raw_type == o.raw_type && port == o.port &&
           is_standard_port == o.is_standard_port;
  }
  bool operator!=(const NetworkService& o) const { return !(*this == o); }
};

struct Port {
  int number = 0;
  std::string transport = "tcp";
  std::string service_name;
  std::string description;
  PortStatus status = PortStatus::Open;
  std::optional<std::int64_t> last_seen_open_ms;

  bool operator==(const Port& o) const {
    return number == o.number && transport == o.transport && service_name == o.service_name &&
           description == o.description && status == o.status &&
           last_seen_open_ms == o.last_seen_open_ms;
  }
  bool operator!=(const Port& o) const { return !(*this == o); }
};

// Canonical record for one physical endpoint. `id` is assigned by ResolveIdentity
// when left empty and is never changed afterwards.
struct Device {
  std::string id;
  std::optional<std::string> primary_ip;
  std::set<std::string> ips;
  std::optional<std::string> hostname;
  std::optional<std::string> vendor;
  std::optional<std::string> mac_address;
  std::optional<std::string> model_hint;
  std::vector<NetworkService> services;
  std::vector<Port> open_ports;
  std::set<DiscoverySource> discovery_sources;
  std::map<std::string, std::string> fingerprints;
  std::optional<Classification> classification;
  std::optional<std::int64_t> first_seen_ms;
  std::optional<std::int64_t> last_seen_ms;
  std::optional<bool> is_online_override;
  std::optional<double> rtt_millis;
  // Derived display name; set only by the reconciler's name resolver.
  std::optional<std::string> auto_name;

  bool operator==(const Device& o) const;
  bool operator!=(const Device& o) const { return !(*this == o); }
};

std::string NormalizeMac(std::string_view mac);

// MAC if known, else primary IP, else hostname, else a generated opaque id.
std::string ResolveIdentity(const Device& d);

// Fills in `id` from ResolveIdentity when it is empty and normalizes the MAC.
void AssignIdentity(Device& d);

std::string GenerateOpaqueId();

// Vendor and model read from well-known fingerprint keys ("manufacturer", "md", ...).
struct VendorModel {
  std::optional<std::string> vendor;
  std::optional<std::string> model;
};
VendorModel ExtractVendorModel(const std::map<std::string, std::string>& fingerprints);

// Display address: primary IP when set, otherwise the best of the known addresses.
std::optional<std::string> BestDisplayIp(const Device& d);

const char* ToString(DiscoverySource s);
bool ParseDiscoverySource(std::string_view s, DiscoverySource& out);

const char* ToString(ServiceType t);
bool ParseServiceType(std::string_view s, ServiceType& out);

const char* ToString(PortStatus s);
bool ParsePortStatus(std::string_view s, PortStatus& out);

const char* ToString(DeviceFormFactor f);
bool ParseFormFactor(std::string_view s, DeviceFormFactor& out);

const char* ToString(ClassificationConfidence c);
bool ParseConfidence(std::string_view s, ClassificationConfidence& out);

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace lanscan
