#include "core/device/model/device_entity.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <random>
#include <string>

#include "core/common/utils/network_utils.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace model {

namespace {

template <typename E, std::size_t N>
bool ParseEnum(std::string_view s, const E (&values)[N], E& out) {
  for (const E v : values) {
    if (s == ToString(v)) {
      out = v;
      return true;
    }
  }
  return false;
}

constexpr DiscoverySource kSources[] = {
    DiscoverySource::Mdns,       DiscoverySource::Arp,    DiscoverySource::Ping,
    DiscoverySource::Ssdp,       DiscoverySource::PortScan, DiscoverySource::HttpProbe,
    DiscoverySource::ReverseDns, DiscoverySource::Manual, DiscoverySource::Unknown};

constexpr ServiceType kServiceTypes[] = {
    ServiceType::Http,    ServiceType::Https,        ServiceType::Ssh,     ServiceType::Dns,
    ServiceType::Dhcp,    ServiceType::Smb,          ServiceType::Ftp,     ServiceType::Vnc,
    ServiceType::Airplay, ServiceType::AirplayAudio, ServiceType::Homekit, ServiceType::Chromecast,
    ServiceType::Spotify, ServiceType::Printer,      ServiceType::Ipp,     ServiceType::Telnet,
    ServiceType::Other};

constexpr PortStatus kPortStatuses[] = {PortStatus::Open, PortStatus::Closed, PortStatus::Filtered};

constexpr DeviceFormFactor kFormFactors[] = {
    DeviceFormFactor::Router,  DeviceFormFactor::Computer, DeviceFormFactor::Laptop,
    DeviceFormFactor::Tv,      DeviceFormFactor::Printer,  DeviceFormFactor::GameConsole,
    DeviceFormFactor::Phone,   DeviceFormFactor::Tablet,   DeviceFormFactor::Accessory,
    DeviceFormFactor::Iot,     DeviceFormFactor::Server,   DeviceFormFactor::Camera,
    DeviceFormFactor::Speaker, DeviceFormFactor::Hub,      DeviceFormFactor::Unknown};

constexpr ClassificationConfidence kConfidences[] = {
    ClassificationConfidence::Unknown, ClassificationConfidence::Low,
    ClassificationConfidence::Medium, ClassificationConfidence::High};

bool NonEmpty(const std::optional<std::string>& s) { return s.has_value() && !s->empty(); }

}  // namespace

bool Device::operator==(const Device& o) const {
  return id == o.id && primary_ip == o.primary_ip && ips == o.ips && hostname == o.hostname &&
         vendor == o.vendor && mac_address == o.mac_address && model_hint == o.model_hint &&
         services == o.services && open_ports == o.open_ports &&
         discovery_sources == o.discovery_sources && fingerprints == o.fingerprints &&
         classification == o.classification && first_seen_ms == o.first_seen_ms &&
         last_seen_ms == o.last_seen_ms && is_online_override == o.is_online_override &&
         rtt_millis == o.rtt_millis && auto_name == o.auto_name;
}

std::string NormalizeMac(std::string_view mac) {
  std::string out;
  std::string octet;
  auto flush = [&]() {
    if (octet.empty()) return;
    if (!out.empty()) out.push_back(':');
    if (octet.size() < 2) out.append(2 - octet.size(), '0');
    out += octet;
    octet.clear();
  };
  for (const char c : mac) {
    if (c == ':' || c == '-') {
      flush();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    octet.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  flush();
  return out;
}

std::string GenerateOpaqueId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::uint32_t> dist(0, 15);
  const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out.push_back('-');
    std::uint32_t nibble = dist(rng);
    if (i == 12) nibble = 4;
    if (i == 16) nibble = 8 | (nibble & 3);
    out.push_back(hex[nibble]);
  }
  return out;
}

std::string ResolveIdentity(const Device& d) {
  if (NonEmpty(d.mac_address)) {
    const std::string mac = NormalizeMac(*d.mac_address);
    if (!mac.empty()) return mac;
  }
  if (NonEmpty(d.primary_ip)) return *d.primary_ip;
  if (NonEmpty(d.hostname)) return *d.hostname;
  return GenerateOpaqueId();
}

void AssignIdentity(Device& d) {
  if (d.mac_address) {
    const std::string mac = NormalizeMac(*d.mac_address);
    if (mac.empty()) {
      d.mac_address.reset();
    } else {
      d.mac_address = mac;
    }
  }
  if (d.id.empty()) d.id = ResolveIdentity(d);
}

VendorModel ExtractVendorModel(const std::map<std::string, std::string>& fingerprints) {
  static const char* const kVendorKeys[] = {"vendor", "manufacturer", "brand", "manu", "mf", "company"};
  static const char* const kModelKeys[] = {"model", "devicemodel", "md", "mdl", "modelname", "product", "ty"};

  std::map<std::string, std::string> lower;
  for (const auto& kv : fingerprints) {
    std::string k = kv.first;
    for (auto& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    lower[k] = kv.second;
  }
  auto first_of = [&lower](const char* const* keys, std::size_t n) -> std::optional<std::string> {
    for (std::size_t i = 0; i < n; ++i) {
      const auto it = lower.find(keys[i]);
      if (it != lower.end() && !it->second.empty()) return it->second;
    }
    return std::nullopt;
  };

  VendorModel out;
  out.vendor = first_of(kVendorKeys, std::size(kVendorKeys));
  out.model = first_of(kModelKeys, std::size(kModelKeys));
  return out;
}

std::optional<std::string> BestDisplayIp(const Device& d) {
  if (NonEmpty(d.primary_ip)) return d.primary_ip;
  return common::net::BestDisplayIp(d.ips);
}

const char* ToString(DiscoverySource s) {
  switch (s) {
    case DiscoverySource::Mdns: return "mdns";
    case DiscoverySource::Arp: return "arp";
    case DiscoverySource::Ping: return "ping";
    case DiscoverySource::Ssdp: return "ssdp";
    case DiscoverySource::PortScan: return "portScan";
    case DiscoverySource::HttpProbe: return "httpProbe";
    case DiscoverySource::ReverseDns: return "reverseDNS";
    case DiscoverySource::Manual: return "manual";
    case DiscoverySource::Unknown: return "unknown";
  }
  return "unknown";
}

bool ParseDiscoverySource(std::string_view s, DiscoverySource& out) {
  return ParseEnum(s, kSources, out);
}

const char* ToString(ServiceType t) {
  switch (t) {
    case ServiceType::Http: return "http";
    case ServiceType::Https: return "https";
    case ServiceType::Ssh: return "ssh";
    case ServiceType::Dns: return "dns";
    case ServiceType::Dhcp: return "dhcp";
    case ServiceType::Smb: return "smb";
    case ServiceType::Ftp: return "ftp";
    case ServiceType::Vnc: return "vnc";
    case ServiceType::Airplay: return "airplay";
    case ServiceType::AirplayAudio: return "airplayAudio";
    case ServiceType::Homekit: return "homekit";
    case ServiceType::Chromecast: return "chromecast";
    case ServiceType::Spotify: return "spotify";
    case ServiceType::Printer: return "printer";
    case ServiceType::Ipp: return "ipp";
    case ServiceType::Telnet: return "telnet";
    case ServiceType::Other: return "other";
  }
  return "other";
}

bool ParseServiceType(std::string_view s, ServiceType& out) {
  return ParseEnum(s, kServiceTypes, out);
}

const char* ToString(PortStatus s) {
  switch (s) {
    case PortStatus::Open: return "open";
    case PortStatus::Closed: return "closed";
    case PortStatus::Filtered: return "filtered";
  }
  return "closed";
}

bool ParsePortStatus(std::string_view s, PortStatus& out) {
  return ParseEnum(s, kPortStatuses, out);
}

const char* ToString(DeviceFormFactor f) {
  switch (f) {
    case DeviceFormFactor::Router: return "router";
    case DeviceFormFactor::Computer: return "computer";
    case DeviceFormFactor::Laptop: return "laptop";
    case DeviceFormFactor::Tv: return "tv";
    case DeviceFormFactor::Printer: return "printer";
    case DeviceFormFactor::GameConsole: return "gameConsole";
    case DeviceFormFactor::Phone: return "phone";
    case DeviceFormFactor::Tablet: return "tablet";
    case DeviceFormFactor::Accessory: return "accessory";
    case DeviceFormFactor::Iot: return "iot";
    case DeviceFormFactor::Server: return "server";
    case DeviceFormFactor::Camera: return "camera";
    case DeviceFormFactor::Speaker: return "speaker";
    case DeviceFormFactor::Hub: return "hub";
    case DeviceFormFactor::Unknown: return "unknown";
  }
  return "unknown";
}

bool ParseFormFactor(std::string_view s, DeviceFormFactor& out) {
  return ParseEnum(s, kFormFactors, out);
}

const char* ToString(ClassificationConfidence c) {
  switch (c) {
    case ClassificationConfidence::Unknown: return "unknown";
    case ClassificationConfidence::Low: return "low";
    case ClassificationConfidence::Medium: return "medium";
    case ClassificationConfidence::High: return "high";
  }
  return "unknown";
}

bool ParseConfidence(std::string_view s, ClassificationConfidence& out) {
  return ParseEnum(s, kConfidences, out);
}

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace lanscan
