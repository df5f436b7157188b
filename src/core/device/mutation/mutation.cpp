#include "core/device/mutation/mutation.hpp"

#include <iterator>
#include <utility>

namespace lanscan {
namespace core {
namespace device {
namespace mutation {

namespace {

constexpr DeviceField kFields[] = {
    DeviceField::Hostname,         DeviceField::Vendor,         DeviceField::ModelHint,
    DeviceField::RttMillis,        DeviceField::Services,       DeviceField::OpenPorts,
    DeviceField::DiscoverySources, DeviceField::Classification, DeviceField::Ips,
    DeviceField::PrimaryIp,        DeviceField::LastSeen,       DeviceField::FirstSeen,
    DeviceField::MacAddress,       DeviceField::Fingerprints,   DeviceField::IsOnlineOverride,
    DeviceField::AutoName};

constexpr MutationSource kSources[] = {
    MutationSource::Mdns,           MutationSource::Ping,
    MutationSource::Arp,            MutationSource::PortScan,
    MutationSource::HttpFingerprint, MutationSource::Classification,
    MutationSource::PersistenceRestore, MutationSource::Offline,
    MutationSource::Manual};

}  // namespace

const char* ToString(DeviceField f) {
  switch (f) {
    case DeviceField::Hostname: return "hostname";
    case DeviceField::Vendor: return "vendor";
    case DeviceField::ModelHint: return "modelHint";
    case DeviceField::RttMillis: return "rttMillis";
    case DeviceField::Services: return "services";
    case DeviceField::OpenPorts: return "openPorts";
    case DeviceField::DiscoverySources: return "discoverySources";
    case DeviceField::Classification: return "classification";
    case DeviceField::Ips: return "ips";
    case DeviceField::PrimaryIp: return "primaryIP";
    case DeviceField::LastSeen: return "lastSeen";
    case DeviceField::FirstSeen: return "firstSeen";
    case DeviceField::MacAddress: return "macAddress";
    case DeviceField::Fingerprints: return "fingerprints";
    case DeviceField::IsOnlineOverride: return "isOnlineOverride";
    case DeviceField::AutoName: return "autoName";
  }
  return "unknown";
}

bool ParseDeviceField(std::string_view s, DeviceField& out) {
  for (const DeviceField f : kFields) {
    if (s == ToString(f)) {
      out = f;
      return true;
    }
  }
  return false;
}

const FieldSet& AllFields() {
  static const FieldSet all(std::begin(kFields), std::end(kFields));
  return all;
}

const FieldSet& ClassificationRelevantFields() {
  static const FieldSet relevant{DeviceField::Hostname, DeviceField::Vendor, DeviceField::Services,
                                 DeviceField::OpenPorts, DeviceField::DiscoverySources};
  return relevant;
}

bool Intersects(const FieldSet& a, const FieldSet& b) {
  for (const DeviceField f : a) {
    if (b.count(f) != 0) return true;
  }
  return false;
}

FieldSet Differences(const model::Device& before, const model::Device& after) {
  FieldSet out;
  if (before.hostname != after.hostname) out.insert(DeviceField::Hostname);
  if (before.vendor != after.vendor) out.insert(DeviceField::Vendor);
  if (before.model_hint != after.model_hint) out.insert(DeviceField::ModelHint);
  if (before.rtt_millis != after.rtt_millis) out.insert(DeviceField::RttMillis);
  if (before.services != after.services) out.insert(DeviceField::Services);
  if (before.open_ports != after.open_ports) out.insert(DeviceField::OpenPorts);
  if (before.discovery_sources != after.discovery_sources) out.insert(DeviceField::DiscoverySources);
  if (before.classification != after.classification) out.insert(DeviceField::Classification);
  if (before.ips != after.ips) out.insert(DeviceField::Ips);
  if (before.primary_ip != after.primary_ip) out.insert(DeviceField::PrimaryIp);
  if (before.last_seen_ms != after.last_seen_ms) out.insert(DeviceField::LastSeen);
  if (before.first_seen_ms != after.first_seen_ms) out.insert(DeviceField::FirstSeen);
  if (before.mac_address != after.mac_address) out.insert(DeviceField::MacAddress);
  if (before.fingerprints != after.fingerprints) out.insert(DeviceField::Fingerprints);
  if (before.is_online_override != after.is_online_override) out.insert(DeviceField::IsOnlineOverride);
  if (before.auto_name != after.auto_name) out.insert(DeviceField::AutoName);
  return out;
}

const char* ToString(MutationSource s) {
  switch (s) {
    case MutationSource::Mdns: return "mdns";
    case MutationSource::Ping: return "ping";
    case MutationSource::Arp: return "arp";
    case MutationSource::PortScan: return "portScan";
    case MutationSource::HttpFingerprint: return "httpFingerprint";
    case MutationSource::Classification: return "classification";
    case MutationSource::PersistenceRestore: return "persistenceRestore";
    case MutationSource::Offline: return "offline";
    case MutationSource::Manual: return "manual";
  }
  return "manual";
}

bool ParseMutationSource(std::string_view s, MutationSource& out) {
  for (const MutationSource v : kSources) {
    if (s == ToString(v)) {
      out = v;
      return true;
    }
  }
  return false;
}

std::optional<model::DiscoverySource> DiscoveryTagFor(MutationSource s) {
  switch (s) {
    case MutationSource::Mdns: return model::DiscoverySource::Mdns;
    case MutationSource::Ping: return model::DiscoverySource::Ping;
    case MutationSource::Arp: return model::DiscoverySource::Arp;
    case MutationSource::PortScan: return model::DiscoverySource::PortScan;
    case MutationSource::HttpFingerprint: return model::DiscoverySource::HttpProbe;
    case MutationSource::Manual: return model::DiscoverySource::Manual;
    default: return std::nullopt;
  }
}

Mutation Observation(model::Device device, MutationSource source) {
  ChangeMutation c;
  c.after = std::move(device);
  c.changed = AllFields();
  c.source = source;
  return c;
}

}  // namespace mutation
}  // namespace device
}  // namespace core
}  // namespace lanscan
