#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace mutation {

enum class DeviceField {
  Hostname,
  Vendor,
  ModelHint,
  RttMillis,
  Services,
  OpenPorts,
  DiscoverySources,
  Classification,
  Ips,
  PrimaryIp,
  LastSeen,
  FirstSeen,
  MacAddress,
  Fingerprints,
  IsOnlineOverride,
  AutoName
};

using FieldSet = std::set<DeviceField>;

const char* ToString(DeviceField f);
bool ParseDeviceField(std::string_view s, DeviceField& out);

const FieldSet& AllFields();

// Fields whose change triggers reclassification. Fingerprints are left out on purpose.
const FieldSet& ClassificationRelevantFields();

bool Intersects(const FieldSet& a, const FieldSet& b);

// Exact set of attributes that differ between two records (id excluded).
FieldSet Differences(const model::Device& before, const model::Device& after);

enum class MutationSource {
  Mdns,
  Ping,
  Arp,
  PortScan,
  HttpFingerprint,
  Classification,
  PersistenceRestore,
  Offline,
  Manual
};

const char* ToString(MutationSource s);
bool ParseMutationSource(std::string_view s, MutationSource& out);

// Discovery tag recorded on a device for observations from this source, if any.
std::optional<model::DiscoverySource> DiscoveryTagFor(MutationSource s);

struct SnapshotMutation {
  std::vector<model::Device> devices;
};

struct ChangeMutation {
  std::optional<model::Device> before;
  model::Device after;
  FieldSet changed;
  MutationSource source = MutationSource::Manual;
};

using Mutation = std::variant<SnapshotMutation, ChangeMutation>;

inline bool IsSnapshot(const Mutation& m) { return std::holds_alternative<SnapshotMutation>(m); }
inline bool IsChange(const Mutation& m) { return std::holds_alternative<ChangeMutation>(m); }

// Raw observation as a provider would emit it: no before, every field considered.
Mutation Observation(model::Device device, MutationSource source);

}  // namespace mutation
}  // namespace device
}  // namespace core
}  // namespace lanscan
