#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace model {

// Storage form: every known attribute, optional ones omitted when unset.
std::string DeviceToJson(const Device& d);
std::string DevicesToJson(const std::vector<Device>& devices);

// Presentation form: storage form plus derived displayIP and online.
std::string DeviceViewToJson(const Device& d, std::int64_t now_ms, std::int64_t grace_ms);
std::string DeviceViewsToJson(const std::vector<Device>& devices, std::int64_t now_ms,
                              std::int64_t grace_ms);

// Accepts a JSON array of devices. Entries without an id are skipped; unknown
// enum strings fall back to their "unknown"/"other" value.
bool DevicesFromJson(const std::string& json, std::vector<Device>& out, std::string& err);
bool DeviceFromJson(const std::string& json, Device& out, std::string& err);

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace lanscan
