#pragma once

#include <cstdint>

#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace model {

constexpr std::int64_t kOnlineGraceMs = 300 * 1000;

inline bool RecentlySeen(const Device& d, std::int64_t now_ms, std::int64_t grace_ms = kOnlineGraceMs) {
  if (!d.last_seen_ms) return false;
  return now_ms - *d.last_seen_ms < grace_ms;
}

// Explicit override wins; otherwise online means seen within the grace window.
inline bool IsOnline(const Device& d, std::int64_t now_ms, std::int64_t grace_ms = kOnlineGraceMs) {
  if (d.is_online_override) return *d.is_online_override;
  return RecentlySeen(d, now_ms, grace_ms);
}

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace lanscan
