#include "core/common/config/config_manager.hpp"
#include "core/common/config/scan_settings.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "core/common/utils/network_utils.hpp"

namespace lanscan::core::common::config {

static std::string MissingKeyMessage(std::string_view key) {
  return std::string("missing config key: ") + std::string(key);
}

static std::string RangeMessage(std::string_view key, std::string_view requirement) {
  return std::string(key) + " " + std::string(requirement);
}

std::vector<std::string> ValidateRequiredKeys(const ConfigManager& cfg,
                                             const std::vector<std::string>& required_keys) {
  std::vector<std::string> errors;
  errors.reserve(required_keys.size());
  for (const auto& k : required_keys) {
    if (!cfg.Has(k)) errors.push_back(MissingKeyMessage(k));
  }
  return errors;
}

std::vector<std::string> ValidateSettings(const Settings& s) {
  std::vector<std::string> errors;

  if (s.snapshot.bus_buffer_size < 1) errors.push_back(RangeMessage("bus.buffer_size", "must be >= 1"));
  if (s.snapshot.persistence_key.empty()) {
    errors.push_back(RangeMessage("snapshot.persistence_key", "must not be empty"));
  }
  if (s.snapshot.offline_check_sec <= 0.0) {
    errors.push_back(RangeMessage("snapshot.offline_check_sec", "must be > 0"));
  }
  if (s.snapshot.online_grace_sec <= 0.0) {
    errors.push_back(RangeMessage("snapshot.online_grace_sec", "must be > 0"));
  }

  if (s.scan.max_concurrent < 1) errors.push_back(RangeMessage("scan.max_concurrent", "must be >= 1"));
  if (s.scan.ping_count < 1) errors.push_back(RangeMessage("scan.ping_count", "must be >= 1"));
  if (s.scan.ping_interval_sec < 0.0) errors.push_back(RangeMessage("scan.ping_interval_sec", "must be >= 0"));
  if (s.scan.ping_timeout_sec <= 0.0) errors.push_back(RangeMessage("scan.ping_timeout_sec", "must be > 0"));
  if (s.scan.warmup_sec < 0.0) errors.push_back(RangeMessage("scan.warmup_sec", "must be >= 0"));
  if (s.scan.max_auto_hosts < 0) errors.push_back(RangeMessage("scan.max_auto_hosts", "must be >= 0"));
  if (s.scan.interval_sec < 0.0) errors.push_back(RangeMessage("scan.interval_sec", "must be >= 0"));
  for (const auto& h : s.scan.hosts) {
    if (!net::IsIpv4(h)) errors.push_back("scan.hosts entry is not an IPv4 address: " + h);
  }

  if (s.neighbor.poll_interval_sec <= 0.0) {
    errors.push_back(RangeMessage("neighbor.poll_interval_sec", "must be > 0"));
  }
  if (!net::IsValidPort(static_cast<std::uint32_t>(s.neighbor.prime_port < 0 ? 0 : s.neighbor.prime_port))) {
    errors.push_back(RangeMessage("neighbor.prime_port", "must be a port number"));
  }

  if (s.http.enabled && s.http.listen.empty()) errors.push_back(RangeMessage("http.listen", "must not be empty"));
  if (!s.http.ws_path.empty() && s.http.ws_path[0] != '/') {
    errors.push_back(RangeMessage("http.ws_path", "must start with '/'"));
  }

  return errors;
}

}  // namespace lanscan::core::common::config
