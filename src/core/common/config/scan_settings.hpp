#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/common/config/config_manager.hpp"

namespace lanscan::core::common::config {

struct LogSettings {
  std::string file = "logs/lanscan.log";
  std::string level = "info";
  bool console = false;
};

struct SnapshotSettings {
  std::size_t bus_buffer_size = 256;
  std::string persistence_dir = "data";
  std::string persistence_key = "lanscan:devices:v1";
  double offline_check_sec = 60.0;
  double online_grace_sec = 300.0;
  bool mark_offline_on_restore = true;
};

struct ScanSettings {
  std::int64_t max_concurrent = 32;
  std::int64_t ping_count = 2;
  double ping_interval_sec = 1.0;
  double ping_timeout_sec = 1.0;
  double warmup_sec = 1.0;
  bool auto_enumerate = true;
  std::int64_t max_auto_hosts = 254;
  std::vector<std::string> hosts;
  double interval_sec = 0.0;
  bool passive_on_start = true;
  bool scan_on_start = true;
};

struct NeighborSettings {
  double poll_interval_sec = 5.0;
  std::string table_path = "/proc/net/arp";
  std::int64_t prime_port = 9;
};

struct HttpSettings {
  bool enabled = true;
  std::string listen = "http://0.0.0.0:8000";
  std::string ws_path = "/ws";
};

struct Settings {
  LogSettings log;
  SnapshotSettings snapshot;
  ScanSettings scan;
  NeighborSettings neighbor;
  HttpSettings http;
};

// Missing keys keep their defaults; malformed values are reported by ValidateSettings
// only when they parse into an out-of-range number.
Settings LoadSettings(const ConfigManager& cfg);

std::vector<std::string> ValidateSettings(const Settings& s);

}  // namespace lanscan::core::common::config
