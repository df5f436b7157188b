#include "core/common/config/scan_settings.hpp"

#include <string>

namespace lanscan::core::common::config {

Settings LoadSettings(const ConfigManager& cfg) {
  Settings s;

  s.log.file = cfg.GetStringOr("log.file", s.log.file);
  s.log.level = cfg.GetStringOr("log.level", s.log.level);
  s.log.console = cfg.GetBoolOr("log.console", s.log.console);

  const std::int64_t buffer =
      cfg.GetInt64Or("bus.buffer_size", static_cast<std::int64_t>(s.snapshot.bus_buffer_size));
  s.snapshot.bus_buffer_size = buffer > 0 ? static_cast<std::size_t>(buffer) : 0;
  s.snapshot.persistence_dir = cfg.GetStringOr("snapshot.persistence_dir", s.snapshot.persistence_dir);
  s.snapshot.persistence_key = cfg.GetStringOr("snapshot.persistence_key", s.snapshot.persistence_key);
  s.snapshot.offline_check_sec = cfg.GetDoubleOr("snapshot.offline_check_sec", s.snapshot.offline_check_sec);
  s.snapshot.online_grace_sec = cfg.GetDoubleOr("snapshot.online_grace_sec", s.snapshot.online_grace_sec);
  s.snapshot.mark_offline_on_restore =
      cfg.GetBoolOr("snapshot.mark_offline_on_restore", s.snapshot.mark_offline_on_restore);

  s.scan.max_concurrent = cfg.GetInt64Or("scan.max_concurrent", s.scan.max_concurrent);
  s.scan.ping_count = cfg.GetInt64Or("scan.ping_count", s.scan.ping_count);
  s.scan.ping_interval_sec = cfg.GetDoubleOr("scan.ping_interval_sec", s.scan.ping_interval_sec);
  s.scan.ping_timeout_sec = cfg.GetDoubleOr("scan.ping_timeout_sec", s.scan.ping_timeout_sec);
  s.scan.warmup_sec = cfg.GetDoubleOr("scan.warmup_sec", s.scan.warmup_sec);
  s.scan.auto_enumerate = cfg.GetBoolOr("scan.auto_enumerate", s.scan.auto_enumerate);
  s.scan.max_auto_hosts = cfg.GetInt64Or("scan.max_auto_hosts", s.scan.max_auto_hosts);
  s.scan.hosts = cfg.GetStringList("scan.hosts");
  s.scan.interval_sec = cfg.GetDoubleOr("scan.interval_sec", s.scan.interval_sec);
  s.scan.passive_on_start = cfg.GetBoolOr("scan.passive_on_start", s.scan.passive_on_start);
  s.scan.scan_on_start = cfg.GetBoolOr("scan.scan_on_start", s.scan.scan_on_start);

  s.neighbor.poll_interval_sec = cfg.GetDoubleOr("neighbor.poll_interval_sec", s.neighbor.poll_interval_sec);
  s.neighbor.table_path = cfg.GetStringOr("neighbor.table_path", s.neighbor.table_path);
  s.neighbor.prime_port = cfg.GetInt64Or("neighbor.prime_port", s.neighbor.prime_port);

  s.http.enabled = cfg.GetBoolOr("http.enabled", s.http.enabled);
  s.http.listen = cfg.GetStringOr("http.listen", s.http.listen);
  s.http.ws_path = cfg.GetStringOr("http.ws_path", s.http.ws_path);

  return s;
}

}  // namespace lanscan::core::common::config
