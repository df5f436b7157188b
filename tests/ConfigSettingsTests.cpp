#include <gtest/gtest.h>

#include "core/common/config/config_manager.hpp"
#include "core/common/config/scan_settings.hpp"

#include <string>
#include <vector>

namespace lanscan::core::common::config {
namespace {

constexpr const char* kYaml = R"(
log:
  level: debug
  console: true
snapshot:
  persistence_dir: /var/lib/lanscan
  online_grace_sec: 120
scan:
  max_concurrent: 16
  ping_count: 3
  hosts:
    - 192.168.1.10
    - 192.168.1.11
http:
  listen: http://127.0.0.1:9000
)";

TEST(ConfigSettingsTests, FlattensNestedMapsAndSequences) {
  ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml)) << cfg.LastError();
  EXPECT_EQ(cfg.GetStringOr("log.level", ""), "debug");
  EXPECT_EQ(cfg.GetInt64Or("scan.max_concurrent", 0), 16);
  EXPECT_EQ(cfg.GetStringList("scan.hosts"),
            (std::vector<std::string>{"192.168.1.10", "192.168.1.11"}));
  EXPECT_TRUE(cfg.GetBoolOr("log.console", false));
  EXPECT_FALSE(cfg.Has("scan.missing"));
}

TEST(ConfigSettingsTests, OverridesApplyAndDefaultsRemain) {
  ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml));
  const Settings s = LoadSettings(cfg);

  EXPECT_EQ(s.log.level, "debug");
  EXPECT_TRUE(s.log.console);
  EXPECT_EQ(s.log.file, "logs/lanscan.log");
  EXPECT_EQ(s.snapshot.persistence_dir, "/var/lib/lanscan");
  EXPECT_DOUBLE_EQ(s.snapshot.online_grace_sec, 120.0);
  EXPECT_DOUBLE_EQ(s.snapshot.offline_check_sec, 60.0);
  EXPECT_EQ(s.snapshot.persistence_key, "lanscan:devices:v1");
  EXPECT_EQ(s.scan.max_concurrent, 16);
  EXPECT_EQ(s.scan.ping_count, 3);
  EXPECT_EQ(s.scan.hosts.size(), 2u);
  EXPECT_EQ(s.http.listen, "http://127.0.0.1:9000");
  EXPECT_EQ(s.http.ws_path, "/ws");
  EXPECT_TRUE(ValidateSettings(s).empty());
}

TEST(ConfigSettingsTests, ValidationReportsEveryBadValue) {
  Settings s;
  s.scan.max_concurrent = 0;
  s.scan.ping_timeout_sec = 0.0;
  s.scan.hosts = {"192.168.1.300"};
  s.neighbor.prime_port = 70000;
  s.http.ws_path = "ws";

  const auto errors = ValidateSettings(s);
  EXPECT_EQ(errors.size(), 5u);
}

TEST(ConfigSettingsTests, RequiredKeysAreChecked) {
  ConfigManager cfg;
  cfg.Set("log.level", "info");
  const auto errors = ValidateRequiredKeys(cfg, {"log.level", "http.listen"});
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("http.listen"), std::string::npos);
}

TEST(ConfigSettingsTests, MissingFileReportsError) {
  ConfigManager cfg;
  EXPECT_FALSE(cfg.LoadYamlFile("/nonexistent/lanscan.yaml"));
  EXPECT_NE(cfg.LastError().find("cannot open"), std::string::npos);
}

}  // namespace
}  // namespace lanscan::core::common::config
