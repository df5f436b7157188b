#pragma once

#include <optional>
#include <string>

namespace lanscan {
namespace scanner {

struct Args {
  std::string config_yaml;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;

  bool print_version = false;
};

class ScannerCore {
public:
  // Runs the daemon until SIGINT/SIGTERM. Returns the process exit code.
  static int Run(const Args& args);
};

}  // namespace scanner
}  // namespace lanscan
