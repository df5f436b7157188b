#include <optional>
#include <string>
#include <string_view>

#include "scanner/scanner_core.hpp"

namespace {

lanscan::scanner::Args ParseArgs(int argc, char** argv) {
  lanscan::scanner::Args out;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];

    auto take_value = [&]() -> std::optional<std::string_view> {
      if (i + 1 >= argc) return std::nullopt;
      ++i;
      return std::string_view(argv[i]);
    };

    if (a == "--config") {
      const auto v = take_value();
      if (v.has_value()) out.config_yaml = std::string(*v);
    } else if (a == "--log-file") {
      const auto v = take_value();
      if (v.has_value()) out.log_file = std::string(*v);
    } else if (a == "--log-level") {
      const auto v = take_value();
      if (v.has_value()) out.log_level = std::string(*v);
    } else if (a == "--version") {
      out.print_version = true;
    }
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  return lanscan::scanner::ScannerCore::Run(ParseArgs(argc, argv));
}
