#include "core/device/persistence/persistence.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#include "core/device/model/device_codec.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace persistence {

FilePersistence::FilePersistence(std::filesystem::path dir, std::shared_ptr<common::log::Logger> logger)
    : dir_(std::move(dir)), log_(std::move(logger), "persistence") {}

std::filesystem::path FilePersistence::PathFor(const std::string& key) const {
  std::string name;
  name.reserve(key.size() + 5);
  for (const char c : key) {
    const unsigned char uc = static_cast<unsigned char>(c);
    name.push_back((std::isalnum(uc) || c == '-' || c == '_' || c == '.') ? c : '_');
  }
  if (name.empty()) name = "default";
  return dir_ / (name + ".json");
}

std::vector<model::Device> FilePersistence::Load(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto path = PathFor(key);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return {};

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    log_.Warn("cannot open " + path.string());
    return {};
  }
  const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (contents.empty()) return {};

  std::vector<model::Device> out;
  std::string err;
  if (!model::DevicesFromJson(contents, out, err)) {
    log_.Warn("unreadable snapshot " + path.string() + ": " + err);
    return {};
  }
  log_.Info("loaded " + std::to_string(out.size()) + " devices from " + path.string());
  return out;
}

bool FilePersistence::Save(const std::vector<model::Device>& devices, const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    log_.Warn("cannot create " + dir_.string() + ": " + ec.message());
    return false;
  }

  const auto path = PathFor(key);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      log_.Warn("cannot write " + tmp.string());
      return false;
    }
    out << model::DevicesToJson(devices);
    out.flush();
    if (!out) {
      log_.Warn("short write to " + tmp.string());
      return false;
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    log_.Warn("cannot replace " + path.string() + ": " + ec.message());
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

}  // namespace persistence
}  // namespace device
}  // namespace core
}  // namespace lanscan
