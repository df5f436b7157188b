#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace persistence {

class DevicePersistence {
public:
  virtual ~DevicePersistence() = default;

  // A missing key loads as an empty list.
  virtual std::vector<model::Device> Load(const std::string& key) = 0;
  virtual bool Save(const std::vector<model::Device>& devices, const std::string& key) = 0;
};

// One JSON document per key under `dir`, replaced atomically on every save.
class FilePersistence final : public DevicePersistence {
public:
  FilePersistence(std::filesystem::path dir, std::shared_ptr<common::log::Logger> logger = nullptr);

  std::vector<model::Device> Load(const std::string& key) override;
  bool Save(const std::vector<model::Device>& devices, const std::string& key) override;

  std::filesystem::path PathFor(const std::string& key) const;

private:
  std::filesystem::path dir_;
  common::log::TaggedLogger log_;
  std::mutex mu_;
};

}  // namespace persistence
}  // namespace device
}  // namespace core
}  // namespace lanscan
