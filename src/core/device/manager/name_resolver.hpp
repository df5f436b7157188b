#pragma once

#include <optional>
#include <string>

#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace manager {

// Pure function of a device record giving its display name, if one can be derived.
class NameResolver {
public:
  virtual ~NameResolver() = default;
  virtual std::optional<std::string> Resolve(const model::Device& device) const = 0;
};

class NullNameResolver final : public NameResolver {
public:
  std::optional<std::string> Resolve(const model::Device&) const override { return std::nullopt; }
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace lanscan
