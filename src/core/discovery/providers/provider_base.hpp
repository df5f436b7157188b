#pragma once

#include <memory>
#include <string>

#include "core/device/mutation/mutation_bus.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace providers {

// A discovery source. While started it emits Change mutations tagged with its own
// source onto the bus; it never touches canonical state.
class DiscoveryProvider {
public:
  virtual ~DiscoveryProvider() = default;

  virtual std::string Name() const = 0;
  virtual bool Start(std::shared_ptr<device::mutation::MutationBus> bus) = 0;
  virtual void Stop() = 0;
  virtual bool Running() const = 0;
};

}  // namespace providers
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
