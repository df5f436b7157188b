#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/network_utils.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace network {

class HostEnumerator {
public:
  virtual ~HostEnumerator() = default;

  // Candidate host addresses, at most max_hosts of them (0 means no limit).
  virtual std::vector<std::string> Enumerate(std::size_t max_hosts) = 0;

  // Subnets the host is attached to; used to reject broadcast replies.
  virtual std::vector<common::net::Ipv4Network> ActiveNetworks() { return {}; }
};

struct InterfaceAddress {
  std::string name;
  std::uint32_t address = 0;
  std::uint32_t netmask = 0;
};

// /24 around the primary non-loopback IPv4 interface, link-local excluded.
class LocalSubnetEnumerator final : public HostEnumerator {
public:
  explicit LocalSubnetEnumerator(std::shared_ptr<common::log::Logger> logger = nullptr);

  std::vector<std::string> Enumerate(std::size_t max_hosts) override;
  std::vector<common::net::Ipv4Network> ActiveNetworks() override;

  static std::vector<InterfaceAddress> ListInterfaces();

  // Prefers ethernet/wireless style names (en*, eth*, wl*), falls back to the first.
  static std::optional<InterfaceAddress> PickPrimary(const std::vector<InterfaceAddress>& ifaces);

  static std::vector<std::string> HostsFor(std::uint32_t address, std::size_t max_hosts);

private:
  common::log::TaggedLogger log_;
};

}  // namespace network
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
