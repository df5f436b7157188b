#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/cancellation.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace network {

struct NeighborEntry {
  std::string ip;
  std::string mac;
  std::string interface_name;

  bool operator==(const NeighborEntry& o) const {
    return ip == o.ip && mac == o.mac && interface_name == o.interface_name;
  }
};

class NeighborTable {
public:
  virtual ~NeighborTable() = default;
  // Resolved entries only; MACs are normalized.
  virtual std::vector<NeighborEntry> Read() = 0;
};

// Linux /proc/net/arp reader.
class ProcArpTable final : public NeighborTable {
public:
  explicit ProcArpTable(std::string path = "/proc/net/arp",
                        std::shared_ptr<common::log::Logger> logger = nullptr);

  std::vector<NeighborEntry> Read() override;

  // Parses the kernel's text format; incomplete rows are skipped.
  static std::vector<NeighborEntry> Parse(const std::string& text);

private:
  std::string path_;
  common::log::TaggedLogger log_;
};

// Provokes neighbor resolution for a list of hosts.
class NeighborPrimer {
public:
  virtual ~NeighborPrimer() = default;
  // Returns how many hosts were primed before completion or cancellation.
  virtual std::size_t Prime(const std::vector<std::string>& hosts,
                            const common::CancellationToken& token) = 0;
};

// Sends one empty UDP datagram per host; the kernel resolves the neighbor to route it.
class UdpNeighborPrimer final : public NeighborPrimer {
public:
  explicit UdpNeighborPrimer(std::uint16_t port = 9,
                             std::shared_ptr<common::log::Logger> logger = nullptr);

  std::size_t Prime(const std::vector<std::string>& hosts,
                    const common::CancellationToken& token) override;

private:
  std::uint16_t port_;
  common::log::TaggedLogger log_;
};

}  // namespace network
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
