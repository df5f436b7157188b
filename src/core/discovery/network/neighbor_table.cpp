#include "core/discovery/network/neighbor_table.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include "core/common/utils/network_utils.hpp"
#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace network {

namespace {

constexpr const char* kIncompleteMac = "00:00:00:00:00:00";

}  // namespace

ProcArpTable::ProcArpTable(std::string path, std::shared_ptr<common::log::Logger> logger)
    : path_(std::move(path)), log_(std::move(logger), "arp") {}

std::vector<NeighborEntry> ProcArpTable::Parse(const std::string& text) {
  std::vector<NeighborEntry> out;
  std::istringstream in(text);
  std::string line;
  bool header = true;
  while (std::getline(in, line)) {
    if (header) {
      header = false;
      if (line.rfind("IP address", 0) == 0) continue;
    }
    // IP address  HW type  Flags  HW address  Mask  Device
    std::istringstream row(line);
    std::string ip, hw_type, flags, mac, mask, dev;
    if (!(row >> ip >> hw_type >> flags >> mac >> mask >> dev)) continue;
    if (!common::net::IsIpv4(ip)) continue;

    const std::string normalized = device::model::NormalizeMac(mac);
    if (normalized.empty() || normalized == kIncompleteMac) continue;

    NeighborEntry e;
    e.ip = ip;
    e.mac = normalized;
    e.interface_name = dev;
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<NeighborEntry> ProcArpTable::Read() {
  std::ifstream in(path_);
  if (!in) {
    log_.Debug("cannot open " + path_);
    return {};
  }
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto entries = Parse(text);
  log_.Trace("read " + std::to_string(entries.size()) + " neighbor entries");
  return entries;
}

UdpNeighborPrimer::UdpNeighborPrimer(std::uint16_t port, std::shared_ptr<common::log::Logger> logger)
    : port_(port), log_(std::move(logger), "arp") {}

std::size_t UdpNeighborPrimer::Prime(const std::vector<std::string>& hosts,
                                     const common::CancellationToken& token) {
  const int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd < 0) {
    log_.Warn(std::string("primer socket: ") + std::strerror(errno));
    return 0;
  }

  std::size_t primed = 0;
  for (const auto& host : hosts) {
    if (token.IsCancelled()) break;
    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(port_);
    if (::inet_pton(AF_INET, host.c_str(), &dst.sin_addr) != 1) continue;
    const char byte = 0;
    if (::sendto(fd, &byte, 0, 0, reinterpret_cast<const sockaddr*>(&dst), sizeof(dst)) < 0) {
      log_.Trace("prime " + host + ": " + std::strerror(errno));
    }
    ++primed;
  }
  ::close(fd);
  log_.Debug("primed " + std::to_string(primed) + " hosts");
  return primed;
}

}  // namespace network
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
