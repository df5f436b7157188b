#include "core/discovery/network/host_enumerator.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <memory>
#include <string>
#include <utility>

namespace lanscan {
namespace core {
namespace discovery {
namespace network {

namespace net = common::net;

LocalSubnetEnumerator::LocalSubnetEnumerator(std::shared_ptr<common::log::Logger> logger)
    : log_(std::move(logger), "discovery") {}

std::vector<InterfaceAddress> LocalSubnetEnumerator::ListInterfaces() {
  std::vector<InterfaceAddress> out;
  ifaddrs* head = nullptr;
  if (::getifaddrs(&head) != 0 || head == nullptr) return out;
  const std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> guard(head, &::freeifaddrs);

  for (ifaddrs* it = head; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_netmask == nullptr) continue;
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) continue;
    if (it->ifa_addr->sa_family != AF_INET) continue;

    InterfaceAddress ia;
    ia.name = it->ifa_name != nullptr ? it->ifa_name : "";
    ia.address = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
    ia.netmask = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
    out.push_back(std::move(ia));
  }
  return out;
}

std::optional<InterfaceAddress> LocalSubnetEnumerator::PickPrimary(
    const std::vector<InterfaceAddress>& ifaces) {
  const InterfaceAddress* fallback = nullptr;
  for (const auto& ia : ifaces) {
    if (net::IsLinkLocalIpv4(net::FormatIpv4(ia.address))) continue;
    if (fallback == nullptr) fallback = &ia;
    const std::string& n = ia.name;
    if (n.rfind("en", 0) == 0 || n.rfind("eth", 0) == 0 || n.rfind("wl", 0) == 0) return ia;
  }
  if (fallback == nullptr) return std::nullopt;
  return *fallback;
}

std::vector<std::string> LocalSubnetEnumerator::HostsFor(std::uint32_t address, std::size_t max_hosts) {
  std::vector<std::string> hosts;
  for (auto& h : net::HostAddresses(address, 24)) {
    if (net::IsLinkLocalIpv4(h)) continue;
    hosts.push_back(std::move(h));
    if (max_hosts > 0 && hosts.size() >= max_hosts) break;
  }
  return hosts;
}

std::vector<std::string> LocalSubnetEnumerator::Enumerate(std::size_t max_hosts) {
  const auto primary = PickPrimary(ListInterfaces());
  if (!primary) {
    log_.Warn("no active IPv4 interface, nothing to enumerate");
    return {};
  }
  auto hosts = HostsFor(primary->address, max_hosts);
  log_.Debug("enumerate base=" + net::FormatIpv4(primary->address) + " iface=" + primary->name +
             " hosts=" + std::to_string(hosts.size()));
  return hosts;
}

std::vector<net::Ipv4Network> LocalSubnetEnumerator::ActiveNetworks() {
  std::vector<net::Ipv4Network> out;
  for (const auto& ia : ListInterfaces()) {
    net::Ipv4Network n;
    n.netmask = ia.netmask;
    n.network_address = ia.address & ia.netmask;
    bool dup = false;
    for (const auto& seen : out) dup = dup || seen == n;
    if (!dup) out.push_back(n);
  }
  return out;
}

}  // namespace network
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
