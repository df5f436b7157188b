#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lanscan::core::common::net {

struct Ipv4Network {
  std::uint32_t network_address{};
  std::uint32_t netmask{};

  std::uint32_t Broadcast() const { return (network_address & netmask) | ~netmask; }
  bool Contains(std::uint32_t addr) const { return (addr & netmask) == network_address; }

  bool operator==(const Ipv4Network& o) const {
    return network_address == o.network_address && netmask == o.netmask;
  }
};

inline bool IsValidPort(std::uint32_t port) {
  return port >= 1 && port <= 65535;
}

// Strict dotted-quad parse; returns host byte order.
inline std::optional<std::uint32_t> ParseIpv4(std::string_view s) {
  std::uint32_t out = 0;
  int parts = 0;
  std::size_t i = 0;
  while (parts < 4) {
    if (i >= s.size() || s[i] < '0' || s[i] > '9') return std::nullopt;
    std::uint32_t octet = 0;
    std::size_t digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
      octet = octet * 10 + static_cast<std::uint32_t>(s[i] - '0');
      if (++digits > 3 || octet > 255) return std::nullopt;
      ++i;
    }
    out = (out << 8) | octet;
    ++parts;
    if (parts < 4) {
      if (i >= s.size() || s[i] != '.') return std::nullopt;
      ++i;
    }
  }
  if (i != s.size()) return std::nullopt;
  return out;
}

inline std::string FormatIpv4(std::uint32_t v) {
  return std::to_string((v >> 24) & 0xff) + "." + std::to_string((v >> 16) & 0xff) + "." +
         std::to_string((v >> 8) & 0xff) + "." + std::to_string(v & 0xff);
}

inline bool IsIpv4(std::string_view s) { return ParseIpv4(s).has_value(); }

inline bool IsPrivateIpv4(std::string_view s) {
  const auto v = ParseIpv4(s);
  if (!v) return false;
  const std::uint32_t a = (*v >> 24) & 0xff;
  const std::uint32_t b = (*v >> 16) & 0xff;
  if (a == 10) return true;
  if (a == 172 && b >= 16 && b <= 31) return true;
  if (a == 192 && b == 168) return true;
  return false;
}

inline bool IsLinkLocalIpv4(std::string_view s) {
  const auto v = ParseIpv4(s);
  return v && ((*v >> 16) & 0xffff) == 0xa9fe;
}

inline bool IsLoopback(std::string_view s) {
  if (s == "::1") return true;
  const auto v = ParseIpv4(s);
  return v && ((*v >> 24) & 0xff) == 127;
}

inline std::uint32_t PrefixToNetmask(int prefix) {
  if (prefix <= 0) return 0;
  if (prefix >= 32) return 0xffffffffu;
  return 0xffffffffu << (32 - prefix);
}

// Usable host addresses of a block; network and broadcast are left out unless the
// block is a single address.
inline std::vector<std::string> HostAddresses(std::uint32_t base, int prefix) {
  std::vector<std::string> out;
  const std::uint32_t mask = PrefixToNetmask(prefix);
  const std::uint32_t network = base & mask;
  if (prefix >= 32) {
    out.push_back(FormatIpv4(network));
    return out;
  }
  const std::uint64_t count = std::uint64_t{1} << (32 - prefix);
  out.reserve(static_cast<std::size_t>(count > 2 ? count - 2 : count));
  for (std::uint64_t i = 0; i < count; ++i) {
    if (count > 1 && (i == 0 || i == count - 1)) continue;
    out.push_back(FormatIpv4(network + static_cast<std::uint32_t>(i)));
  }
  return out;
}

// Numeric order for IPv4, string order otherwise.
inline bool IpLess(std::string_view a, std::string_view b) {
  const auto va = ParseIpv4(a);
  const auto vb = ParseIpv4(b);
  if (va && vb) return *va < *vb;
  return a < b;
}

// Preference: private IPv4 (not link-local) > other IPv4 > IPv6 > anything.
inline std::optional<std::string> BestDisplayIp(const std::set<std::string>& ips) {
  if (ips.empty()) return std::nullopt;
  for (const auto& ip : ips) {
    if (IsPrivateIpv4(ip) && !IsLinkLocalIpv4(ip)) return ip;
  }
  for (const auto& ip : ips) {
    if (IsIpv4(ip)) return ip;
  }
  for (const auto& ip : ips) {
    if (ip.find(':') != std::string::npos) return ip;
  }
  return *ips.begin();
}

}  // namespace lanscan::core::common::net
