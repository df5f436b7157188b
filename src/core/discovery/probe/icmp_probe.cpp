#include "core/discovery/probe/icmp_probe.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <utility>

namespace lanscan {
namespace core {
namespace discovery {
namespace probe {

namespace {

constexpr std::size_t kPayloadSize = 16;

class SocketHandle {
public:
  SocketHandle() : fd_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP)) {}
  ~SocketHandle() {
    if (fd_ >= 0) ::close(fd_);
  }
  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;

  int fd() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

private:
  int fd_;
};

std::uint16_t Checksum(const std::uint8_t* data, std::size_t len) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i + 1 < len; i += 2) {
    sum += static_cast<std::uint32_t>(data[i] << 8 | data[i + 1]);
  }
  if (len % 2 != 0) sum += static_cast<std::uint32_t>(data[len - 1] << 8);
  while (sum >> 16) sum = (sum & 0xffff) + (sum >> 16);
  return htons(static_cast<std::uint16_t>(~sum));
}

std::uint16_t NextIdentifier() {
  static std::atomic<std::uint16_t> next{static_cast<std::uint16_t>(::getpid())};
  return next.fetch_add(1);
}

}  // namespace

IcmpProbe::IcmpProbe(std::shared_ptr<common::log::Logger> logger) : log_(std::move(logger), "ping") {}

bool IcmpProbe::Available() const {
  SocketHandle s;
  if (!s.valid()) {
    log_.Info(std::string("ICMP datagram socket unavailable: ") + std::strerror(errno));
    return false;
  }
  return true;
}

void IcmpProbe::Probe(const std::string& host, const ProbeConfig& config,
                      const common::CancellationToken& token, const AttemptCallback& on_attempt) {
  sockaddr_in dst{};
  dst.sin_family = AF_INET;
  if (::inet_pton(AF_INET, host.c_str(), &dst.sin_addr) != 1) {
    log_.Debug("not an IPv4 address: " + host);
    return;
  }

  SocketHandle sock;
  if (!sock.valid()) {
    log_.Debug(std::string("socket: ") + std::strerror(errno));
    return;
  }

  const std::uint16_t ident = NextIdentifier();
  for (int seq = 1; seq <= config.count; ++seq) {
    if (token.IsCancelled()) return;

    std::uint8_t packet[sizeof(icmphdr) + kPayloadSize] = {};
    auto* hdr = reinterpret_cast<icmphdr*>(packet);
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = htons(ident);
    hdr->un.echo.sequence = htons(static_cast<std::uint16_t>(seq));
    hdr->checksum = Checksum(packet, sizeof(packet));

    ProbeAttempt attempt;
    attempt.sequence = seq;

    const auto start = std::chrono::steady_clock::now();
    const ssize_t sent = ::sendto(sock.fd(), packet, sizeof(packet), 0,
                                  reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
    if (sent < 0) {
      log_.Trace("sendto " + host + ": " + std::strerror(errno));
    } else {
      const auto deadline = start + std::chrono::milliseconds(config.timeout_ms);
      for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) break;

        pollfd pfd{sock.fd(), POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) break;

        std::uint8_t reply[512];
        const ssize_t n = ::recv(sock.fd(), reply, sizeof(reply), 0);
        if (n < static_cast<ssize_t>(sizeof(icmphdr))) continue;
        const auto* rh = reinterpret_cast<const icmphdr*>(reply);
        if (rh->type != ICMP_ECHOREPLY) continue;
        if (ntohs(rh->un.echo.sequence) != seq) continue;

        const auto elapsed = std::chrono::steady_clock::now() - start;
        attempt.success = true;
        attempt.rtt_millis =
            std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
        break;
      }
    }

    if (!on_attempt(attempt)) return;
    if (seq < config.count && !token.SleepFor(config.interval_ms)) return;
  }
}

}  // namespace probe
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
