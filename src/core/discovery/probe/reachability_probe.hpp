#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "core/common/utils/cancellation.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace probe {

struct ProbeConfig {
  int count = 2;
  std::int64_t interval_ms = 1000;
  std::int64_t timeout_ms = 1000;
};

struct ProbeAttempt {
  int sequence = 0;
  bool success = false;
  double rtt_millis = 0.0;
};

class ReachabilityProbe {
public:
  // Return false to stop probing the host.
  using AttemptCallback = std::function<bool(const ProbeAttempt&)>;

  virtual ~ReachabilityProbe() = default;

  virtual bool Available() const { return true; }

  // Runs up to config.count attempts, reporting each one in order.
  virtual void Probe(const std::string& host, const ProbeConfig& config,
                     const common::CancellationToken& token, const AttemptCallback& on_attempt) = 0;
};

}  // namespace probe
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
