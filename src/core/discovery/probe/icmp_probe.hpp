#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/common/logger/logger.hpp"
#include "core/discovery/probe/reachability_probe.hpp"

namespace lanscan {
namespace core {
namespace discovery {
namespace probe {

// Echo requests over an unprivileged ICMP datagram socket (Linux ping_group_range).
class IcmpProbe final : public ReachabilityProbe {
public:
  explicit IcmpProbe(std::shared_ptr<common::log::Logger> logger = nullptr);

  bool Available() const override;
  void Probe(const std::string& host, const ProbeConfig& config,
             const common::CancellationToken& token, const AttemptCallback& on_attempt) override;

private:
  common::log::TaggedLogger log_;
};

}  // namespace probe
}  // namespace discovery
}  // namespace core
}  // namespace lanscan
