#pragma once

#include <vector>
#include "../discovery_tier.h"
#include "endpoint_sweep.h"
#include "peer_tier.h"

namespace lodestar {
namespace tiers {

// Sweeps every host of the local private subnets, at most a /24 per interface
class SubnetScanTier : public DiscoveryTierProbe {
public:
    SubnetScanTier(std::vector<uint16_t> ports,
                   SweepOptions options = SweepOptions(),
                   const std::string& log_level = "info",
                   HostSource hosts = HostSource());

    std::optional<DiscoveredServer> discover(std::chrono::milliseconds timeout,
                                             const CancellationToken& token) override;

    // Candidate hosts of every up RFC 1918 interface, own addresses excluded
    static std::vector<std::string> local_subnet_hosts();

private:
    std::vector<uint16_t> ports_;
    EndpointSweep sweep_;
    HostSource hosts_;
};

} // namespace tiers
} // namespace lodestar
