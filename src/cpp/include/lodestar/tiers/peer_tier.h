#pragma once

#include <functional>
#include <vector>
#include "../discovery_tier.h"
#include "endpoint_sweep.h"

namespace lodestar {
namespace tiers {

// Default ports swept by the peer and subnet tiers: gateway, management, Ollama
const std::vector<uint16_t>& default_service_ports();

using HostSource = std::function<std::vector<std::string>()>;

// Sweeps the link-layer peers the kernel already knows about
class PeerTier : public DiscoveryTierProbe {
public:
    PeerTier(std::vector<uint16_t> ports,
             SweepOptions options = SweepOptions(),
             const std::string& log_level = "info",
             HostSource peers = HostSource());

    std::optional<DiscoveredServer> discover(std::chrono::milliseconds timeout,
                                             const CancellationToken& token) override;

private:
    std::vector<uint16_t> ports_;
    EndpointSweep sweep_;
    HostSource peers_;
};

} // namespace tiers
} // namespace lodestar
