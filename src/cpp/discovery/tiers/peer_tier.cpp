#include "lodestar/tiers/peer_tier.h"
#include "lodestar/utils/network_utils.h"
#include <iostream>

using namespace lodestar::utils;

#define DEBUG_LOG(tier, msg) \
    if ((tier)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {
namespace tiers {

const std::vector<uint16_t>& default_service_ports() {
    static const std::vector<uint16_t> ports = {DEFAULT_GATEWAY_PORT, 8766, 11434};
    return ports;
}

PeerTier::PeerTier(std::vector<uint16_t> ports, SweepOptions options,
                   const std::string& log_level, HostSource peers)
    : DiscoveryTierProbe(DiscoveryTier::PEER_TRANSPORT, log_level),
      ports_(std::move(ports)),
      sweep_(options, log_level),
      peers_(peers ? std::move(peers) : HostSource(&NetworkUtils::read_neighbor_table)) {}

std::optional<DiscoveredServer> PeerTier::discover(std::chrono::milliseconds timeout,
                                                   const CancellationToken& token) {
    std::vector<std::string> peers = peers_();
    DEBUG_LOG(this, "[PeerTier] " << peers.size() << " known peer(s)");
    if (peers.empty()) {
        return std::nullopt;
    }

    auto hit = sweep_.run(EndpointSweep::expand(peers, ports_), timeout, token);
    if (!hit) {
        return std::nullopt;
    }

    std::cout << "[PeerTier] Found server at " << hit->host << ":" << hit->port << std::endl;
    return DiscoveredServer(hit->host, hit->host, hit->port, DiscoveryMethod::PEER_TRANSPORT);
}

} // namespace tiers
} // namespace lodestar
