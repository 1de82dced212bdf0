#pragma once

#include <optional>
#include <string>
#include "../discovery_tier.h"

namespace lodestar {
namespace tiers {

// Default UDP port companion servers broadcast their beacon on
constexpr uint16_t DEFAULT_BEACON_PORT = 11410;

// Listens for beacon datagrams announcing a companion server, e.g.
//   {"name": "Lab PC", "url": "http://192.168.1.20:11400"}
//   {"hostname": "lab-pc", "host": "192.168.1.20", "port": 11400}
// The first beacon whose endpoint answers its liveness check wins.
class AdvertisementTier : public DiscoveryTierProbe {
public:
    explicit AdvertisementTier(uint16_t beacon_port = DEFAULT_BEACON_PORT,
                               const std::string& log_level = "info");

    // Throws DiscoveryException if the beacon socket cannot be opened
    std::optional<DiscoveredServer> discover(std::chrono::milliseconds timeout,
                                             const CancellationToken& token) override;

    // Decode one datagram. A missing or wildcard host falls back to the
    // sender address. Returns nullopt for anything that is not a beacon.
    static std::optional<DiscoveredServer> parse_beacon(const std::string& datagram,
                                                        const std::string& sender_address);

    uint16_t beacon_port() const { return beacon_port_; }

private:
    uint16_t beacon_port_;
};

} // namespace tiers
} // namespace lodestar
