#pragma once

#include "../discovery_tier.h"
#include "../server_config_store.h"

namespace lodestar {
namespace tiers {

// Reconnect to the store's primary server. Purely a shortcut: every failure
// is swallowed and reported as "not found".
class CachedTier : public DiscoveryTierProbe {
public:
    CachedTier(const ServerConfigStore& store, const std::string& log_level = "info");

    std::optional<DiscoveredServer> discover(std::chrono::milliseconds timeout,
                                             const CancellationToken& token) override;

private:
    const ServerConfigStore& store_;
};

} // namespace tiers
} // namespace lodestar
