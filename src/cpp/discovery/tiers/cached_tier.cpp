#include "lodestar/tiers/cached_tier.h"
#include "lodestar/utils/http_client.h"
#include <iostream>

using namespace lodestar::utils;

#define DEBUG_LOG(tier, msg) \
    if ((tier)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {
namespace tiers {

CachedTier::CachedTier(const ServerConfigStore& store, const std::string& log_level)
    : DiscoveryTierProbe(DiscoveryTier::CACHED, log_level), store_(store) {}

std::optional<DiscoveredServer> CachedTier::discover(std::chrono::milliseconds timeout,
                                                     const CancellationToken& token) {
    if (token.cancelled()) {
        return std::nullopt;
    }

    std::optional<ServerConfig> cached;
    try {
        cached = store_.primary();
    } catch (const std::exception& e) {
        DEBUG_LOG(this, "[CachedTier] Could not read primary server: " << e.what());
        return std::nullopt;
    }

    if (!cached) {
        DEBUG_LOG(this, "[CachedTier] No cached server");
        return std::nullopt;
    }

    try {
        HttpResponse response = HttpClient::get(cached->host, cached->port,
                                                server_type_health_path(cached->server_type),
                                                timeout);
        if (response.status == 200) {
            return DiscoveredServer(cached->name, cached->host, cached->port, DiscoveryMethod::CACHED);
        }
        DEBUG_LOG(this, "[CachedTier] " << cached->host << ":" << cached->port
                  << " answered HTTP " << response.status);
    } catch (const std::exception& e) {
        DEBUG_LOG(this, "[CachedTier] " << cached->host << ":" << cached->port
                  << " not reachable: " << e.what());
    }
    return std::nullopt;
}

} // namespace tiers
} // namespace lodestar
