#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../discovery_tier.h"

namespace lodestar {
namespace tiers {

struct SweepTarget {
    std::string host;
    uint16_t port = 0;
};

struct SweepOptions {
    size_t parallelism = 64;
    std::chrono::milliseconds connect_timeout{300};
    std::chrono::milliseconds read_timeout{1000};
};

// Parallel liveness sweep over candidate endpoints. Each port is probed on the
// health path of the server type it usually belongs to. The first endpoint to
// answer 200 wins and the remaining work is abandoned.
class EndpointSweep {
public:
    explicit EndpointSweep(SweepOptions options = SweepOptions(), const std::string& log_level = "info");

    // Returns the winning target, or nullopt if nothing answered before the
    // deadline or the token was cancelled. Never throws for network errors.
    std::optional<SweepTarget> run(const std::vector<SweepTarget>& targets,
                                   std::chrono::milliseconds deadline,
                                   const CancellationToken& token) const;

    // Every host paired with every port, hosts outermost
    static std::vector<SweepTarget> expand(const std::vector<std::string>& hosts,
                                           const std::vector<uint16_t>& ports);

    const SweepOptions& options() const { return options_; }

private:
    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    SweepOptions options_;
    std::string log_level_;
};

} // namespace tiers
} // namespace lodestar
