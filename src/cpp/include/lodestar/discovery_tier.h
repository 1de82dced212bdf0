#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include "server_types.h"

namespace lodestar {

// Cooperative cancellation flag shared between a discovery session and the
// tier it is running. Tiers poll cancelled() or sleep through wait_for().
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(); }

    // Sleeps up to `duration`. Returns true if cancelled in the meantime.
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// One discovery strategy. The coordinator calls discover() once per session
// with that tier's timeout.
//
// Contract for implementations:
//  - Return std::nullopt when nothing was found, the deadline passed or the
//    token was cancelled.
//  - Throw TransientNetworkException for timeouts and unreachable hosts; the
//    coordinator treats it as "not found".
//  - Any other exception aborts the whole session.
class DiscoveryTierProbe {
public:
    explicit DiscoveryTierProbe(DiscoveryTier tier, const std::string& log_level = "info")
        : tier_(tier), log_level_(log_level) {}
    virtual ~DiscoveryTierProbe() = default;

    DiscoveryTier tier() const { return tier_; }
    std::string name() const { return discovery_tier_to_string(tier_); }

    virtual std::optional<DiscoveredServer> discover(std::chrono::milliseconds timeout,
                                                     const CancellationToken& token) = 0;

    // Hook for tiers blocked in something the token cannot reach (a socket).
    // Called from the thread that cancels the session.
    virtual void cancel() {}

    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

protected:
    DiscoveryTier tier_;
    std::string log_level_;
};

} // namespace lodestar
