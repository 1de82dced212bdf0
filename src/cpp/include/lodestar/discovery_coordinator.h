#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "capability_prober.h"
#include "discovery_state.h"
#include "discovery_tier.h"
#include "server_config_store.h"
#include "tiers/endpoint_sweep.h"
#include "utils/event_channel.h"

namespace lodestar {

struct DiscoveryTimeouts {
    std::chrono::milliseconds cached{2000};
    std::chrono::milliseconds local_advertisement{3000};
    std::chrono::milliseconds peer_transport{3000};
    std::chrono::milliseconds subnet_scan{5000};

    std::chrono::milliseconds for_tier(DiscoveryTier tier) const;
};

// Settings for the built-in tier implementations
struct TierSettings {
    uint16_t beacon_port = 11410;
    std::vector<uint16_t> service_ports;  // Empty means the default service ports
    tiers::SweepOptions sweep;
};

// One state change as pushed to subscribers
struct DiscoveryEvent {
    DiscoveryState state;
    double progress = 0.0;
};

using DiscoveryEventChannel = utils::EventChannel<DiscoveryEvent>;
using DiscoveryResult = std::optional<DiscoveredServer>;
using TierList = std::vector<std::unique_ptr<DiscoveryTierProbe>>;

// The four built-in tiers in fallback order
TierList make_default_tiers(const ServerConfigStore& store,
                            const TierSettings& settings = TierSettings(),
                            const std::string& log_level = "info");

// Runs at most one discovery session at a time and owns the discovery state.
//
// A session walks the tiers in ascending order on a background thread and
// stops at the first tier that finds a server. "Not found" and transient
// network errors fall through to the next tier; any other error ends the
// session as Failed. When every tier comes up empty the state becomes
// ManualConfigRequired. Nothing is retried automatically.
//
// State changes are pushed to subscribers; state() and progress() are
// snapshots for callers that just need the current value.
class DiscoveryCoordinator {
public:
    // The prober is optional; without it connections are not enriched
    DiscoveryCoordinator(ServerConfigStore& store,
                         TierList tiers,
                         DiscoveryTimeouts timeouts = DiscoveryTimeouts(),
                         const CapabilityProber* prober = nullptr,
                         const std::string& log_level = "info");
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    // Starts a session, or returns the running session's result
    std::shared_future<DiscoveryResult> start();

    // start() and wait for the result
    DiscoveryResult discover();

    // Asks the running session to stop. The state returns to Idle once the
    // in-flight tier notices, at worst after that tier's timeout.
    void cancel();

    // Cancels any running session, waits for it to settle, starts a new one
    std::shared_future<DiscoveryResult> retry();

    // Forgets the primary server so the cached tier has nothing to reuse,
    // and resets the state to Idle
    void clear_cache();

    // Out-of-band configuration. Both skip the tier ladder and supersede a
    // running session.
    //
    // A payload without a recognisable host and port is ignored: nullopt is
    // returned and the state is left untouched.
    std::optional<DiscoveredServer> configure_from_qr_code(const std::string& payload);
    // Throws InvalidInputException for an empty host or a port outside 1..65535
    DiscoveredServer configure_manually(const std::string& host, int port, const std::string& name = "");

    // New channel receiving every state change, starting with the current one.
    // Dropping the last reference unsubscribes.
    std::shared_ptr<DiscoveryEventChannel> subscribe();

    DiscoveryState state() const;
    double progress() const;
    std::optional<DiscoveryTier> current_tier() const;
    bool is_discovering() const;

    // Servers connected since the current session started
    std::vector<DiscoveredServer> discovered_servers() const;
    std::optional<DiscoveredServer> connected_server() const;

    // Result of the most recently started capability enrichment. An older
    // enrichment that finishes later is discarded.
    std::optional<ServerCapabilities> capabilities() const;

    // Blocks until pending capability enrichment has finished
    void wait_for_enrichment();

    const DiscoveryTimeouts& timeouts() const { return timeouts_; }
    size_t tier_count() const { return tiers_.size(); }

private:
    void run_session(uint64_t generation,
                     std::shared_ptr<CancellationToken> token,
                     std::shared_ptr<std::promise<DiscoveryResult>> promise,
                     std::thread previous);
    DiscoveryResult execute_session(uint64_t generation, const CancellationToken& token);

    // Applies a state change unless the session was superseded. Returns false for stale writes.
    bool publish(uint64_t generation, DiscoveryState next, double progress,
                 DiscoveryTierProbe* active_tier = nullptr);
    bool finish(uint64_t generation, DiscoveryState next, double progress);
    void publish_locked(DiscoveryState next, double progress);

    DiscoveredServer connect_out_of_band(const DiscoveredServer& server);
    void supersede_session_locked();
    std::optional<ServerConfig> save_connection(const DiscoveredServer& server);
    void start_enrichment(const ServerConfig& record);
    void enrich(const ServerConfig& record, uint64_t sequence, std::thread previous);

    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    ServerConfigStore& store_;
    TierList tiers_;
    DiscoveryTimeouts timeouts_;
    const CapabilityProber* prober_;
    std::string log_level_;

    mutable std::mutex mutex_;
    DiscoveryState state_ = state::Idle{};
    double progress_ = 0.0;
    bool session_active_ = false;
    uint64_t generation_ = 0;
    std::shared_ptr<CancellationToken> token_;
    DiscoveryTierProbe* active_tier_ = nullptr;
    std::shared_future<DiscoveryResult> session_future_;
    std::thread session_thread_;
    std::optional<DiscoveredServer> connected_;
    std::vector<DiscoveredServer> discovered_;
    std::optional<ServerCapabilities> capabilities_;
    std::vector<std::weak_ptr<DiscoveryEventChannel>> subscribers_;

    uint64_t enrichment_sequence_ = 0;  // Guarded by mutex_

    // Each enrichment thread joins the one it replaced before exiting
    std::mutex enrichment_mutex_;
    std::thread enrichment_thread_;
};

} // namespace lodestar
