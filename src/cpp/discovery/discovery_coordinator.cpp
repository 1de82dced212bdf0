#include "lodestar/discovery_coordinator.h"
#include "lodestar/error_types.h"
#include "lodestar/qr_payload.h"
#include "lodestar/tiers/advertisement_tier.h"
#include "lodestar/tiers/cached_tier.h"
#include "lodestar/tiers/peer_tier.h"
#include "lodestar/tiers/subnet_scan_tier.h"
#include <algorithm>
#include <iostream>

#define DEBUG_LOG(coord, msg) \
    if ((coord)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {

// Name given to servers configured without one
static const char* DEFAULT_SERVER_NAME = "Companion Server";

std::chrono::milliseconds DiscoveryTimeouts::for_tier(DiscoveryTier tier) const {
    switch (tier) {
        case DiscoveryTier::CACHED: return cached;
        case DiscoveryTier::LOCAL_ADVERTISEMENT: return local_advertisement;
        case DiscoveryTier::PEER_TRANSPORT: return peer_transport;
        case DiscoveryTier::SUBNET_SCAN: return subnet_scan;
    }
    return subnet_scan;
}

TierList make_default_tiers(const ServerConfigStore& store, const TierSettings& settings,
                            const std::string& log_level) {
    std::vector<uint16_t> ports = settings.service_ports.empty()
        ? tiers::default_service_ports()
        : settings.service_ports;

    TierList list;
    list.push_back(std::make_unique<tiers::CachedTier>(store, log_level));
    list.push_back(std::make_unique<tiers::AdvertisementTier>(settings.beacon_port, log_level));
    list.push_back(std::make_unique<tiers::PeerTier>(ports, settings.sweep, log_level));
    list.push_back(std::make_unique<tiers::SubnetScanTier>(ports, settings.sweep, log_level));
    return list;
}

DiscoveryCoordinator::DiscoveryCoordinator(ServerConfigStore& store,
                                           TierList tiers,
                                           DiscoveryTimeouts timeouts,
                                           const CapabilityProber* prober,
                                           const std::string& log_level)
    : store_(store),
      tiers_(std::move(tiers)),
      timeouts_(timeouts),
      prober_(prober),
      log_level_(log_level) {
    tiers_.erase(std::remove(tiers_.begin(), tiers_.end(), nullptr), tiers_.end());

    // Fallback order is the tier order, whatever order they were handed in
    std::stable_sort(tiers_.begin(), tiers_.end(),
                     [](const std::unique_ptr<DiscoveryTierProbe>& a,
                        const std::unique_ptr<DiscoveryTierProbe>& b) {
                         return a->tier() < b->tier();
                     });
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    cancel();

    std::thread session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(session_thread_);
    }
    if (session.joinable()) {
        session.join();
    }

    wait_for_enrichment();
}

std::shared_future<DiscoveryResult> DiscoveryCoordinator::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (session_active_) {
        DEBUG_LOG(this, "[DiscoveryCoordinator] Discovery already in progress, joining it");
        return session_future_;
    }

    uint64_t generation = ++generation_;
    auto token = std::make_shared<CancellationToken>();
    auto promise = std::make_shared<std::promise<DiscoveryResult>>();

    token_ = token;
    session_future_ = promise->get_future().share();
    session_active_ = true;
    active_tier_ = nullptr;
    discovered_.clear();

    std::cout << "[DiscoveryCoordinator] Starting discovery (" << tiers_.size() << " tier(s))" << std::endl;
    publish_locked(state::Discovering{}, 0.0);

    // The new session joins the one it replaces before touching any tier
    std::thread previous = std::move(session_thread_);
    session_thread_ = std::thread(&DiscoveryCoordinator::run_session, this,
                                  generation, token, promise, std::move(previous));
    return session_future_;
}

DiscoveryResult DiscoveryCoordinator::discover() {
    return start().get();
}

void DiscoveryCoordinator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || !token_) {
        return;
    }

    std::cout << "[DiscoveryCoordinator] Cancelling discovery" << std::endl;
    token_->cancel();
    if (active_tier_) {
        active_tier_->cancel();
    }
}

std::shared_future<DiscoveryResult> DiscoveryCoordinator::retry() {
    std::shared_future<DiscoveryResult> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_active_) {
            running = session_future_;
        }
    }

    cancel();
    if (running.valid()) {
        running.wait();
    }
    return start();
}

void DiscoveryCoordinator::clear_cache() {
    std::shared_future<DiscoveryResult> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_active_) {
            running = session_future_;
        }
    }

    cancel();
    if (running.valid()) {
        running.wait();
    }

    store_.clear_primary();

    std::lock_guard<std::mutex> lock(mutex_);
    connected_.reset();
    discovered_.clear();
    capabilities_.reset();
    ++enrichment_sequence_;
    publish_locked(state::Idle{}, 0.0);
    std::cout << "[DiscoveryCoordinator] Cached server cleared" << std::endl;
}

void DiscoveryCoordinator::run_session(uint64_t generation,
                                       std::shared_ptr<CancellationToken> token,
                                       std::shared_ptr<std::promise<DiscoveryResult>> promise,
                                       std::thread previous) {
    if (previous.joinable()) {
        previous.join();
    }

    DiscoveryResult result = execute_session(generation, *token);

    std::optional<ServerConfig> record;
    if (result) {
        record = save_connection(*result);
    }
    promise->set_value(result);

    // Enrichment never delays the session result
    if (record) {
        start_enrichment(*record);
    }
}

DiscoveryResult DiscoveryCoordinator::execute_session(uint64_t generation, const CancellationToken& token) {
    const size_t total = tiers_.size();

    for (size_t index = 0; index < total; ++index) {
        if (token.cancelled()) {
            break;
        }

        DiscoveryTierProbe* tier = tiers_[index].get();
        double progress = static_cast<double>(index) / static_cast<double>(total);
        if (!publish(generation, state::TryingTier{tier->tier()}, progress, tier)) {
            return std::nullopt;
        }

        std::cout << "[DiscoveryCoordinator] Trying tier: " << tier->name() << std::endl;

        std::optional<DiscoveredServer> found;
        try {
            found = tier->discover(timeouts_.for_tier(tier->tier()), token);
        } catch (const TransientNetworkException& e) {
            DEBUG_LOG(this, "[DiscoveryCoordinator] " << tier->name() << " found nothing: " << e.what());
        } catch (const LodestarException& e) {
            std::cerr << "[DiscoveryCoordinator] " << tier->name() << " failed: " << e.what() << std::endl;
            finish(generation, state::Failed{e.what()}, progress);
            return std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[DiscoveryCoordinator] " << tier->name() << " failed: " << e.what() << std::endl;
            finish(generation,
                   state::Failed{"Discovery stopped unexpectedly during the " + tier->name() +
                                 " step. Check the server and try again."},
                   progress);
            return std::nullopt;
        }

        if (token.cancelled()) {
            break;
        }

        if (found) {
            DiscoveredServer server = found->relabel(to_discovery_method(tier->tier()));
            std::cout << "[DiscoveryCoordinator] Connected to " << server.name()
                      << " at " << server.endpoint() << " via " << tier->name() << std::endl;
            if (!finish(generation, state::Connected{server}, 1.0)) {
                return std::nullopt;
            }
            return server;
        }

        DEBUG_LOG(this, "[DiscoveryCoordinator] " << tier->name() << " found nothing");
    }

    if (token.cancelled()) {
        finish(generation, state::Idle{}, 0.0);
        std::cout << "[DiscoveryCoordinator] Discovery cancelled" << std::endl;
        return std::nullopt;
    }

    std::cout << "[DiscoveryCoordinator] No server found, manual configuration required" << std::endl;
    finish(generation, state::ManualConfigRequired{}, 1.0);
    return std::nullopt;
}

bool DiscoveryCoordinator::publish(uint64_t generation, DiscoveryState next, double progress,
                                   DiscoveryTierProbe* active_tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || !session_active_) {
        DEBUG_LOG(this, "[DiscoveryCoordinator] Dropping state change from a superseded session");
        return false;
    }
    active_tier_ = active_tier;
    publish_locked(std::move(next), progress);
    return true;
}

bool DiscoveryCoordinator::finish(uint64_t generation, DiscoveryState next, double progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || !session_active_) {
        DEBUG_LOG(this, "[DiscoveryCoordinator] Dropping result of a superseded session");
        return false;
    }

    if (auto* connected = std::get_if<state::Connected>(&next)) {
        connected_ = connected->server;
        discovered_.push_back(connected->server);
    }

    session_active_ = false;
    active_tier_ = nullptr;
    publish_locked(std::move(next), progress);
    return true;
}

void DiscoveryCoordinator::publish_locked(DiscoveryState next, double progress) {
    state_ = std::move(next);
    progress_ = progress;

    DiscoveryEvent event{state_, progress_};
    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
        auto channel = it->lock();
        if (!channel || !channel->push(event)) {
            it = subscribers_.erase(it);
        } else {
            ++it;
        }
    }
}

void DiscoveryCoordinator::supersede_session_locked() {
    ++generation_;
    if (!session_active_) {
        return;
    }

    std::cout << "[DiscoveryCoordinator] Running discovery superseded by manual configuration" << std::endl;
    if (token_) {
        token_->cancel();
    }
    if (active_tier_) {
        active_tier_->cancel();
    }
    session_active_ = false;
    active_tier_ = nullptr;
}

DiscoveredServer DiscoveryCoordinator::connect_out_of_band(const DiscoveredServer& server) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        supersede_session_locked();
        connected_ = server;
        discovered_.push_back(server);
        publish_locked(state::Connected{server}, 1.0);
    }

    std::cout << "[DiscoveryCoordinator] Configured " << server.name() << " at " << server.endpoint()
              << " (" << discovery_method_to_string(server.discovery_method()) << ")" << std::endl;
    auto record = save_connection(server);
    if (record) {
        start_enrichment(*record);
    }
    return server;
}

std::optional<DiscoveredServer> DiscoveryCoordinator::configure_from_qr_code(const std::string& payload) {
    auto parsed = parse_qr_payload(payload);
    if (!parsed) {
        DEBUG_LOG(this, "[DiscoveryCoordinator] Ignoring QR code without host and port");
        return std::nullopt;
    }

    std::string name = parsed->name.empty() ? DEFAULT_SERVER_NAME : parsed->name;
    return connect_out_of_band(DiscoveredServer(name, parsed->host, parsed->port, DiscoveryMethod::QR_CODE));
}

DiscoveredServer DiscoveryCoordinator::configure_manually(const std::string& host, int port,
                                                          const std::string& name) {
    uint16_t valid_port = validate_endpoint(host, port);
    return connect_out_of_band(DiscoveredServer(name.empty() ? DEFAULT_SERVER_NAME : name,
                                                host, valid_port, DiscoveryMethod::MANUAL));
}

std::optional<ServerConfig> DiscoveryCoordinator::save_connection(const DiscoveredServer& server) {
    try {
        return store_.remember_connection(server);
    } catch (const std::exception& e) {
        std::cerr << "[DiscoveryCoordinator] Could not save connection to " << server.endpoint()
                  << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

void DiscoveryCoordinator::start_enrichment(const ServerConfig& record) {
    if (prober_ == nullptr) {
        return;
    }

    uint64_t sequence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequence = ++enrichment_sequence_;
    }

    std::lock_guard<std::mutex> lock(enrichment_mutex_);
    std::thread previous = std::move(enrichment_thread_);
    enrichment_thread_ = std::thread(&DiscoveryCoordinator::enrich, this, record, sequence, std::move(previous));
}

void DiscoveryCoordinator::enrich(const ServerConfig& record, uint64_t sequence, std::thread previous) {
    ServerCapabilities caps = prober_->probe(record.host);

    bool latest;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest = sequence == enrichment_sequence_;
        if (latest) {
            capabilities_ = caps;
        }
    }

    if (!latest) {
        DEBUG_LOG(this, "[DiscoveryCoordinator] Dropping stale capabilities of " << record.name);
    } else {
        try {
            store_.update_with(record.id, [&caps](ServerConfig& s) { apply_capabilities(s, caps); });
        } catch (const ServerNotFoundException&) {
            DEBUG_LOG(this, "[DiscoveryCoordinator] " << record.name << " was removed before enrichment finished");
        } catch (const std::exception& e) {
            std::cerr << "[DiscoveryCoordinator] Could not save capabilities of " << record.name
                      << ": " << e.what() << std::endl;
        }
    }

    if (previous.joinable()) {
        previous.join();
    }
}

void DiscoveryCoordinator::wait_for_enrichment() {
    std::thread pending;
    {
        std::lock_guard<std::mutex> lock(enrichment_mutex_);
        pending = std::move(enrichment_thread_);
    }
    if (pending.joinable()) {
        pending.join();
    }
}

std::shared_ptr<DiscoveryEventChannel> DiscoveryCoordinator::subscribe() {
    auto channel = std::make_shared<DiscoveryEventChannel>();
    std::lock_guard<std::mutex> lock(mutex_);
    channel->push(DiscoveryEvent{state_, progress_});
    subscribers_.push_back(channel);
    return channel;
}

DiscoveryState DiscoveryCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

double DiscoveryCoordinator::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::optional<DiscoveryTier> DiscoveryCoordinator::current_tier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* trying = std::get_if<state::TryingTier>(&state_)) {
        return trying->tier;
    }
    return std::nullopt;
}

bool DiscoveryCoordinator::is_discovering() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_active_;
}

std::vector<DiscoveredServer> DiscoveryCoordinator::discovered_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discovered_;
}

std::optional<DiscoveredServer> DiscoveryCoordinator::connected_server() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

std::optional<ServerCapabilities> DiscoveryCoordinator::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

} // namespace lodestar
