#include "lodestar/health_monitor.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/http_client.h"
#include <iostream>
#include <vector>

using namespace lodestar::utils;

#define DEBUG_LOG(monitor, msg) \
    if ((monitor)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {

// Generic path tried when the type-specific one does not answer 200
static const char* FALLBACK_HEALTH_PATH = "/";

HealthMonitor::HealthMonitor(ServerConfigStore& store, HealthMonitorOptions options,
                             const std::string& log_level)
    : store_(store), options_(options), log_level_(log_level) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = false;
    }

    std::cout << "[HealthMonitor] Checking servers every "
              << options_.interval.count() / 1000.0 << "s" << std::endl;
    loop_thread_ = std::thread(&HealthMonitor::loop, this);
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    running_ = false;
}

void HealthMonitor::loop() {
    while (true) {
        run_cycle();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        if (loop_cv_.wait_for(lock, options_.interval, [this] { return stop_requested_; })) {
            break;
        }
    }
    DEBUG_LOG(this, "[HealthMonitor] Loop stopped");
}

void HealthMonitor::set_status_callback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

ServerHealthStatus HealthMonitor::classify(const ServerConfig& server, std::chrono::milliseconds timeout) {
    auto started = std::chrono::steady_clock::now();

    HttpResponse response;
    try {
        response = HttpClient::get(server.host, server.port,
                                   server_type_health_path(server.server_type), timeout);
    } catch (const NetworkException&) {
        return ServerHealthStatus::UNHEALTHY;
    }

    if (response.status == 200) {
        return ServerHealthStatus::HEALTHY;
    }

    // The host answered, so it is at least degraded. Some backends have no
    // dedicated health route; give the root path the remaining budget.
    auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (remaining.count() <= 0) {
        return ServerHealthStatus::DEGRADED;
    }

    try {
        HttpResponse fallback = HttpClient::get(server.host, server.port, FALLBACK_HEALTH_PATH, remaining);
        if (fallback.status == 200) {
            return ServerHealthStatus::HEALTHY;
        }
    } catch (const NetworkException&) {
        // Root path unreachable after the first answer; still degraded
    }
    return ServerHealthStatus::DEGRADED;
}

void HealthMonitor::record(const std::string& id, ServerHealthStatus previous, ServerHealthStatus status) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    ServerConfig updated = store_.update_with(id, [&](ServerConfig& s) {
        s.health_status = status;
        s.last_health_check = static_cast<int64_t>(now);
    });

    if (previous == status) {
        return;
    }

    DEBUG_LOG(this, "[HealthMonitor] " << updated.name << ": " << health_status_to_string(previous)
              << " -> " << health_status_to_string(status));

    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = status_callback_;
    }
    if (callback) {
        callback(updated);
    }
}

void HealthMonitor::check_and_record(const ServerConfig& server) {
    try {
        store_.update_with(server.id, [](ServerConfig& s) {
            s.health_status = ServerHealthStatus::CHECKING;
        });

        ServerHealthStatus status = classify(server, options_.probe_timeout);
        record(server.id, server.health_status, status);
    } catch (const ServerNotFoundException&) {
        // Removed while its probe was in flight
        DEBUG_LOG(this, "[HealthMonitor] " << server.name << " was removed during its check");
    } catch (const std::exception& e) {
        std::cerr << "[HealthMonitor] Failed to record health of " << server.name
                  << ": " << e.what() << std::endl;
    }
}

bool HealthMonitor::run_cycle() {
    bool expected = false;
    if (!cycle_running_.compare_exchange_strong(expected, true)) {
        DEBUG_LOG(this, "[HealthMonitor] Cycle already running, skipping");
        return false;
    }

    struct CycleGuard {
        std::atomic<bool>& flag;
        ~CycleGuard() { flag = false; }
    } guard{cycle_running_};

    std::vector<ServerConfig> servers = store_.enabled_servers();
    DEBUG_LOG(this, "[HealthMonitor] Checking " << servers.size() << " server(s)");

    std::vector<std::thread> workers;
    workers.reserve(servers.size());
    for (const auto& server : servers) {
        workers.emplace_back(&HealthMonitor::check_and_record, this, server);
    }
    for (auto& t : workers) {
        t.join();
    }

    cycles_completed_++;
    return true;
}

ServerHealthStatus HealthMonitor::check_server(const std::string& id) {
    auto server = store_.get(id);
    if (!server) {
        throw ServerNotFoundException(id);
    }

    ServerHealthStatus status = classify(*server, options_.probe_timeout);
    record(id, server->health_status, status);
    return status;
}

} // namespace lodestar
