#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "server_config_store.h"

namespace lodestar {

struct HealthMonitorOptions {
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds probe_timeout{5000};
};

// Keeps health_status current for every enabled server in the store.
//
// Each cycle probes all enabled servers concurrently, one thread per server,
// so a server that times out never delays the others. Results are written
// back through the store one record at a time. A cycle requested while
// another is still running is dropped.
class HealthMonitor {
public:
    using StatusCallback = std::function<void(const ServerConfig&)>;

    HealthMonitor(ServerConfigStore& store,
                  HealthMonitorOptions options = HealthMonitorOptions(),
                  const std::string& log_level = "info");
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Periodic loop on a background thread. The first cycle runs immediately.
    void start();
    // Wakes the loop and waits for the current cycle to finish
    void stop();
    bool is_running() const { return running_.load(); }

    // One full cycle on the calling thread. Returns false if a cycle was
    // already running and this one was suppressed.
    bool run_cycle();

    // Probe a single server now. Throws ServerNotFoundException.
    ServerHealthStatus check_server(const std::string& id);

    // Called after a probe changes a server's status
    void set_status_callback(StatusCallback callback);

    size_t cycles_completed() const { return cycles_completed_.load(); }

    // 200 on the type's liveness path (or on "/") is healthy, any other HTTP
    // answer is degraded, no answer at all is unhealthy.
    static ServerHealthStatus classify(const ServerConfig& server, std::chrono::milliseconds timeout);

private:
    void loop();
    void check_and_record(const ServerConfig& server);
    void record(const std::string& id, ServerHealthStatus previous, ServerHealthStatus status);
    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    ServerConfigStore& store_;
    HealthMonitorOptions options_;
    std::string log_level_;

    std::atomic<bool> cycle_running_{false};
    std::atomic<size_t> cycles_completed_{0};

    std::mutex callback_mutex_;
    StatusCallback status_callback_;

    std::thread loop_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
};

} // namespace lodestar
