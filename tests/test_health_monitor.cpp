#include <atomic>
#include <iostream>
#include <string>
#include <thread>

#include <lodestar/error_types.h>
#include <lodestar/health_monitor.h>
#include "test_support.h"

using namespace lodestar;
using lodestar_test::expect;

static ServerConfig local_server(const std::string& name, int port, ServerType type = ServerType::GATEWAY) {
    ServerConfig config;
    config.name = name;
    config.host = "127.0.0.1";
    config.port = static_cast<uint16_t>(port);
    config.server_type = type;
    return config;
}

static ServerHealthStatus status_of(const ServerConfigStore& store, const std::string& id) {
    auto server = store.get(id);
    return server ? server->health_status : ServerHealthStatus::UNKNOWN;
}

int main() {
    int failures = 0;

    lodestar_test::LoopbackServer slow;
    slow.routes().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        res.set_content("ok", "text/plain");
    });

    lodestar_test::LoopbackServer fast;
    fast.routes().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });

    lodestar_test::LoopbackServer busy;
    busy.routes().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
    });
    busy.routes().Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
    });

    // No /health route, but the root answers
    lodestar_test::LoopbackServer rooted;
    rooted.routes().Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("hello", "text/plain");
    });

    // Ollama answers its version endpoint instead of /health
    lodestar_test::LoopbackServer runtime;
    runtime.routes().Get("/api/version", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"version": "0.5.1"})", "application/json");
    });

    lodestar_test::LoopbackServer gone;
    int gone_port = gone.start();
    gone.stop();

    int slow_port = slow.start();
    int fast_port = fast.start();
    int busy_port = busy.start();
    int rooted_port = rooted.start();
    int runtime_port = runtime.start();
    if (!expect(slow_port > 0 && fast_port > 0 && busy_port > 0 && rooted_port > 0 && runtime_port > 0 && gone_port > 0,
                "loopback servers started", failures)) {
        return lodestar_test::finish("health monitor", failures);
    }

    HealthMonitorOptions options;
    options.interval = std::chrono::milliseconds(200);
    options.probe_timeout = std::chrono::milliseconds(3000);

    // Test 1: classification
    {
        std::cout << "[TEST] Classification\n";
        auto timeout = std::chrono::milliseconds(2000);
        expect(HealthMonitor::classify(local_server("fast", fast_port), timeout) == ServerHealthStatus::HEALTHY,
               "200 is healthy", failures);
        expect(HealthMonitor::classify(local_server("busy", busy_port), timeout) == ServerHealthStatus::DEGRADED,
               "503 is degraded", failures);
        expect(HealthMonitor::classify(local_server("rooted", rooted_port), timeout) == ServerHealthStatus::HEALTHY,
               "root path fallback is healthy", failures);
        expect(HealthMonitor::classify(local_server("gone", gone_port), timeout) == ServerHealthStatus::UNHEALTHY,
               "no answer is unhealthy", failures);
        expect(HealthMonitor::classify(local_server("runtime", runtime_port, ServerType::OLLAMA), timeout) ==
               ServerHealthStatus::HEALTHY, "runtime checked on its version endpoint", failures);
        expect(HealthMonitor::classify(local_server("slow", slow_port), std::chrono::milliseconds(300)) ==
               ServerHealthStatus::UNHEALTHY, "timeout is unhealthy", failures);

#ifndef _WIN32
        lodestar_test::TrickleServer trickle;
        int trickle_port = trickle.start();
        if (expect(trickle_port > 0, "trickle server started", failures)) {
            auto began = std::chrono::steady_clock::now();
            expect(HealthMonitor::classify(local_server("trickle", trickle_port), std::chrono::milliseconds(500)) ==
                   ServerHealthStatus::UNHEALTHY, "answer that never completes is unhealthy", failures);
            expect(std::chrono::steady_clock::now() - began < std::chrono::milliseconds(2000),
                   "check bounded by its timeout", failures);
        }
#endif
    }

    // Test 2: a slow server does not hold up the others
    {
        std::cout << "[TEST] Concurrent probes\n";
        ServerConfigStore store;
        ServerConfig a = store.add(local_server("slow", slow_port));
        ServerConfig b = store.add(local_server("fast", fast_port));
        ServerConfig c = store.add(local_server("busy", busy_port));

        HealthMonitor monitor(store, options);
        std::thread cycle([&monitor] { monitor.run_cycle(); });

        bool others_done = lodestar_test::wait_until([&] {
            return status_of(store, b.id) == ServerHealthStatus::HEALTHY &&
                   status_of(store, c.id) == ServerHealthStatus::DEGRADED;
        }, std::chrono::milliseconds(1000));
        expect(others_done, "fast servers classified within a second", failures);
        expect(status_of(store, a.id) == ServerHealthStatus::CHECKING, "slow server still checking", failures);

        // Test 3: overlapping cycles are dropped
        expect(!monitor.run_cycle(), "second cycle suppressed while one is running", failures);

        cycle.join();
        expect(status_of(store, a.id) == ServerHealthStatus::HEALTHY, "slow server healthy once it answers", failures);
        expect(monitor.cycles_completed() == 1, "exactly one cycle completed", failures);
        auto record = store.get(a.id);
        expect(record && record->last_health_check.has_value(), "check time recorded", failures);
    }

    // Test 4: callbacks fire on change only, disabled servers are skipped
    {
        std::cout << "[TEST] Status callbacks\n";
        ServerConfigStore store;
        ServerConfig up = store.add(local_server("fast", fast_port));
        ServerConfig down = store.add(local_server("gone", gone_port));
        ServerConfig off = store.add(local_server("busy", busy_port));
        store.set_enabled(off.id, false);

        HealthMonitor monitor(store, options);
        std::atomic<int> changes{0};
        monitor.set_status_callback([&changes](const ServerConfig&) { changes++; });

        monitor.run_cycle();
        expect(changes == 2, "each enabled server changed once", failures);
        expect(status_of(store, down.id) == ServerHealthStatus::UNHEALTHY, "unreachable server unhealthy", failures);
        expect(status_of(store, off.id) == ServerHealthStatus::UNKNOWN, "disabled server untouched", failures);

        monitor.run_cycle();
        expect(changes == 2, "no callback when nothing changed", failures);
        expect(status_of(store, up.id) == ServerHealthStatus::HEALTHY, "status stays healthy", failures);
    }

    // Test 5: single server checks
    {
        std::cout << "[TEST] Single server check\n";
        ServerConfigStore store;
        ServerConfig server = store.add(local_server("busy", busy_port));
        HealthMonitor monitor(store, options);

        expect(monitor.check_server(server.id) == ServerHealthStatus::DEGRADED, "checked on demand", failures);
        expect(status_of(store, server.id) == ServerHealthStatus::DEGRADED, "result recorded", failures);

        bool threw = false;
        try {
            monitor.check_server("missing");
        } catch (const ServerNotFoundException&) {
            threw = true;
        }
        expect(threw, "unknown id throws", failures);
    }

    // Test 6: the periodic loop
    {
        std::cout << "[TEST] Periodic loop\n";
        ServerConfigStore store;
        store.add(local_server("fast", fast_port));
        HealthMonitor monitor(store, options);

        monitor.start();
        expect(monitor.is_running(), "loop running", failures);
        bool repeated = lodestar_test::wait_until([&monitor] { return monitor.cycles_completed() >= 3; },
                                                  std::chrono::seconds(5));
        expect(repeated, "cycles repeat on the interval", failures);

        auto began = std::chrono::steady_clock::now();
        monitor.stop();
        expect(!monitor.is_running(), "loop stopped", failures);
        expect(std::chrono::steady_clock::now() - began < std::chrono::seconds(4), "stop wakes the loop", failures);
    }

    return lodestar_test::finish("health monitor", failures);
}
