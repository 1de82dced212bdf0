#pragma once

#include <atomic>
#include <memory>
#include "capability_prober.h"
#include "cli_parser.h"
#include "discovery_coordinator.h"
#include "health_monitor.h"
#include "server_config_store.h"

namespace lodestar {

// Owns one of each component for the lifetime of a command and runs it
class Application {
public:
    // `stop_flag` is raised by the signal handler; long-running commands poll it
    Application(const AppConfig& config, const std::atomic<bool>& stop_flag);

    // Returns the process exit code
    int run();

private:
    int cmd_discover();
    int cmd_connect();
    int cmd_qr();
    int cmd_list();
    int cmd_add();
    int cmd_remove();
    int cmd_set_enabled(bool enabled);
    int cmd_primary();
    int cmd_health();
    int cmd_monitor();
    int cmd_probe();
    int cmd_clear_cache();

    void print_connected(const DiscoveredServer& server);
    void print_servers(const std::vector<ServerConfig>& servers);

    AppConfig config_;
    const std::atomic<bool>& stop_flag_;

    std::unique_ptr<ServerConfigStore> store_;
    std::unique_ptr<CapabilityProber> prober_;
    std::unique_ptr<HealthMonitor> monitor_;
    std::unique_ptr<DiscoveryCoordinator> coordinator_;
};

} // namespace lodestar
