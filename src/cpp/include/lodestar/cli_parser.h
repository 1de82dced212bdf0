#pragma once

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace lodestar {

struct AppConfig {
    std::string command;
    std::string log_level = "info";
    std::string store_path = "";  // Empty means the per-user default
    bool json_output = false;

    // Discovery tier timeouts
    int cached_timeout_ms = 2000;
    int advertisement_timeout_ms = 3000;
    int peer_timeout_ms = 3000;
    int subnet_timeout_ms = 5000;

    // Endpoint sweep used by the peer and subnet tiers
    std::vector<int> service_ports = {11400, 8766, 11434};
    int sweep_parallelism = 64;
    int sweep_connect_timeout_ms = 300;
    int beacon_port = 11410;

    // Health monitoring
    int health_interval_s = 30;
    int health_timeout_ms = 5000;

    // Capability probing
    int management_port = 8766;
    int model_runtime_port = 11434;
    int piper_port = 11402;
    int vibevoice_port = 8880;
    int prober_timeout_ms = 5000;
    bool no_enrich = false;

    // Subcommand arguments
    std::string host;
    int port = 0;  // 0 means the default port for the server type
    std::string name;
    std::string server_type = "gateway";
    std::string server_id;
    std::string payload;
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    AppConfig get_config() const { return config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

private:
    CLI::App app_;
    AppConfig config_;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace lodestar
