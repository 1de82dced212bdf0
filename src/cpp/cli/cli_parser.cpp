#include <lodestar/cli_parser.h>
#include <lodestar/version.h>
#include <iostream>

#define APP_NAME "lodestar"
#define APP_DESC APP_NAME " - Find and manage companion servers on the local network"

#define CONNECT_FOOTER "Examples:\n" \
    "  # Connect to the gateway on its default port\n" \
    "  lodestar connect 192.168.1.20\n\n" \
    "  # Connect to a server on a custom port and name it\n" \
    "  lodestar connect lab-pc.local --port 8080 --name \"Lab PC\""

#define QR_FOOTER "Accepted payloads:\n" \
    "  host=192.168.1.10;port=11400;name=Lab PC\n" \
    "  {\"host\": \"192.168.1.10\", \"port\": 11400}"

namespace lodestar {

static void add_global_options(CLI::App& app, AppConfig& config) {
    app.add_option("--log-level", config.log_level, "Log level")
        ->envname("LODESTAR_LOG_LEVEL")
        ->type_name("LEVEL")
        ->check(CLI::IsMember({"critical", "error", "warning", "info", "debug", "trace"}))
        ->default_val(config.log_level);

    app.add_option("--store", config.store_path, "Path of the saved server list")
        ->envname("LODESTAR_STORE")
        ->type_name("PATH");

    app.add_flag("--json", config.json_output, "Print results as JSON");
}

static void add_discovery_options(CLI::App& app, AppConfig& config) {
    app.add_option("--cached-timeout", config.cached_timeout_ms,
                   "Timeout for reconnecting to the last server (ms)")
        ->envname("LODESTAR_CACHED_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.cached_timeout_ms);

    app.add_option("--advertisement-timeout", config.advertisement_timeout_ms,
                   "How long to listen for server beacons (ms)")
        ->envname("LODESTAR_ADVERTISEMENT_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.advertisement_timeout_ms);

    app.add_option("--peer-timeout", config.peer_timeout_ms,
                   "Timeout for probing known nearby devices (ms)")
        ->envname("LODESTAR_PEER_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.peer_timeout_ms);

    app.add_option("--subnet-timeout", config.subnet_timeout_ms,
                   "Timeout for scanning the local subnet (ms)")
        ->envname("LODESTAR_SUBNET_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.subnet_timeout_ms);

    app.add_option("--service-ports", config.service_ports,
                   "Ports probed on every candidate host during network scans")
        ->envname("LODESTAR_SERVICE_PORTS")
        ->type_name("PORT,...")
        ->delimiter(',')
        ->check(CLI::Range(1, 65535));

    app.add_option("--beacon-port", config.beacon_port, "UDP port servers announce themselves on")
        ->envname("LODESTAR_BEACON_PORT")
        ->type_name("PORT")
        ->check(CLI::Range(1, 65535))
        ->default_val(config.beacon_port);

    app.add_option("--scan-parallelism", config.sweep_parallelism,
                   "Maximum concurrent connections during network scans")
        ->envname("LODESTAR_SCAN_PARALLELISM")
        ->type_name("N")
        ->check(CLI::Range(1, 1024))
        ->default_val(config.sweep_parallelism);

    app.add_option("--scan-connect-timeout", config.sweep_connect_timeout_ms,
                   "Connect timeout per endpoint during network scans (ms)")
        ->envname("LODESTAR_SCAN_CONNECT_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.sweep_connect_timeout_ms);
}

static void add_health_options(CLI::App& app, AppConfig& config) {
    app.add_option("--health-interval", config.health_interval_s, "Seconds between health checks")
        ->envname("LODESTAR_HEALTH_INTERVAL")
        ->type_name("SECONDS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.health_interval_s);

    app.add_option("--health-timeout", config.health_timeout_ms, "Timeout for one health probe (ms)")
        ->envname("LODESTAR_HEALTH_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.health_timeout_ms);
}

static void add_prober_options(CLI::App& app, AppConfig& config) {
    app.add_option("--management-port", config.management_port, "Port of the management surface")
        ->envname("LODESTAR_MANAGEMENT_PORT")
        ->type_name("PORT")
        ->check(CLI::Range(1, 65535))
        ->default_val(config.management_port);

    app.add_option("--model-runtime-port", config.model_runtime_port, "Port of the model runtime")
        ->envname("LODESTAR_MODEL_RUNTIME_PORT")
        ->type_name("PORT")
        ->check(CLI::Range(1, 65535))
        ->default_val(config.model_runtime_port);

    app.add_option("--piper-port", config.piper_port, "Port of a Piper voice server")
        ->envname("LODESTAR_PIPER_PORT")
        ->type_name("PORT")
        ->check(CLI::Range(1, 65535))
        ->default_val(config.piper_port);

    app.add_option("--vibevoice-port", config.vibevoice_port, "Port of a VibeVoice voice server")
        ->envname("LODESTAR_VIBEVOICE_PORT")
        ->type_name("PORT")
        ->check(CLI::Range(1, 65535))
        ->default_val(config.vibevoice_port);

    app.add_option("--probe-timeout", config.prober_timeout_ms,
                   "Timeout for each capability probe attempt (ms)")
        ->envname("LODESTAR_PROBE_TIMEOUT")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.prober_timeout_ms);

    app.add_flag("--no-enrich", config.no_enrich, "Do not probe capabilities after connecting")
        ->envname("LODESTAR_NO_ENRICH");
}

CLIParser::CLIParser()
    : app_(APP_DESC) {

    app_.set_version_flag("-v,--version", (APP_NAME " version " LODESTAR_VERSION_STRING));
    app_.require_subcommand(1);
    app_.set_help_all_flag("--help-all", "Print help for all commands");
    app_.fallthrough();

    add_global_options(app_, config_);
    add_discovery_options(app_, config_);
    add_health_options(app_, config_);
    add_prober_options(app_, config_);

    // Discover
    app_.add_subcommand("discover", "Search the local network for a server and connect to it");

    // Connect
    CLI::App* connect = app_.add_subcommand("connect", "Connect to a server by address");
    connect->add_option("host", config_.host, "Host name or IP address")->required();
    connect->add_option("--port", config_.port, "Server port (default 11400)")
        ->type_name("PORT");
    connect->add_option("--name", config_.name, "Display name")
        ->type_name("NAME");
    connect->footer(CONNECT_FOOTER);

    // QR
    CLI::App* qr = app_.add_subcommand("qr", "Connect using the text of a pairing QR code");
    qr->add_option("payload", config_.payload, "Decoded QR code text")->required();
    qr->footer(QR_FOOTER);

    // List
    app_.add_subcommand("list", "List saved servers");

    // Add
    CLI::App* add = app_.add_subcommand("add", "Save a server without connecting to it");
    add->add_option("host", config_.host, "Host name or IP address")->required();
    add->add_option("--port", config_.port, "Server port (default depends on --type)")
        ->type_name("PORT");
    add->add_option("--type", config_.server_type, "Server type")
        ->type_name("TYPE")
        ->check(CLI::IsMember({"gateway", "ollama", "whisper", "piper", "vibevoice",
                               "llama.cpp", "vllm", "custom"}))
        ->default_val(config_.server_type);
    add->add_option("--name", config_.name, "Display name")
        ->type_name("NAME");

    // Remove / enable / disable
    CLI::App* remove = app_.add_subcommand("remove", "Remove a saved server");
    remove->add_option("id", config_.server_id, "Server id")->required();

    CLI::App* enable = app_.add_subcommand("enable", "Include a server in health checks");
    enable->add_option("id", config_.server_id, "Server id")->required();

    CLI::App* disable = app_.add_subcommand("disable", "Exclude a server from health checks");
    disable->add_option("id", config_.server_id, "Server id")->required();

    // Primary
    CLI::App* primary = app_.add_subcommand("primary", "Show or set the primary server");
    primary->add_option("id", config_.server_id, "Server id to make primary");

    // Health
    app_.add_subcommand("health", "Check the health of every enabled server once");

    // Monitor
    app_.add_subcommand("monitor", "Keep checking server health until interrupted");

    // Probe
    CLI::App* probe = app_.add_subcommand("probe", "Show which models and voices a host offers");
    probe->add_option("host", config_.host, "Host name or IP address")->required();

    // Clear cache
    app_.add_subcommand("clear-cache", "Forget the last connected server");
}

int CLIParser::parse(int argc, char** argv) {
    try {
        // Show help if no arguments provided
        if (argc == 1) {
            throw CLI::CallForHelp();
        }
        app_.parse(argc, argv);

        config_.command = app_.get_subcommands().at(0)->get_name();
        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;  // Don't continue, just exit
        return exit_code_;
    }
}

} // namespace lodestar
