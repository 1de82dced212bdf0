#include <lodestar/application.h>
#include <lodestar/error_types.h>
#include <lodestar/qr_payload.h>
#include <lodestar/utils/path_utils.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace lodestar {

static std::chrono::milliseconds ms(int value) {
    return std::chrono::milliseconds(value);
}

static std::string format_last_check(const std::optional<int64_t>& timestamp) {
    if (!timestamp) {
        return "never";
    }
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(now - *timestamp) + "s ago";
}

Application::Application(const AppConfig& config, const std::atomic<bool>& stop_flag)
    : config_(config), stop_flag_(stop_flag) {
    std::string store_path = config_.store_path.empty()
        ? utils::get_default_store_path()
        : config_.store_path;
    store_ = std::make_unique<ServerConfigStore>(store_path, config_.log_level);

    ProberOptions prober_options;
    prober_options.management_port = static_cast<uint16_t>(config_.management_port);
    prober_options.model_runtime_port = static_cast<uint16_t>(config_.model_runtime_port);
    prober_options.piper_port = static_cast<uint16_t>(config_.piper_port);
    prober_options.vibevoice_port = static_cast<uint16_t>(config_.vibevoice_port);
    prober_options.management_timeout = ms(config_.prober_timeout_ms);
    prober_options.model_runtime_timeout = ms(config_.prober_timeout_ms);
    prober_ = std::make_unique<CapabilityProber>(prober_options, config_.log_level);

    HealthMonitorOptions health_options;
    health_options.interval = std::chrono::seconds(config_.health_interval_s);
    health_options.probe_timeout = ms(config_.health_timeout_ms);
    monitor_ = std::make_unique<HealthMonitor>(*store_, health_options, config_.log_level);

    TierSettings tier_settings;
    tier_settings.beacon_port = static_cast<uint16_t>(config_.beacon_port);
    for (int port : config_.service_ports) {
        tier_settings.service_ports.push_back(static_cast<uint16_t>(port));
    }
    tier_settings.sweep.parallelism = static_cast<size_t>(config_.sweep_parallelism);
    tier_settings.sweep.connect_timeout = ms(config_.sweep_connect_timeout_ms);

    DiscoveryTimeouts timeouts;
    timeouts.cached = ms(config_.cached_timeout_ms);
    timeouts.local_advertisement = ms(config_.advertisement_timeout_ms);
    timeouts.peer_transport = ms(config_.peer_timeout_ms);
    timeouts.subnet_scan = ms(config_.subnet_timeout_ms);

    coordinator_ = std::make_unique<DiscoveryCoordinator>(
        *store_,
        make_default_tiers(*store_, tier_settings, config_.log_level),
        timeouts,
        config_.no_enrich ? nullptr : prober_.get(),
        config_.log_level);
}

int Application::run() {
    const std::string& cmd = config_.command;
    if (cmd == "discover") return cmd_discover();
    if (cmd == "connect") return cmd_connect();
    if (cmd == "qr") return cmd_qr();
    if (cmd == "list") return cmd_list();
    if (cmd == "add") return cmd_add();
    if (cmd == "remove") return cmd_remove();
    if (cmd == "enable") return cmd_set_enabled(true);
    if (cmd == "disable") return cmd_set_enabled(false);
    if (cmd == "primary") return cmd_primary();
    if (cmd == "health") return cmd_health();
    if (cmd == "monitor") return cmd_monitor();
    if (cmd == "probe") return cmd_probe();
    if (cmd == "clear-cache") return cmd_clear_cache();

    std::cerr << "Error: Unknown command '" << cmd << "'" << std::endl;
    return 1;
}

void Application::print_connected(const DiscoveredServer& server) {
    coordinator_->wait_for_enrichment();
    auto caps = coordinator_->capabilities();

    if (config_.json_output) {
        json out = server.to_json();
        if (caps) {
            out["capabilities"] = caps->to_json();
        }
        std::cout << out.dump(2) << std::endl;
        return;
    }

    std::cout << "Connected to " << server.name() << " at " << server.base_url()
              << " (" << discovery_method_to_string(server.discovery_method()) << ")" << std::endl;
    if (caps) {
        std::cout << "  Services: " << caps->summary << std::endl;
    }
}

void Application::print_servers(const std::vector<ServerConfig>& servers) {
    auto primary = store_->primary_id();

    if (config_.json_output) {
        json out = json::array();
        for (const auto& server : servers) {
            json entry = server.to_json();
            entry["is_primary"] = primary && *primary == server.id;
            out.push_back(entry);
        }
        std::cout << out.dump(2) << std::endl;
        return;
    }

    if (servers.empty()) {
        std::cout << "No saved servers. Run 'lodestar discover' or 'lodestar add HOST'." << std::endl;
        return;
    }

    std::cout << std::left
              << std::setw(3) << ""
              << std::setw(38) << "ID"
              << std::setw(24) << "Name"
              << std::setw(26) << "Address"
              << std::setw(11) << "Type"
              << std::setw(11) << "Health"
              << "Checked" << std::endl;
    std::cout << std::string(120, '-') << std::endl;

    for (const auto& server : servers) {
        std::string marker = (primary && *primary == server.id) ? "*" : "";
        std::string health = server.is_enabled ? health_status_to_string(server.health_status) : "disabled";
        std::cout << std::setw(3) << marker
                  << std::setw(38) << server.id
                  << std::setw(24) << server.name
                  << std::setw(26) << (server.host + ":" + std::to_string(server.port))
                  << std::setw(11) << server_type_to_string(server.server_type)
                  << std::setw(11) << health
                  << format_last_check(server.last_health_check) << std::endl;
    }
}

int Application::cmd_discover() {
    auto events = coordinator_->subscribe();
    auto session = coordinator_->start();

    while (true) {
        if (stop_flag_.load()) {
            coordinator_->cancel();
        }

        auto event = events->pop_for(std::chrono::milliseconds(200));
        if (!event) {
            continue;
        }

        if (!config_.json_output) {
            std::cout << "[" << std::setw(3) << static_cast<int>(event->progress * 100) << "%] "
                      << describe_discovery_state(event->state) << std::endl;
        }

        if (is_terminal(event->state) ||
            (std::holds_alternative<state::Idle>(event->state) &&
             session.wait_for(std::chrono::seconds(0)) == std::future_status::ready)) {
            break;
        }
    }

    auto result = session.get();
    if (!result) {
        if (config_.json_output) {
            std::cout << discovery_state_to_json(coordinator_->state()).dump(2) << std::endl;
        }
        return 1;
    }

    print_connected(*result);
    return 0;
}

int Application::cmd_connect() {
    int port = config_.port == 0 ? DEFAULT_GATEWAY_PORT : config_.port;
    DiscoveredServer server = coordinator_->configure_manually(config_.host, port, config_.name);
    print_connected(server);
    return 0;
}

int Application::cmd_qr() {
    auto server = coordinator_->configure_from_qr_code(config_.payload);
    if (!server) {
        std::cerr << "The QR code does not contain a server address." << std::endl;
        return 1;
    }
    print_connected(*server);
    return 0;
}

int Application::cmd_list() {
    print_servers(store_->list());
    return 0;
}

int Application::cmd_add() {
    ServerConfig config;
    config.host = config_.host;
    config.server_type = server_type_from_string(config_.server_type);
    int port = config_.port == 0 ? server_type_default_port(config.server_type) : config_.port;
    config.port = validate_endpoint(config_.host, port);
    config.name = config_.name.empty()
        ? server_type_display_name(config.server_type) + " (" + config_.host + ")"
        : config_.name;

    ServerConfig added = store_->add(config);
    if (config_.json_output) {
        std::cout << added.to_json().dump(2) << std::endl;
    } else {
        std::cout << "Saved " << added.name << " as " << added.id << std::endl;
    }
    return 0;
}

int Application::cmd_remove() {
    store_->remove(config_.server_id);
    return 0;
}

int Application::cmd_set_enabled(bool enabled) {
    ServerConfig updated = store_->set_enabled(config_.server_id, enabled);
    std::cout << updated.name << " is now " << (enabled ? "enabled" : "disabled") << std::endl;
    return 0;
}

int Application::cmd_primary() {
    if (!config_.server_id.empty()) {
        store_->set_primary(config_.server_id);
    }

    auto primary = store_->primary();
    if (config_.json_output) {
        std::cout << (primary ? primary->to_json() : json(nullptr)).dump(2) << std::endl;
        return 0;
    }

    if (!primary) {
        std::cout << "No primary server" << std::endl;
        return 1;
    }
    std::cout << "Primary server: " << primary->name << " at " << primary->base_url() << std::endl;
    return 0;
}

int Application::cmd_health() {
    if (store_->enabled_servers().empty()) {
        std::cout << "No enabled servers to check" << std::endl;
        return 0;
    }

    monitor_->run_cycle();
    print_servers(store_->list());
    return 0;
}

int Application::cmd_monitor() {
    monitor_->set_status_callback([](const ServerConfig& server) {
        std::cout << "[HealthMonitor] " << server.name << " (" << server.host << ":" << server.port
                  << ") is now " << health_status_to_string(server.health_status) << std::endl;
    });

    monitor_->start();
    std::cout << "Press Ctrl+C to stop" << std::endl;

    while (!stop_flag_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[HealthMonitor] Stopping..." << std::endl;
    monitor_->stop();
    return 0;
}

int Application::cmd_probe() {
    ServerCapabilities caps = prober_->probe(config_.host);

    if (config_.json_output) {
        std::cout << caps.to_json().dump(2) << std::endl;
        return caps.source == CapabilitySource::NONE ? 1 : 0;
    }

    if (caps.source == CapabilitySource::NONE) {
        std::cout << config_.host << ": no management surface or model runtime answered" << std::endl;
        return 1;
    }

    std::cout << config_.host << ": " << caps.summary << std::endl;
    for (const auto& model : caps.llm_models) {
        std::cout << "  llm  " << model << std::endl;
    }
    for (const auto& model : caps.stt_models) {
        std::cout << "  stt  " << model << std::endl;
    }
    for (const auto& [engine, voices] : caps.tts_voice_sets) {
        for (const auto& voice : voices) {
            std::cout << "  tts  " << voice << " (" << engine << ")" << std::endl;
        }
    }
    return 0;
}

int Application::cmd_clear_cache() {
    coordinator_->clear_cache();
    return 0;
}

} // namespace lodestar
