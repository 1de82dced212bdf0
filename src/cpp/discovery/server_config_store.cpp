#include "lodestar/server_config_store.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/json_utils.h"
#include "lodestar/utils/path_utils.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;
using namespace lodestar::utils;

#define DEBUG_LOG(store, msg) \
    if ((store)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {

static std::string service_path(ServiceKind service) {
    switch (service) {
        case ServiceKind::LLM: return "/v1/chat/completions";
        case ServiceKind::STT: return "/v1/audio/transcriptions";
        case ServiceKind::TTS: return "/v1/audio/speech";
    }
    return "/";
}

ServerConfigStore::ServerConfigStore(const std::string& storage_path, const std::string& log_level)
    : storage_path_(storage_path), log_level_(log_level) {
    load();
}

void ServerConfigStore::load() {
    if (storage_path_.empty() || !fs::exists(storage_path_)) {
        DEBUG_LOG(this, "[ServerConfigStore] No stored servers at '" << storage_path_ << "'");
        return;
    }

    json data;
    try {
        DEBUG_LOG(this, "[ServerConfigStore] Loading " << fs::path(storage_path_).filename());
        data = JsonUtils::load_from_file(storage_path_);
    } catch (const std::exception& e) {
        std::cerr << "[ServerConfigStore] Warning: Could not load " << fs::path(storage_path_).filename()
                  << ": " << e.what() << ". Starting with an empty server list." << std::endl;
        return;
    }

    auto servers_it = data.find("servers");
    if (servers_it != data.end() && servers_it->is_array()) {
        for (const auto& entry : *servers_it) {
            try {
                ServerConfig config = ServerConfig::from_json(entry);
                if (find_locked(config.id) != servers_.end()) {
                    std::cerr << "[ServerConfigStore] Warning: Skipping duplicate server id '"
                              << config.id << "'" << std::endl;
                    continue;
                }
                servers_.push_back(std::move(config));
            } catch (const InvalidInputException& e) {
                std::cerr << "[ServerConfigStore] Warning: Skipping stored server: " << e.what() << std::endl;
            }
        }
    }

    std::string primary = JsonUtils::get_or_default<std::string>(data, "primary_id", "");
    if (!primary.empty() && find_locked(primary) != servers_.end()) {
        primary_id_ = primary;
    }

    DEBUG_LOG(this, "[ServerConfigStore] Loaded " << servers_.size() << " server(s)");
}

void ServerConfigStore::save_locked(const std::vector<ServerConfig>& servers,
                                    const std::optional<std::string>& primary) const {
    if (storage_path_.empty()) {
        return;
    }

    json data;
    data["servers"] = json::array();
    for (const auto& server : servers) {
        data["servers"].push_back(server.to_json());
    }
    if (primary) {
        data["primary_id"] = *primary;
    } else {
        data["primary_id"] = nullptr;
    }

    try {
        JsonUtils::save_to_file(data, storage_path_);
    } catch (const std::exception& e) {
        std::cerr << "[ServerConfigStore] Error saving " << storage_path_ << ": " << e.what() << std::endl;
        throw std::runtime_error("Failed to save server list to " + storage_path_);
    }
}

std::vector<ServerConfig>::iterator ServerConfigStore::find_locked(const std::string& id) {
    return std::find_if(servers_.begin(), servers_.end(),
                        [&id](const ServerConfig& s) { return s.id == id; });
}

std::vector<ServerConfig>::const_iterator ServerConfigStore::find_locked(const std::string& id) const {
    return std::find_if(servers_.begin(), servers_.end(),
                        [&id](const ServerConfig& s) { return s.id == id; });
}

ServerConfig ServerConfigStore::add(ServerConfig config) {
    if (config.host.empty()) {
        throw InvalidInputException("host must not be empty");
    }
    if (config.port == 0) {
        throw InvalidInputException("port must be between 1 and 65535");
    }
    if (config.name.empty()) {
        config.name = config.host;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (config.id.empty()) {
        config.id = generate_uuid();
    } else if (find_locked(config.id) != servers_.end()) {
        throw InvalidInputException("server id '" + config.id + "' already exists");
    }

    std::vector<ServerConfig> servers = servers_;
    servers.push_back(config);
    save_locked(servers, primary_id_);
    servers_ = std::move(servers);

    std::cout << "[ServerConfigStore] Added server: " << config.name
              << " at " << config.host << ":" << config.port << std::endl;
    return config;
}

void ServerConfigStore::update(const ServerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(config.id);
    if (it == servers_.end()) {
        throw ServerNotFoundException(config.id);
    }

    std::vector<ServerConfig> servers = servers_;
    servers[it - servers_.begin()] = config;
    save_locked(servers, primary_id_);
    servers_ = std::move(servers);
    DEBUG_LOG(this, "[ServerConfigStore] Updated server: " << config.id);
}

ServerConfig ServerConfigStore::update_with(const std::string& id,
                                            const std::function<void(ServerConfig&)>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == servers_.end()) {
        throw ServerNotFoundException(id);
    }

    ServerConfig updated = *it;
    mutator(updated);
    updated.id = id;

    std::vector<ServerConfig> servers = servers_;
    servers[it - servers_.begin()] = updated;
    save_locked(servers, primary_id_);
    servers_ = std::move(servers);
    return updated;
}

void ServerConfigStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == servers_.end()) {
        throw ServerNotFoundException(id);
    }

    std::string name = it->name;
    std::vector<ServerConfig> servers = servers_;
    servers.erase(servers.begin() + (it - servers_.begin()));
    std::optional<std::string> primary = primary_id_;
    if (primary && *primary == id) {
        primary.reset();
    }
    save_locked(servers, primary);

    servers_ = std::move(servers);
    primary_id_ = primary;
    std::cout << "[ServerConfigStore] Removed server: " << name << std::endl;
}

ServerConfig ServerConfigStore::set_enabled(const std::string& id, bool enabled) {
    return update_with(id, [enabled](ServerConfig& s) { s.is_enabled = enabled; });
}

std::vector<ServerConfig> ServerConfigStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_;
}

std::vector<ServerConfig> ServerConfigStore::enabled_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerConfig> result;
    for (const auto& server : servers_) {
        if (server.is_enabled) {
            result.push_back(server);
        }
    }
    return result;
}

std::vector<ServerConfig> ServerConfigStore::servers_of_type(ServerType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerConfig> result;
    for (const auto& server : servers_) {
        if (server.server_type == type) {
            result.push_back(server);
        }
    }
    return result;
}

std::optional<ServerConfig> ServerConfigStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<ServerConfig> ServerConfigStore::find_by_endpoint(const std::string& host, uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& server : servers_) {
        if (server.host == host && server.port == port) {
            return server;
        }
    }
    return std::nullopt;
}

size_t ServerConfigStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

std::vector<ServerConfig> ServerConfigStore::healthy_servers_for(ServiceKind service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerConfig> result;
    for (const auto& server : servers_) {
        if (server.is_enabled && is_usable(server.health_status) &&
            server_type_serves(server.server_type, service)) {
            result.push_back(server);
        }
    }
    // Healthy before degraded, insertion order otherwise
    std::stable_sort(result.begin(), result.end(), [](const ServerConfig& a, const ServerConfig& b) {
        return a.health_status > b.health_status;
    });
    return result;
}

std::optional<std::string> ServerConfigStore::best_endpoint(ServiceKind service) const {
    auto candidates = healthy_servers_for(service);
    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates.front().base_url() + service_path(service);
}

std::vector<std::string> ServerConfigStore::all_discovered_models() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> models;
    for (const auto& server : servers_) {
        if (server.is_enabled && is_usable(server.health_status)) {
            models.insert(server.discovered_models.begin(), server.discovered_models.end());
        }
    }
    return std::vector<std::string>(models.begin(), models.end());
}

std::vector<std::string> ServerConfigStore::all_discovered_voices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> voices;
    for (const auto& server : servers_) {
        if (server.is_enabled && is_usable(server.health_status)) {
            voices.insert(server.discovered_voices.begin(), server.discovered_voices.end());
        }
    }
    return std::vector<std::string>(voices.begin(), voices.end());
}

void ServerConfigStore::set_primary(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (find_locked(id) == servers_.end()) {
        throw ServerNotFoundException(id);
    }
    save_locked(servers_, id);
    primary_id_ = id;
}

void ServerConfigStore::clear_primary() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!primary_id_) {
        return;
    }
    save_locked(servers_, std::nullopt);
    primary_id_.reset();
    DEBUG_LOG(this, "[ServerConfigStore] Primary server cleared");
}

std::optional<ServerConfig> ServerConfigStore::primary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!primary_id_) {
        return std::nullopt;
    }
    auto it = find_locked(*primary_id_);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<std::string> ServerConfigStore::primary_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return primary_id_;
}

ServerConfig ServerConfigStore::remember_connection(const DiscoveredServer& server) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ServerConfig> servers = servers_;
    auto it = std::find_if(servers.begin(), servers.end(), [&server](const ServerConfig& s) {
        return s.host == server.host() && s.port == server.port();
    });

    // A known record keeps its name and enabled flag; scans only know the address
    bool added = it == servers.end();
    ServerConfig result;
    if (!added) {
        result = *it;
    } else {
        result.id = generate_uuid();
        result.name = server.name().empty() ? server.host() : server.name();
        result.host = server.host();
        result.port = server.port();
        result.server_type = infer_server_type(server.port());
        servers.push_back(result);
    }

    save_locked(servers, result.id);
    servers_ = std::move(servers);
    primary_id_ = result.id;

    if (added) {
        std::cout << "[ServerConfigStore] Added server: " << result.name
                  << " at " << result.host << ":" << result.port << std::endl;
    }
    DEBUG_LOG(this, "[ServerConfigStore] Primary server is now " << result.name
              << " (" << discovery_method_to_string(server.discovery_method()) << ")");
    return result;
}

ServerConfig ServerConfigStore::add_default_server() {
    ServerConfig config;
    config.name = server_type_display_name(ServerType::GATEWAY);
    config.host = "localhost";
    config.port = DEFAULT_GATEWAY_PORT;
    config.server_type = ServerType::GATEWAY;
    return add(config);
}

} // namespace lodestar
