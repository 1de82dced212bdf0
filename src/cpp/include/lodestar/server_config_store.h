#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "server_types.h"

namespace lodestar {

using json = nlohmann::json;

// Sole owner of the persisted server list and of the primary (connected) server.
// Every operation runs under one lock, so a health-status write can never
// interleave with a user-initiated delete. Callers get copies, never references.
class ServerConfigStore {
public:
    // An empty storage_path keeps everything in memory
    explicit ServerConfigStore(const std::string& storage_path = "",
                               const std::string& log_level = "info");

    // Adds a new record. Assigns an id when config.id is empty.
    // Throws InvalidInputException for a duplicate id, empty host or port 0.
    ServerConfig add(ServerConfig config);

    // Full-record replace. Throws ServerNotFoundException.
    void update(const ServerConfig& config);

    // Read-modify-write under the store lock. The mutator gets a copy of the
    // current record and the result replaces it wholesale; the id cannot change.
    // Throws ServerNotFoundException.
    ServerConfig update_with(const std::string& id,
                             const std::function<void(ServerConfig&)>& mutator);

    // Removes a record and clears the primary pointer if it referenced it.
    // Throws ServerNotFoundException.
    void remove(const std::string& id);

    ServerConfig set_enabled(const std::string& id, bool enabled);

    // Insertion order
    std::vector<ServerConfig> list() const;
    std::vector<ServerConfig> enabled_servers() const;
    std::vector<ServerConfig> servers_of_type(ServerType type) const;
    std::optional<ServerConfig> get(const std::string& id) const;
    std::optional<ServerConfig> find_by_endpoint(const std::string& host, uint16_t port) const;
    size_t size() const;

    // Enabled, usable servers whose type serves the given service
    std::vector<ServerConfig> healthy_servers_for(ServiceKind service) const;

    // Service URL on the first healthy server for that service
    std::optional<std::string> best_endpoint(ServiceKind service) const;

    // Sorted unions across usable servers
    std::vector<std::string> all_discovered_models() const;
    std::vector<std::string> all_discovered_voices() const;

    // Primary server
    void set_primary(const std::string& id);  // Throws ServerNotFoundException
    void clear_primary();
    std::optional<ServerConfig> primary() const;
    std::optional<std::string> primary_id() const;

    // Upsert a connection result (matched on host:port) and make it primary.
    // An existing record keeps its name and enabled flag.
    ServerConfig remember_connection(const DiscoveredServer& server);

    // Gateway on localhost:11400
    ServerConfig add_default_server();

    const std::string& storage_path() const { return storage_path_; }

private:
    void load();
    // Writes the given state; members are assigned only after it succeeds
    void save_locked(const std::vector<ServerConfig>& servers,
                     const std::optional<std::string>& primary) const;
    std::vector<ServerConfig>::iterator find_locked(const std::string& id);
    std::vector<ServerConfig>::const_iterator find_locked(const std::string& id) const;
    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    std::string storage_path_;
    std::string log_level_;

    mutable std::mutex mutex_;
    std::vector<ServerConfig> servers_;
    std::optional<std::string> primary_id_;
};

} // namespace lodestar
