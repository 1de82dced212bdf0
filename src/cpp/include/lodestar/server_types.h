#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lodestar {

using json = nlohmann::json;

// Default port of the primary companion gateway
constexpr uint16_t DEFAULT_GATEWAY_PORT = 11400;

// Discovery strategies, in fallback order. The order is fixed.
enum class DiscoveryTier {
    CACHED = 0,
    LOCAL_ADVERTISEMENT = 1,
    PEER_TRANSPORT = 2,
    SUBNET_SCAN = 3
};

constexpr std::array<DiscoveryTier, 4> ALL_DISCOVERY_TIERS = {
    DiscoveryTier::CACHED,
    DiscoveryTier::LOCAL_ADVERTISEMENT,
    DiscoveryTier::PEER_TRANSPORT,
    DiscoveryTier::SUBNET_SCAN
};

// How a server was found. Only used as a label.
enum class DiscoveryMethod {
    CACHED,
    LOCAL_ADVERTISEMENT,
    PEER_TRANSPORT,
    SUBNET_SCAN,
    MANUAL,
    QR_CODE
};

enum class ServerType {
    GATEWAY,
    OLLAMA,
    WHISPER,
    PIPER,
    VIBEVOICE,
    LLAMA_CPP,
    VLLM,
    CUSTOM
};

// Ordered by usability
enum class ServerHealthStatus {
    UNKNOWN = 0,
    CHECKING = 1,
    UNHEALTHY = 2,
    DEGRADED = 3,
    HEALTHY = 4
};

enum class ServiceKind {
    LLM,
    STT,
    TTS
};

std::string discovery_tier_to_string(DiscoveryTier tier);
std::string discovery_tier_description(DiscoveryTier tier);
std::string discovery_method_to_string(DiscoveryMethod method);
DiscoveryMethod discovery_method_from_string(const std::string& str);
DiscoveryMethod to_discovery_method(DiscoveryTier tier);

std::string server_type_to_string(ServerType type);
ServerType server_type_from_string(const std::string& str);  // Throws InvalidInputException
std::string server_type_display_name(ServerType type);
uint16_t server_type_default_port(ServerType type);
std::string server_type_health_path(ServerType type);
bool server_type_serves(ServerType type, ServiceKind service);
// Best guess from a port number; unknown ports are assumed to be a gateway
ServerType infer_server_type(uint16_t port);

std::string health_status_to_string(ServerHealthStatus status);
ServerHealthStatus health_status_from_string(const std::string& str);
inline bool is_usable(ServerHealthStatus status) {
    return status == ServerHealthStatus::HEALTHY || status == ServerHealthStatus::DEGRADED;
}


// A reachable endpoint produced by a discovery tier, a QR code or manual entry.
// Immutable: a new discovery produces a new value.
class DiscoveredServer {
public:
    DiscoveredServer(std::string name, std::string host, uint16_t port, DiscoveryMethod method);

    const std::string& name() const { return name_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    DiscoveryMethod discovery_method() const { return discovery_method_; }

    std::string base_url() const;
    std::string endpoint() const { return host_ + ":" + std::to_string(port_); }

    // Same server found by a different method
    DiscoveredServer relabel(DiscoveryMethod method) const;

    bool same_endpoint(const DiscoveredServer& other) const {
        return host_ == other.host_ && port_ == other.port_;
    }

    bool operator==(const DiscoveredServer& other) const;
    bool operator!=(const DiscoveredServer& other) const { return !(*this == other); }

    json to_json() const;

private:
    std::string name_;
    std::string host_;
    uint16_t port_;
    DiscoveryMethod discovery_method_;
};

// Persisted server record. Owned by ServerConfigStore; everyone else holds copies.
struct ServerConfig {
    std::string id;
    std::string name;
    std::string host;
    uint16_t port = DEFAULT_GATEWAY_PORT;
    ServerType server_type = ServerType::GATEWAY;
    bool is_enabled = true;
    ServerHealthStatus health_status = ServerHealthStatus::UNKNOWN;
    std::optional<int64_t> last_health_check;  // Unix seconds
    std::vector<std::string> discovered_models;
    std::vector<std::string> discovered_voices;

    std::string base_url() const {
        return "http://" + host + ":" + std::to_string(port);
    }

    json to_json() const;
    static ServerConfig from_json(const json& j);  // Throws InvalidInputException
};

// Where a capability probe got its answer from
enum class CapabilitySource {
    NONE,
    MANAGEMENT,
    MODEL_RUNTIME
};

std::string capability_source_to_string(CapabilitySource source);

// Result of one capability probe. Replaced wholesale on every probe.
struct ServerCapabilities {
    std::vector<std::string> llm_models;
    std::vector<std::string> stt_models;
    std::map<std::string, std::vector<std::string>> tts_voice_sets;  // TTS engine -> voices
    std::string summary;
    CapabilitySource source = CapabilitySource::NONE;

    bool is_empty() const {
        return llm_models.empty() && stt_models.empty() && tts_voice_sets.empty();
    }

    std::vector<std::string> tts_voices() const;

    json to_json() const;
};

} // namespace lodestar
