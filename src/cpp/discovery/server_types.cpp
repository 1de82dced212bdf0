#include "lodestar/server_types.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/json_utils.h"
#include <algorithm>
#include <cctype>

using namespace lodestar::utils;

namespace lodestar {

static std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

std::string discovery_tier_to_string(DiscoveryTier tier) {
    switch (tier) {
        case DiscoveryTier::CACHED: return "cached";
        case DiscoveryTier::LOCAL_ADVERTISEMENT: return "localAdvertisement";
        case DiscoveryTier::PEER_TRANSPORT: return "peerTransport";
        case DiscoveryTier::SUBNET_SCAN: return "subnetScan";
    }
    return "unknown";
}

std::string discovery_tier_description(DiscoveryTier tier) {
    switch (tier) {
        case DiscoveryTier::CACHED: return "Reconnecting to last server...";
        case DiscoveryTier::LOCAL_ADVERTISEMENT: return "Listening for server announcements...";
        case DiscoveryTier::PEER_TRANSPORT: return "Checking nearby devices...";
        case DiscoveryTier::SUBNET_SCAN: return "Scanning local network...";
    }
    return "";
}

std::string discovery_method_to_string(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::CACHED: return "cached";
        case DiscoveryMethod::LOCAL_ADVERTISEMENT: return "localAdvertisement";
        case DiscoveryMethod::PEER_TRANSPORT: return "peerTransport";
        case DiscoveryMethod::SUBNET_SCAN: return "subnetScan";
        case DiscoveryMethod::MANUAL: return "manual";
        case DiscoveryMethod::QR_CODE: return "qrCode";
    }
    return "unknown";
}

DiscoveryMethod discovery_method_from_string(const std::string& str) {
    if (str == "cached") return DiscoveryMethod::CACHED;
    if (str == "localAdvertisement") return DiscoveryMethod::LOCAL_ADVERTISEMENT;
    if (str == "peerTransport") return DiscoveryMethod::PEER_TRANSPORT;
    if (str == "subnetScan") return DiscoveryMethod::SUBNET_SCAN;
    if (str == "qrCode") return DiscoveryMethod::QR_CODE;
    return DiscoveryMethod::MANUAL;
}

DiscoveryMethod to_discovery_method(DiscoveryTier tier) {
    switch (tier) {
        case DiscoveryTier::CACHED: return DiscoveryMethod::CACHED;
        case DiscoveryTier::LOCAL_ADVERTISEMENT: return DiscoveryMethod::LOCAL_ADVERTISEMENT;
        case DiscoveryTier::PEER_TRANSPORT: return DiscoveryMethod::PEER_TRANSPORT;
        case DiscoveryTier::SUBNET_SCAN: return DiscoveryMethod::SUBNET_SCAN;
    }
    return DiscoveryMethod::MANUAL;
}

std::string server_type_to_string(ServerType type) {
    switch (type) {
        case ServerType::GATEWAY: return "gateway";
        case ServerType::OLLAMA: return "ollama";
        case ServerType::WHISPER: return "whisper";
        case ServerType::PIPER: return "piper";
        case ServerType::VIBEVOICE: return "vibevoice";
        case ServerType::LLAMA_CPP: return "llama.cpp";
        case ServerType::VLLM: return "vllm";
        case ServerType::CUSTOM: return "custom";
    }
    return "custom";
}

ServerType server_type_from_string(const std::string& str) {
    std::string s = to_lower(str);
    if (s == "gateway") return ServerType::GATEWAY;
    if (s == "ollama") return ServerType::OLLAMA;
    if (s == "whisper") return ServerType::WHISPER;
    if (s == "piper") return ServerType::PIPER;
    if (s == "vibevoice") return ServerType::VIBEVOICE;
    if (s == "llama.cpp" || s == "llamacpp") return ServerType::LLAMA_CPP;
    if (s == "vllm") return ServerType::VLLM;
    if (s == "custom") return ServerType::CUSTOM;
    throw InvalidInputException("unknown server type '" + str + "'");
}

std::string server_type_display_name(ServerType type) {
    switch (type) {
        case ServerType::GATEWAY: return "Companion Gateway";
        case ServerType::OLLAMA: return "Ollama";
        case ServerType::WHISPER: return "Whisper";
        case ServerType::PIPER: return "Piper TTS";
        case ServerType::VIBEVOICE: return "VibeVoice TTS";
        case ServerType::LLAMA_CPP: return "llama.cpp";
        case ServerType::VLLM: return "vLLM";
        case ServerType::CUSTOM: return "Custom Server";
    }
    return "Custom Server";
}

uint16_t server_type_default_port(ServerType type) {
    switch (type) {
        case ServerType::GATEWAY: return DEFAULT_GATEWAY_PORT;
        case ServerType::OLLAMA: return 11434;
        case ServerType::WHISPER: return 11401;
        case ServerType::PIPER: return 11402;
        case ServerType::VIBEVOICE: return 8880;
        case ServerType::LLAMA_CPP: return 8080;
        case ServerType::VLLM: return 8000;
        case ServerType::CUSTOM: return 8080;
    }
    return DEFAULT_GATEWAY_PORT;
}

std::string server_type_health_path(ServerType type) {
    // Ollama has no /health; its version endpoint is the cheapest liveness check
    if (type == ServerType::OLLAMA) {
        return "/api/version";
    }
    return "/health";
}

bool server_type_serves(ServerType type, ServiceKind service) {
    if (type == ServerType::GATEWAY) {
        return true;
    }
    switch (service) {
        case ServiceKind::LLM:
            return type == ServerType::OLLAMA || type == ServerType::LLAMA_CPP ||
                   type == ServerType::VLLM || type == ServerType::CUSTOM;
        case ServiceKind::STT:
            return type == ServerType::WHISPER;
        case ServiceKind::TTS:
            return type == ServerType::PIPER || type == ServerType::VIBEVOICE;
    }
    return false;
}

ServerType infer_server_type(uint16_t port) {
    switch (port) {
        case 11434: return ServerType::OLLAMA;
        case 11401: return ServerType::WHISPER;
        case 11402: return ServerType::PIPER;
        case 8880: return ServerType::VIBEVOICE;
        case 8080: return ServerType::LLAMA_CPP;
        case 8000: return ServerType::VLLM;
        default: return ServerType::GATEWAY;
    }
}

std::string health_status_to_string(ServerHealthStatus status) {
    switch (status) {
        case ServerHealthStatus::UNKNOWN: return "unknown";
        case ServerHealthStatus::CHECKING: return "checking";
        case ServerHealthStatus::UNHEALTHY: return "unhealthy";
        case ServerHealthStatus::DEGRADED: return "degraded";
        case ServerHealthStatus::HEALTHY: return "healthy";
    }
    return "unknown";
}

ServerHealthStatus health_status_from_string(const std::string& str) {
    if (str == "checking") return ServerHealthStatus::CHECKING;
    if (str == "unhealthy") return ServerHealthStatus::UNHEALTHY;
    if (str == "degraded") return ServerHealthStatus::DEGRADED;
    if (str == "healthy") return ServerHealthStatus::HEALTHY;
    return ServerHealthStatus::UNKNOWN;
}

std::string capability_source_to_string(CapabilitySource source) {
    switch (source) {
        case CapabilitySource::NONE: return "none";
        case CapabilitySource::MANAGEMENT: return "management";
        case CapabilitySource::MODEL_RUNTIME: return "modelRuntime";
    }
    return "none";
}

// DiscoveredServer

DiscoveredServer::DiscoveredServer(std::string name, std::string host, uint16_t port, DiscoveryMethod method)
    : name_(std::move(name)), host_(std::move(host)), port_(port), discovery_method_(method) {}

std::string DiscoveredServer::base_url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
}

DiscoveredServer DiscoveredServer::relabel(DiscoveryMethod method) const {
    return DiscoveredServer(name_, host_, port_, method);
}

bool DiscoveredServer::operator==(const DiscoveredServer& other) const {
    return name_ == other.name_ && host_ == other.host_ &&
           port_ == other.port_ && discovery_method_ == other.discovery_method_;
}

json DiscoveredServer::to_json() const {
    return {
        {"name", name_},
        {"host", host_},
        {"port", port_},
        {"discovery_method", discovery_method_to_string(discovery_method_)}
    };
}

// ServerConfig

json ServerConfig::to_json() const {
    json j = {
        {"id", id},
        {"name", name},
        {"host", host},
        {"port", port},
        {"server_type", server_type_to_string(server_type)},
        {"is_enabled", is_enabled},
        {"health_status", health_status_to_string(health_status)},
        {"discovered_models", discovered_models},
        {"discovered_voices", discovered_voices}
    };
    if (last_health_check) {
        j["last_health_check"] = *last_health_check;
    } else {
        j["last_health_check"] = nullptr;
    }
    return j;
}

ServerConfig ServerConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidInputException("server record is not an object");
    }

    ServerConfig config;
    config.id = JsonUtils::get_or_default<std::string>(j, "id", "");
    config.host = JsonUtils::get_or_default<std::string>(j, "host", "");
    if (config.id.empty() || config.host.empty()) {
        throw InvalidInputException("server record is missing id or host");
    }

    int port = JsonUtils::get_or_default<int>(j, "port", DEFAULT_GATEWAY_PORT);
    if (port <= 0 || port > 65535) {
        throw InvalidInputException("server record has invalid port " + std::to_string(port));
    }
    config.port = static_cast<uint16_t>(port);
    config.name = JsonUtils::get_or_default<std::string>(j, "name", config.host);

    std::string type = JsonUtils::get_or_default<std::string>(j, "server_type", "gateway");
    try {
        config.server_type = server_type_from_string(type);
    } catch (const InvalidInputException&) {
        config.server_type = ServerType::CUSTOM;
    }

    config.is_enabled = JsonUtils::get_or_default<bool>(j, "is_enabled", true);
    config.health_status = health_status_from_string(
        JsonUtils::get_or_default<std::string>(j, "health_status", "unknown"));

    auto check = j.find("last_health_check");
    if (check != j.end() && check->is_number_integer()) {
        config.last_health_check = check->get<int64_t>();
    }

    config.discovered_models = JsonUtils::string_list(j, "discovered_models");
    config.discovered_voices = JsonUtils::string_list(j, "discovered_voices");
    return config;
}

// ServerCapabilities

std::vector<std::string> ServerCapabilities::tts_voices() const {
    std::vector<std::string> voices;
    for (const auto& [engine, engine_voices] : tts_voice_sets) {
        voices.insert(voices.end(), engine_voices.begin(), engine_voices.end());
    }
    return voices;
}

json ServerCapabilities::to_json() const {
    return {
        {"llm_models", llm_models},
        {"stt_models", stt_models},
        {"tts_voice_sets", tts_voice_sets},
        {"summary", summary},
        {"source", capability_source_to_string(source)}
    };
}

} // namespace lodestar
