#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "server_types.h"

namespace lodestar {

using json = nlohmann::json;

constexpr uint16_t DEFAULT_MANAGEMENT_PORT = 8766;
constexpr uint16_t DEFAULT_MODEL_RUNTIME_PORT = 11434;
constexpr uint16_t DEFAULT_PIPER_PORT = 11402;
constexpr uint16_t DEFAULT_VIBEVOICE_PORT = 8880;

struct ProberOptions {
    uint16_t management_port = DEFAULT_MANAGEMENT_PORT;
    uint16_t model_runtime_port = DEFAULT_MODEL_RUNTIME_PORT;
    uint16_t piper_port = DEFAULT_PIPER_PORT;
    uint16_t vibevoice_port = DEFAULT_VIBEVOICE_PORT;
    std::chrono::milliseconds management_timeout{5000};
    std::chrono::milliseconds model_runtime_timeout{5000};
};

// Learns which model and voice services a host exposes.
//
// Two attempts in order, never retried:
//  1. The management surface (GET /api/models), which reports every service
//     behind it in one answer.
//  2. The services directly, queried side by side under model_runtime_timeout:
//     the model runtime (GET /api/version, then /api/tags), Piper (GET /voices)
//     and VibeVoice (GET /v1/audio/voices).
// A call takes at most management_timeout + model_runtime_timeout.
class CapabilityProber {
public:
    explicit CapabilityProber(ProberOptions options = ProberOptions(),
                              const std::string& log_level = "info");

    // Never throws for network or parse failures; an unreachable host yields
    // empty capabilities with source NONE.
    ServerCapabilities probe(const std::string& host) const;

    // Parse a management /api/models answer. Unknown or malformed entries are skipped.
    static ServerCapabilities parse_management_models(const json& body);

    // Model names from a runtime /api/tags answer
    static std::vector<std::string> parse_runtime_tags(const json& body);

    // Voice ids from a Piper /voices or VibeVoice /v1/audio/voices answer
    static std::vector<std::string> parse_piper_voices(const json& body);
    static std::vector<std::string> parse_vibevoice_voices(const json& body);

    // "3 LLM model(s), 1 STT model(s), piper TTS (2 voice(s))" or "No services found"
    static std::string summarize(const ServerCapabilities& caps);

    const ProberOptions& options() const { return options_; }

private:
    using VoiceParser = std::vector<std::string> (*)(const json&);

    std::optional<ServerCapabilities> probe_management(const std::string& host) const;
    std::optional<ServerCapabilities> probe_services(const std::string& host) const;
    std::optional<std::vector<std::string>> probe_model_runtime(const std::string& host) const;
    std::optional<std::vector<std::string>> probe_voices(const std::string& host, uint16_t port,
                                                         const std::string& path,
                                                         VoiceParser parse) const;
    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    ProberOptions options_;
    std::string log_level_;
};

// Replace the discovered model and voice lists of a record wholesale
void apply_capabilities(ServerConfig& config, const ServerCapabilities& caps);

} // namespace lodestar
