#include "lodestar/capability_prober.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/http_client.h"
#include "lodestar/utils/json_utils.h"
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

using namespace lodestar::utils;

#define DEBUG_LOG(prober, msg) \
    if ((prober)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {

CapabilityProber::CapabilityProber(ProberOptions options, const std::string& log_level)
    : options_(options), log_level_(log_level) {}

ServerCapabilities CapabilityProber::parse_management_models(const json& body) {
    ServerCapabilities caps;
    caps.source = CapabilitySource::MANAGEMENT;

    auto models = body.find("models");
    if (models == body.end() || !models->is_array()) {
        return caps;
    }

    for (const auto& entry : *models) {
        if (!entry.is_object()) {
            continue;
        }
        std::string name = JsonUtils::get_or_default<std::string>(entry, "name", "");
        std::string type = JsonUtils::get_or_default<std::string>(entry, "type", "");
        if (name.empty()) {
            continue;
        }

        if (type == "llm") {
            caps.llm_models.push_back(name);
        } else if (type == "stt") {
            caps.stt_models.push_back(name);
        } else if (type == "tts") {
            std::string engine = JsonUtils::get_or_default<std::string>(entry, "server_name", "tts");
            caps.tts_voice_sets[engine].push_back(name);
        }
    }
    return caps;
}

std::vector<std::string> CapabilityProber::parse_runtime_tags(const json& body) {
    // { "models": [{ "name": "qwen2.5:32b", ... }] }
    return JsonUtils::string_list(body, "models", "name");
}

std::vector<std::string> CapabilityProber::parse_piper_voices(const json& body) {
    // { "voices": [{ "id": "nova", "name": "Nova" }] }
    return JsonUtils::string_list(body, "voices", "id");
}

std::vector<std::string> CapabilityProber::parse_vibevoice_voices(const json& body) {
    // { "voices": [{ "voice_id": "nova", "name": "nova" }] }
    return JsonUtils::string_list(body, "voices", "voice_id");
}

std::string CapabilityProber::summarize(const ServerCapabilities& caps) {
    std::vector<std::string> parts;
    if (!caps.llm_models.empty()) {
        parts.push_back(std::to_string(caps.llm_models.size()) + " LLM model(s)");
    }
    if (!caps.stt_models.empty()) {
        parts.push_back(std::to_string(caps.stt_models.size()) + " STT model(s)");
    }
    for (const auto& [engine, voices] : caps.tts_voice_sets) {
        parts.push_back(engine + " TTS (" + std::to_string(voices.size()) + " voice(s))");
    }

    if (parts.empty()) {
        return "No services found";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << parts[i];
    }
    return oss.str();
}

std::optional<ServerCapabilities> CapabilityProber::probe_management(const std::string& host) const {
    try {
        json body = HttpClient::get_json(host, options_.management_port, "/api/models",
                                         options_.management_timeout);
        return parse_management_models(body);
    } catch (const ProtocolException& e) {
        DEBUG_LOG(this, "[CapabilityProber] Management surface on " << host << " is unusable: " << e.what());
        return std::nullopt;
    } catch (const NetworkException& e) {
        DEBUG_LOG(this, "[CapabilityProber] Management surface unavailable: " << e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<std::string>> CapabilityProber::probe_model_runtime(const std::string& host) const {
    auto started = std::chrono::steady_clock::now();

    try {
        HttpClient::get_json(host, options_.model_runtime_port, "/api/version", options_.model_runtime_timeout);
    } catch (const LodestarException& e) {
        DEBUG_LOG(this, "[CapabilityProber] Model runtime unavailable: " << e.what());
        return std::nullopt;
    }

    // The tag listing shares the runtime's budget
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto remaining = options_.model_runtime_timeout - elapsed;
    if (remaining.count() <= 0) {
        return std::vector<std::string>();
    }

    try {
        return parse_runtime_tags(HttpClient::get_json(host, options_.model_runtime_port, "/api/tags", remaining));
    } catch (const LodestarException& e) {
        DEBUG_LOG(this, "[CapabilityProber] Could not list runtime models: " << e.what());
        return std::vector<std::string>();
    }
}

std::optional<std::vector<std::string>> CapabilityProber::probe_voices(const std::string& host, uint16_t port,
                                                                       const std::string& path,
                                                                       VoiceParser parse) const {
    try {
        json body = HttpClient::get_json(host, port, path, options_.model_runtime_timeout);
        return parse(body);
    } catch (const LodestarException& e) {
        DEBUG_LOG(this, "[CapabilityProber] No voices on " << host << ":" << port << ": " << e.what());
        return std::nullopt;
    }
}

std::optional<ServerCapabilities> CapabilityProber::probe_services(const std::string& host) const {
    std::optional<std::vector<std::string>> models;
    std::optional<std::vector<std::string>> piper;
    std::optional<std::vector<std::string>> vibevoice;

    // Each query is bounded by model_runtime_timeout, so running them side by
    // side keeps the whole attempt within it
    std::vector<std::thread> workers;
    workers.emplace_back([&] { models = probe_model_runtime(host); });
    workers.emplace_back([&] { piper = probe_voices(host, options_.piper_port, "/voices", parse_piper_voices); });
    workers.emplace_back([&] {
        vibevoice = probe_voices(host, options_.vibevoice_port, "/v1/audio/voices", parse_vibevoice_voices);
    });
    for (auto& t : workers) {
        t.join();
    }

    if (!models && !piper && !vibevoice) {
        return std::nullopt;
    }

    ServerCapabilities caps;
    caps.source = CapabilitySource::MODEL_RUNTIME;
    if (models) {
        caps.llm_models = *models;
    }
    if (piper && !piper->empty()) {
        caps.tts_voice_sets["piper"] = *piper;
    }
    if (vibevoice && !vibevoice->empty()) {
        caps.tts_voice_sets["vibevoice"] = *vibevoice;
    }
    return caps;
}

ServerCapabilities CapabilityProber::probe(const std::string& host) const {
    std::optional<ServerCapabilities> caps = probe_management(host);
    if (!caps) {
        caps = probe_services(host);
    }
    if (!caps) {
        caps = ServerCapabilities();
    }

    caps->summary = summarize(*caps);
    std::cout << "[CapabilityProber] " << host << ": " << caps->summary
              << " (" << capability_source_to_string(caps->source) << ")" << std::endl;
    return *caps;
}

void apply_capabilities(ServerConfig& config, const ServerCapabilities& caps) {
    config.discovered_models = caps.llm_models;
    config.discovered_models.insert(config.discovered_models.end(),
                                    caps.stt_models.begin(), caps.stt_models.end());
    config.discovered_voices = caps.tts_voices();
}

} // namespace lodestar
