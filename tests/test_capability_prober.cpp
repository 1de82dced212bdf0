#include <iostream>
#include <string>

#include <lodestar/capability_prober.h>
#include "test_support.h"

using namespace lodestar;
using lodestar_test::expect;

static const char* MANAGEMENT_MODELS = R"({
    "models": [
        {"name": "llama3.1:8b", "type": "llm"},
        {"name": "qwen2.5:32b", "type": "llm"},
        {"name": "whisper-large-v3", "type": "stt"},
        {"name": "en_US-amy-medium", "type": "tts", "server_name": "piper"},
        {"name": "en_GB-alan-low", "type": "tts", "server_name": "piper"},
        {"name": "mystery", "type": "embedding"},
        {"type": "llm"},
        "not an object"
    ]
})";

static const char* RUNTIME_TAGS = R"({
    "models": [
        {"name": "llama3.1:8b", "size": 4920753328},
        {"name": "nomic-embed-text"}
    ]
})";

static const char* PIPER_VOICES = R"({
    "voices": [
        {"id": "nova", "name": "Nova"},
        {"id": "alloy", "name": "Alloy"},
        {"name": "no id"}
    ]
})";

static const char* VIBEVOICE_VOICES = R"({
    "voices": [
        {"voice_id": "Carter", "name": "Carter"},
        {"voice_id": "Emma", "name": "Emma"}
    ]
})";

int main() {
    int failures = 0;

    // Test 1: parsing the management model list
    {
        std::cout << "[TEST] Management model list\n";
        ServerCapabilities caps = CapabilityProber::parse_management_models(json::parse(MANAGEMENT_MODELS));
        expect(caps.llm_models == std::vector<std::string>({"llama3.1:8b", "qwen2.5:32b"}), "llm models", failures);
        expect(caps.stt_models == std::vector<std::string>({"whisper-large-v3"}), "stt models", failures);
        expect(caps.tts_voice_sets.size() == 1 && caps.tts_voice_sets["piper"].size() == 2,
               "voices grouped by engine", failures);
        expect(caps.source == CapabilitySource::MANAGEMENT, "source is management", failures);

        ServerCapabilities unnamed_engine = CapabilityProber::parse_management_models(
            json::parse(R"({"models": [{"name": "voice-1", "type": "tts"}]})"));
        expect(unnamed_engine.tts_voice_sets.count("tts") == 1, "engine defaults to tts", failures);

        ServerCapabilities empty = CapabilityProber::parse_management_models(json::parse(R"({"status": "ok"})"));
        expect(empty.is_empty(), "missing list yields nothing", failures);
    }

    // Test 2: runtime tags and summaries
    {
        std::cout << "[TEST] Runtime tags and summary\n";
        auto tags = CapabilityProber::parse_runtime_tags(json::parse(RUNTIME_TAGS));
        expect(tags == std::vector<std::string>({"llama3.1:8b", "nomic-embed-text"}), "tag names", failures);
        expect(CapabilityProber::parse_piper_voices(json::parse(PIPER_VOICES)) ==
               std::vector<std::string>({"nova", "alloy"}), "piper voice ids", failures);
        expect(CapabilityProber::parse_vibevoice_voices(json::parse(VIBEVOICE_VOICES)) ==
               std::vector<std::string>({"Carter", "Emma"}), "vibevoice voice ids", failures);

        ServerCapabilities caps = CapabilityProber::parse_management_models(json::parse(MANAGEMENT_MODELS));
        expect(CapabilityProber::summarize(caps) == "2 LLM model(s), 1 STT model(s), piper TTS (2 voice(s))",
               "summary lists every service", failures);
        expect(CapabilityProber::summarize(ServerCapabilities()) == "No services found", "empty summary", failures);

        ServerConfig record;
        record.discovered_models = {"stale"};
        apply_capabilities(record, caps);
        expect(record.discovered_models ==
               std::vector<std::string>({"llama3.1:8b", "qwen2.5:32b", "whisper-large-v3"}),
               "models replaced with llm and stt", failures);
        expect(record.discovered_voices.size() == 2, "voices replaced", failures);
    }

    lodestar_test::LoopbackServer management;
    management.routes().Get("/api/models", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(MANAGEMENT_MODELS, "application/json");
    });

    lodestar_test::LoopbackServer broken_management;
    broken_management.routes().Get("/api/models", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("<html>oops</html>", "text/html");
    });

    lodestar_test::LoopbackServer runtime;
    runtime.routes().Get("/api/version", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"version": "0.5.1"})", "application/json");
    });
    runtime.routes().Get("/api/tags", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(RUNTIME_TAGS, "application/json");
    });

    lodestar_test::LoopbackServer piper;
    piper.routes().Get("/voices", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(PIPER_VOICES, "application/json");
    });

    lodestar_test::LoopbackServer vibevoice;
    vibevoice.routes().Get("/v1/audio/voices", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(VIBEVOICE_VOICES, "application/json");
    });

    lodestar_test::LoopbackServer closed;
    int closed_port = closed.start();
    closed.stop();

    int management_port = management.start();
    int broken_port = broken_management.start();
    int runtime_port = runtime.start();
    int piper_port = piper.start();
    int vibevoice_port = vibevoice.start();
    if (!expect(management_port > 0 && broken_port > 0 && runtime_port > 0 && closed_port > 0 &&
                piper_port > 0 && vibevoice_port > 0,
                "loopback servers started", failures)) {
        return lodestar_test::finish("capability prober", failures);
    }

    auto options_for = [closed_port](int management, int model_runtime,
                                     int piper_voices = 0, int vibevoice_voices = 0) {
        ProberOptions options;
        options.management_port = static_cast<uint16_t>(management);
        options.model_runtime_port = static_cast<uint16_t>(model_runtime);
        options.piper_port = static_cast<uint16_t>(piper_voices ? piper_voices : closed_port);
        options.vibevoice_port = static_cast<uint16_t>(vibevoice_voices ? vibevoice_voices : closed_port);
        options.management_timeout = std::chrono::milliseconds(2000);
        options.model_runtime_timeout = std::chrono::milliseconds(2000);
        return options;
    };

    // Test 3: the management surface answers first
    {
        std::cout << "[TEST] Probe management surface\n";
        CapabilityProber prober(options_for(management_port, runtime_port));
        ServerCapabilities caps = prober.probe("127.0.0.1");
        expect(caps.source == CapabilitySource::MANAGEMENT, "management used", failures);
        expect(caps.stt_models.size() == 1, "stt models included", failures);
        expect(caps.summary == "2 LLM model(s), 1 STT model(s), piper TTS (2 voice(s))", "summary set", failures);
    }

    // Test 4: fall back to the model runtime
    {
        std::cout << "[TEST] Probe model runtime fallback\n";
        CapabilityProber unreachable(options_for(closed_port, runtime_port));
        ServerCapabilities caps = unreachable.probe("127.0.0.1");
        expect(caps.source == CapabilitySource::MODEL_RUNTIME, "runtime used when management is down", failures);
        expect(caps.llm_models.size() == 2 && caps.stt_models.empty() && caps.tts_voice_sets.empty(),
               "runtime only reports llm models", failures);

        CapabilityProber unreadable(options_for(broken_port, runtime_port));
        expect(unreadable.probe("127.0.0.1").source == CapabilitySource::MODEL_RUNTIME,
               "runtime used when management answers garbage", failures);
    }

    // Test 5: voice servers answer directly
    {
        std::cout << "[TEST] Voice servers\n";
        CapabilityProber prober(options_for(closed_port, runtime_port, piper_port, vibevoice_port));
        ServerCapabilities caps = prober.probe("127.0.0.1");
        expect(caps.source == CapabilitySource::MODEL_RUNTIME, "direct services used", failures);
        expect(caps.llm_models.size() == 2, "runtime models kept", failures);
        expect(caps.tts_voice_sets["piper"] == std::vector<std::string>({"nova", "alloy"}), "piper voices", failures);
        expect(caps.tts_voice_sets["vibevoice"] == std::vector<std::string>({"Carter", "Emma"}),
               "vibevoice voices", failures);

        CapabilityProber voices_only(options_for(closed_port, closed_port, piper_port));
        ServerCapabilities piper_caps = voices_only.probe("127.0.0.1");
        expect(piper_caps.source == CapabilitySource::MODEL_RUNTIME && piper_caps.llm_models.empty(),
               "voices found without a model runtime", failures);
        expect(piper_caps.summary == "piper TTS (2 voice(s))", "voice summary", failures);

        ServerConfig record;
        apply_capabilities(record, piper_caps);
        expect(record.discovered_voices == std::vector<std::string>({"nova", "alloy"}), "voices recorded", failures);
    }

#ifndef _WIN32
    // Test 6: a host that never finishes answering cannot stall the prober
    {
        std::cout << "[TEST] Slow management host\n";
        lodestar_test::TrickleServer slow;
        int slow_port = slow.start();
        if (expect(slow_port > 0, "trickle server started", failures)) {
            ProberOptions options = options_for(slow_port, closed_port);
            options.management_timeout = std::chrono::milliseconds(1000);
            options.model_runtime_timeout = std::chrono::milliseconds(500);
            CapabilityProber prober(options);

            auto began = std::chrono::steady_clock::now();
            ServerCapabilities caps = prober.probe("127.0.0.1");
            expect(caps.source == CapabilitySource::NONE, "slow management surface skipped", failures);
            expect(std::chrono::steady_clock::now() - began < std::chrono::milliseconds(3000),
                   "capabilities bounded by both attempt timeouts", failures);
        }
    }
#endif

    // Test 7: nothing answers
    {
        std::cout << "[TEST] Probe unreachable host\n";
        CapabilityProber prober(options_for(closed_port, closed_port));
        ServerCapabilities caps = prober.probe("127.0.0.1");
        expect(caps.source == CapabilitySource::NONE && caps.is_empty(), "empty capabilities", failures);
        expect(caps.summary == "No services found", "empty summary", failures);
    }

    return lodestar_test::finish("capability prober", failures);
}
