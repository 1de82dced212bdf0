#include "lodestar/discovery_state.h"

namespace lodestar {

std::string discovery_state_name(const DiscoveryState& s) {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::string { return "idle"; },
        [](const state::Discovering&) -> std::string { return "discovering"; },
        [](const state::TryingTier&) -> std::string { return "tryingTier"; },
        [](const state::Connected&) -> std::string { return "connected"; },
        [](const state::ManualConfigRequired&) -> std::string { return "manualConfigRequired"; },
        [](const state::Failed&) -> std::string { return "failed"; }
    }, s);
}

std::string describe_discovery_state(const DiscoveryState& s) {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::string {
            return "Ready to connect";
        },
        [](const state::Discovering&) -> std::string {
            return "Searching for server...";
        },
        [](const state::TryingTier& t) -> std::string {
            return discovery_tier_description(t.tier);
        },
        [](const state::Connected& c) -> std::string {
            return "Connected to " + c.server.name() + " (" + c.server.endpoint() + ")";
        },
        [](const state::ManualConfigRequired&) -> std::string {
            return "Auto-discovery failed. Please configure manually.";
        },
        [](const state::Failed& f) -> std::string {
            return f.message;
        }
    }, s);
}

json discovery_state_to_json(const DiscoveryState& s) {
    json j = {{"state", discovery_state_name(s)}};
    std::visit(overloaded{
        [&j](const state::TryingTier& t) { j["tier"] = discovery_tier_to_string(t.tier); },
        [&j](const state::Connected& c) { j["server"] = c.server.to_json(); },
        [&j](const state::Failed& f) { j["message"] = f.message; },
        [](const auto&) {}
    }, s);
    return j;
}

} // namespace lodestar
