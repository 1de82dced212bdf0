#pragma once

#include <string>
#include <variant>
#include "server_types.h"

namespace lodestar {

namespace state {

struct Idle {
    bool operator==(const Idle&) const { return true; }
};

struct Discovering {
    bool operator==(const Discovering&) const { return true; }
};

struct TryingTier {
    DiscoveryTier tier;
    bool operator==(const TryingTier& other) const { return tier == other.tier; }
};

struct Connected {
    DiscoveredServer server;
    bool operator==(const Connected& other) const { return server == other.server; }
};

struct ManualConfigRequired {
    bool operator==(const ManualConfigRequired&) const { return true; }
};

struct Failed {
    std::string message;
    bool operator==(const Failed& other) const { return message == other.message; }
};

} // namespace state

// Discovery state machine. TryingTier only occurs inside an active session;
// Connected, ManualConfigRequired and Failed end a session.
using DiscoveryState = std::variant<
    state::Idle,
    state::Discovering,
    state::TryingTier,
    state::Connected,
    state::ManualConfigRequired,
    state::Failed
>;

// Overload set for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// True while a session is running (Discovering or TryingTier)
inline bool is_discovering(const DiscoveryState& s) {
    return std::holds_alternative<state::Discovering>(s) ||
           std::holds_alternative<state::TryingTier>(s);
}

inline bool is_terminal(const DiscoveryState& s) {
    return std::holds_alternative<state::Connected>(s) ||
           std::holds_alternative<state::ManualConfigRequired>(s) ||
           std::holds_alternative<state::Failed>(s);
}

std::string discovery_state_name(const DiscoveryState& s);

// User-facing one-liner. Never contains transport error text.
std::string describe_discovery_state(const DiscoveryState& s);

json discovery_state_to_json(const DiscoveryState& s);

} // namespace lodestar
