#pragma once

#include <stdexcept>
#include <string>

namespace lodestar {

// Base class for every error raised by lodestar components
class LodestarException : public std::runtime_error {
public:
    explicit LodestarException(const std::string& message)
        : std::runtime_error(message) {}
};

// Any failure talking to a remote endpoint
class NetworkException : public LodestarException {
public:
    explicit NetworkException(const std::string& message)
        : LodestarException(message) {}
};

// Timeouts, refused connections, unreachable hosts.
// Expected on an untrusted LAN; callers treat these as "not found".
class TransientNetworkException : public NetworkException {
public:
    TransientNetworkException(const std::string& endpoint, const std::string& reason)
        : NetworkException(endpoint + ": " + reason), endpoint_(endpoint), reason_(reason) {}

    const std::string& endpoint() const { return endpoint_; }
    const std::string& reason() const { return reason_; }

private:
    std::string endpoint_;
    std::string reason_;
};

// A host was contacted but answered with something we cannot use
class ProtocolException : public LodestarException {
public:
    ProtocolException(const std::string& endpoint, const std::string& detail)
        : LodestarException("Unexpected response from " + endpoint + ": " + detail) {}
};

// Malformed input rejected at the boundary (manual entry, CLI arguments)
class InvalidInputException : public LodestarException {
public:
    explicit InvalidInputException(const std::string& message)
        : LodestarException("Invalid input: " + message) {}
};

// Unknown server id passed to the config store
class ServerNotFoundException : public LodestarException {
public:
    explicit ServerNotFoundException(const std::string& id)
        : LodestarException("Server not found: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// A discovery tier failed for a reason other than "nothing found"
class DiscoveryException : public LodestarException {
public:
    DiscoveryException(const std::string& tier_name, const std::string& detail)
        : LodestarException(tier_name + " discovery failed: " + detail) {}
};

} // namespace lodestar
