#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lodestar {

// Connection details carried by a pairing QR code
struct QrPayload {
    std::string host;
    uint16_t port = 0;
    std::string name;  // Empty when the code does not name the server
};

// Accepts a JSON object ({"host": "...", "port": 11400, "name": "..."}) or
// key=value pairs separated by ';', '&', ',' or newlines. Both host and a
// valid port must be present; anything else yields nullopt, never an error.
std::optional<QrPayload> parse_qr_payload(const std::string& text);

// Boundary check for manually entered endpoints.
// Throws InvalidInputException for an empty host or a port outside 1..65535.
uint16_t validate_endpoint(const std::string& host, int port);

} // namespace lodestar
