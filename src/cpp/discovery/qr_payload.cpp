#include "lodestar/qr_payload.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/json_utils.h"
#include <algorithm>
#include <cctype>
#include <map>

using namespace lodestar::utils;

namespace lodestar {

static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

static std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

static bool is_digits(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

static std::optional<uint16_t> parse_port(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || !is_digits(value) || value.size() > 5) {
        return std::nullopt;
    }
    int port = std::stoi(value);
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

static std::optional<QrPayload> from_json(const json& obj) {
    if (!obj.is_object()) {
        return std::nullopt;
    }

    QrPayload payload;
    payload.host = trim(JsonUtils::get_or_default<std::string>(obj, "host", ""));
    payload.name = JsonUtils::get_or_default<std::string>(obj, "name", "");

    std::optional<uint16_t> port;
    auto it = obj.find("port");
    if (it != obj.end()) {
        if (it->is_number_integer()) {
            auto value = it->get<int64_t>();
            if (value > 0 && value <= 65535) {
                port = static_cast<uint16_t>(value);
            }
        } else if (it->is_string()) {
            port = parse_port(it->get<std::string>());
        }
    }

    if (payload.host.empty() || !port) {
        return std::nullopt;
    }
    payload.port = *port;
    return payload;
}

static std::optional<QrPayload> from_pairs(const std::string& text) {
    std::map<std::string, std::string> fields;
    std::string current;

    auto flush = [&fields](const std::string& pair) {
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            eq = pair.find(':');
        }
        if (eq == std::string::npos) {
            return;
        }
        std::string key = to_lower(trim(pair.substr(0, eq)));
        std::string value = trim(pair.substr(eq + 1));
        if (!key.empty() && !fields.count(key)) {
            fields[key] = value;
        }
    };

    for (char c : text) {
        if (c == ';' || c == '&' || c == ',' || c == '\n') {
            flush(current);
            current.clear();
        } else {
            current += c;
        }
    }
    flush(current);

    auto host = fields.find("host");
    auto port = fields.find("port");
    if (host == fields.end() || port == fields.end() || host->second.empty()) {
        return std::nullopt;
    }

    auto parsed_port = parse_port(port->second);
    if (!parsed_port) {
        return std::nullopt;
    }

    QrPayload payload;
    payload.host = host->second;
    payload.port = *parsed_port;
    auto name = fields.find("name");
    if (name != fields.end()) {
        payload.name = name->second;
    }
    return payload;
}

std::optional<QrPayload> parse_qr_payload(const std::string& text) {
    std::string body = trim(text);
    if (body.empty()) {
        return std::nullopt;
    }

    if (body.front() == '{') {
        json obj = JsonUtils::parse_lenient(body);
        if (obj.is_discarded()) {
            return std::nullopt;
        }
        return from_json(obj);
    }
    return from_pairs(body);
}

uint16_t validate_endpoint(const std::string& host, int port) {
    if (trim(host).empty()) {
        throw InvalidInputException("host must not be empty");
    }
    if (port <= 0 || port > 65535) {
        throw InvalidInputException("port " + std::to_string(port) + " is outside 1-65535");
    }
    return static_cast<uint16_t>(port);
}

} // namespace lodestar
