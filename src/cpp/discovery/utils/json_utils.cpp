#include "lodestar/utils/json_utils.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lodestar {
namespace utils {

json JsonUtils::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
}

void JsonUtils::save_to_file(const json& data, const std::string& path) {
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }

    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + tmp.string());
        }
        file << data.dump(2) << std::endl;
        if (!file.good()) {
            throw std::runtime_error("Failed to write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + path + ": " + ec.message());
    }
}

json JsonUtils::parse_lenient(const std::string& text) {
    return json::parse(text, nullptr, false);
}

std::vector<std::string> JsonUtils::string_list(const json& obj, const std::string& key,
                                                const std::string& element_key) {
    std::vector<std::string> result;
    if (!obj.is_object()) {
        return result;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) {
        return result;
    }

    for (const auto& item : *it) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        } else if (!element_key.empty() && item.is_object()) {
            auto field = item.find(element_key);
            if (field != item.end() && field->is_string()) {
                result.push_back(field->get<std::string>());
            }
        }
    }
    return result;
}

} // namespace utils
} // namespace lodestar
