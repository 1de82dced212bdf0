#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lodestar {
namespace utils {

using json = nlohmann::json;

class JsonUtils {
public:
    // Read and parse a JSON file. Throws std::runtime_error on I/O or parse errors.
    static json load_from_file(const std::string& path);

    // Write JSON to a temporary sibling and rename it over the target
    static void save_to_file(const json& data, const std::string& path);

    // Parse text without throwing; returns a discarded value on failure
    static json parse_lenient(const std::string& text);

    // Value of `key` if present and convertible, `default_value` otherwise
    template<typename T>
    static T get_or_default(const json& obj, const std::string& key, const T& default_value) {
        if (!obj.is_object()) {
            return default_value;
        }
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return default_value;
        }
        try {
            return it->get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    }

    // String elements of an array field, or of the given key inside each object
    // element. Non-string entries are skipped.
    static std::vector<std::string> string_list(const json& obj, const std::string& key,
                                                const std::string& element_key = "");
};

} // namespace utils
} // namespace lodestar
