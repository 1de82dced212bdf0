#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace lodestar {
namespace utils {

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Blocking HTTP GET with explicit timeouts. Every call uses its own connection,
// so it is safe to call from any number of threads at once. `timeout` bounds
// the whole request, however slowly the peer sends its answer.
class HttpClient {
public:
    // Any HTTP response (including non-200) is returned.
    // Throws TransientNetworkException on timeouts, refused or dropped connections,
    // and NetworkException on anything else the transport reports.
    static HttpResponse get(const std::string& host,
                            int port,
                            const std::string& path,
                            std::chrono::milliseconds timeout,
                            std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(0));

    // GET that must answer 200 with a JSON object.
    // Throws ProtocolException for any other status or an unreadable body,
    // plus everything get() throws.
    static nlohmann::json get_json(const std::string& host,
                                   int port,
                                   const std::string& path,
                                   std::chrono::milliseconds timeout);

    // True only for a 200 answer; never throws
    static bool is_reachable(const std::string& host,
                             int port,
                             const std::string& path,
                             std::chrono::milliseconds timeout);
};

} // namespace utils
} // namespace lodestar
