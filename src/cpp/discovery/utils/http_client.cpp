#include "lodestar/utils/http_client.h"
#include "lodestar/error_types.h"
#include <algorithm>
#include <cstdlib>
#include <httplib.h>

namespace lodestar {
namespace utils {

static void apply_timeout(httplib::Client& cli, std::chrono::milliseconds timeout,
                          std::chrono::milliseconds connect_timeout) {
    auto to_parts = [](std::chrono::milliseconds ms, time_t& sec, time_t& usec) {
        if (ms.count() < 1) {
            ms = std::chrono::milliseconds(1);
        }
        sec = static_cast<time_t>(ms.count() / 1000);
        usec = static_cast<time_t>((ms.count() % 1000) * 1000);
    };

    time_t sec = 0;
    time_t usec = 0;
    to_parts(connect_timeout.count() > 0 ? connect_timeout : timeout, sec, usec);
    cli.set_connection_timeout(sec, usec);

    to_parts(timeout, sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);

    // Read and write timeouts restart on every byte; this caps the whole
    // request, connect included
    cli.set_max_timeout(static_cast<time_t>(std::max<long long>(timeout.count(), 1)));
}

HttpResponse HttpClient::get(const std::string& host,
                             int port,
                             const std::string& path,
                             std::chrono::milliseconds timeout,
                             std::chrono::milliseconds connect_timeout) {
    std::string endpoint = host + ":" + std::to_string(port);

    httplib::Client cli(host, port);
    apply_timeout(cli, timeout, connect_timeout);

    // Companion servers behind an API key accept the same bearer token
    const char* api_key = std::getenv("LODESTAR_API_KEY");
    if (api_key && api_key[0] != '\0') {
        cli.set_bearer_token_auth(api_key);
    }

    httplib::Result res = cli.Get(path.c_str());

    if (!res) {
        auto err = res.error();
        switch (err) {
            case httplib::Error::Connection:
                throw TransientNetworkException(endpoint, "connection failed");
            case httplib::Error::Read:
                // Usually the read timeout expired or the peer closed the socket
                throw TransientNetworkException(endpoint, "no response (read timed out or connection closed)");
            case httplib::Error::Write:
                throw TransientNetworkException(endpoint, "connection write error");
            case httplib::Error::Canceled:
                throw TransientNetworkException(endpoint, "request was canceled");
            case httplib::Error::SSLConnection:
            case httplib::Error::SSLServerVerification:
                throw NetworkException(endpoint + ": TLS is not supported for companion servers");
            case httplib::Error::ExceedRedirectCount:
                throw NetworkException(endpoint + ": too many redirects");
            default:
                throw TransientNetworkException(endpoint, "HTTP request failed (" + httplib::to_string(err) + ")");
        }
    }

    HttpResponse response;
    response.status = res->status;
    response.body = res->body;
    return response;
}

nlohmann::json HttpClient::get_json(const std::string& host,
                                   int port,
                                   const std::string& path,
                                   std::chrono::milliseconds timeout) {
    std::string endpoint = host + ":" + std::to_string(port) + path;
    HttpResponse response = get(host, port, path, timeout);
    if (response.status != 200) {
        throw ProtocolException(endpoint, "HTTP " + std::to_string(response.status));
    }

    nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw ProtocolException(endpoint, "body is not a JSON object");
    }
    return body;
}

bool HttpClient::is_reachable(const std::string& host,
                              int port,
                              const std::string& path,
                              std::chrono::milliseconds timeout) {
    try {
        return get(host, port, path, timeout).status == 200;
    } catch (const NetworkException&) {
        return false;
    }
}

} // namespace utils
} // namespace lodestar
