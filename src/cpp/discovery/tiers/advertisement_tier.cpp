#include "lodestar/tiers/advertisement_tier.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/http_client.h"
#include "lodestar/utils/json_utils.h"
#include "lodestar/utils/network_utils.h"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <set>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
typedef SOCKET socket_t;
#define INVALID_SOCKET_VALUE INVALID_SOCKET
#define close_socket closesocket
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
typedef int socket_t;
#define INVALID_SOCKET_VALUE -1
#define close_socket close
#endif

using namespace lodestar::utils;

#define DEBUG_LOG(tier, msg) \
    if ((tier)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {
namespace tiers {

// Longest a single select() may block, bounding cancellation latency
static const std::chrono::milliseconds POLL_SLICE(200);

namespace {

// Closes the socket on every exit path
class SocketGuard {
public:
    explicit SocketGuard(socket_t fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ != INVALID_SOCKET_VALUE) {
            close_socket(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    socket_t get() const { return fd_; }

private:
    socket_t fd_;
};

} // namespace

AdvertisementTier::AdvertisementTier(uint16_t beacon_port, const std::string& log_level)
    : DiscoveryTierProbe(DiscoveryTier::LOCAL_ADVERTISEMENT, log_level), beacon_port_(beacon_port) {}

std::optional<DiscoveredServer> AdvertisementTier::parse_beacon(const std::string& datagram,
                                                                const std::string& sender_address) {
    json beacon = JsonUtils::parse_lenient(datagram);
    if (beacon.is_discarded() || !beacon.is_object()) {
        return std::nullopt;
    }

    std::string host;
    int port = 0;

    std::string url = JsonUtils::get_or_default<std::string>(beacon, "url", "");
    if (!url.empty()) {
        if (!NetworkUtils::parse_http_url(url, host, port)) {
            return std::nullopt;
        }
    } else {
        host = JsonUtils::get_or_default<std::string>(beacon, "host", "");
        port = JsonUtils::get_or_default<int>(beacon, "port", 0);
        if (port == 0) {
            // Some announcers send the port as a string
            std::string port_text = JsonUtils::get_or_default<std::string>(beacon, "port", "");
            try {
                port = port_text.empty() ? 0 : std::stoi(port_text);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }

    if (host.empty() || host == "0.0.0.0") {
        host = sender_address;
    }
    if (host.empty() || port <= 0 || port > 65535) {
        return std::nullopt;
    }

    std::string name = JsonUtils::get_or_default<std::string>(beacon, "name", "");
    if (name.empty()) {
        name = JsonUtils::get_or_default<std::string>(beacon, "hostname", host);
    }

    return DiscoveredServer(name, host, static_cast<uint16_t>(port), DiscoveryMethod::LOCAL_ADVERTISEMENT);
}

std::optional<DiscoveredServer> AdvertisementTier::discover(std::chrono::milliseconds timeout,
                                                            const CancellationToken& token) {
    socket_t fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == INVALID_SOCKET_VALUE) {
        throw DiscoveryException(name(), "could not open beacon socket");
    }
    SocketGuard guard(fd);

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse)) < 0) {
        std::cerr << "[AdvertisementTier] Warning: Failed to set SO_REUSEADDR" << std::endl;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(beacon_port_);
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw DiscoveryException(name(), "could not listen on UDP port " + std::to_string(beacon_port_));
    }

    DEBUG_LOG(this, "[AdvertisementTier] Listening for beacons on UDP port " << beacon_port_);

    auto stop_at = std::chrono::steady_clock::now() + timeout;
    std::set<std::string> rejected;
    char buffer[2048];

    while (!token.cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= stop_at) {
            break;
        }
        auto slice = std::min(POLL_SLICE,
                              std::chrono::duration_cast<std::chrono::milliseconds>(stop_at - now));

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(fd, &readfds);
        struct timeval tv;
        tv.tv_sec = static_cast<long>(slice.count() / 1000);
        tv.tv_usec = static_cast<long>((slice.count() % 1000) * 1000);

        int ready = select(static_cast<int>(fd) + 1, &readfds, nullptr, nullptr, &tv);
        if (ready < 0) {
            throw DiscoveryException(name(), "beacon socket failed while waiting");
        }
        if (ready == 0) {
            continue;
        }

        struct sockaddr_in sender;
        socklen_t sender_len = sizeof(sender);
        auto received = recvfrom(fd, buffer, sizeof(buffer) - 1, 0,
                                 reinterpret_cast<struct sockaddr*>(&sender), &sender_len);
        if (received <= 0) {
            continue;
        }

        std::string sender_ip = NetworkUtils::ipv4_to_string(ntohl(sender.sin_addr.s_addr));
        auto server = parse_beacon(std::string(buffer, static_cast<size_t>(received)), sender_ip);
        if (!server) {
            DEBUG_LOG(this, "[AdvertisementTier] Ignoring datagram from " << sender_ip);
            continue;
        }
        if (rejected.count(server->endpoint())) {
            continue;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            stop_at - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        // A beacon alone does not prove the HTTP surface is up
        if (HttpClient::is_reachable(server->host(), server->port(),
                                     server_type_health_path(infer_server_type(server->port())),
                                     remaining)) {
            std::cout << "[AdvertisementTier] Found " << server->name()
                      << " at " << server->endpoint() << std::endl;
            return server;
        }

        DEBUG_LOG(this, "[AdvertisementTier] Announced endpoint " << server->endpoint() << " is not answering");
        rejected.insert(server->endpoint());
    }

    return std::nullopt;
}

} // namespace tiers
} // namespace lodestar
