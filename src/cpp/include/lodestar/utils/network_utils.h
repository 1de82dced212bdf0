#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lodestar {
namespace utils {

struct Ipv4Interface {
    std::string name;
    uint32_t address = 0;  // Host byte order
    uint32_t netmask = 0;  // Host byte order
};

class NetworkUtils {
public:
    // Up, non-loopback IPv4 interfaces
    static std::vector<Ipv4Interface> list_ipv4_interfaces();

    static std::optional<uint32_t> parse_ipv4(const std::string& text);
    static std::string ipv4_to_string(uint32_t address);

    // 10/8, 172.16/12, 192.168/16
    static bool is_rfc1918(const std::string& ipv4);
    static bool is_rfc1918(uint32_t address);

    // Every host address of the interface's subnet. Prefixes wider than
    // `min_prefix` are narrowed to the /min_prefix around the interface address.
    // Network and broadcast addresses are excluded.
    static std::vector<std::string> subnet_hosts(uint32_t address, uint32_t netmask, int min_prefix = 24);

    // IPv4 addresses with a complete hardware address in a /proc/net/arp style table
    static std::vector<std::string> parse_neighbor_table(const std::string& table_text);

    // The kernel neighbour table (Linux only, empty elsewhere)
    static std::vector<std::string> read_neighbor_table();

    // Split "http://host:port/path" into host and port. Port defaults to 80.
    static bool parse_http_url(const std::string& url, std::string& host, int& port);
};

} // namespace utils
} // namespace lodestar
