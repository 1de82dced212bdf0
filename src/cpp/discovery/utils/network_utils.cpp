#include "lodestar/utils/network_utils.h"
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#endif

namespace lodestar {
namespace utils {

std::vector<Ipv4Interface> NetworkUtils::list_ipv4_interfaces() {
    std::vector<Ipv4Interface> result;
#ifndef _WIN32
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_netmask == nullptr) {
            continue;
        }
        if (ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        auto* mask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);

        Ipv4Interface iface;
        iface.name = ifa->ifa_name;
        iface.address = ntohl(addr->sin_addr.s_addr);
        iface.netmask = ntohl(mask->sin_addr.s_addr);
        result.push_back(iface);
    }

    freeifaddrs(ifaddr);
#endif
    return result;
}

std::optional<uint32_t> NetworkUtils::parse_ipv4(const std::string& text) {
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string NetworkUtils::ipv4_to_string(uint32_t address) {
    std::ostringstream oss;
    oss << ((address >> 24) & 0xFF) << "."
        << ((address >> 16) & 0xFF) << "."
        << ((address >> 8) & 0xFF) << "."
        << (address & 0xFF);
    return oss.str();
}

bool NetworkUtils::is_rfc1918(uint32_t address) {
    if ((address & 0xFF000000u) == 0x0A000000u) return true;   // 10.0.0.0/8
    if ((address & 0xFFF00000u) == 0xAC100000u) return true;   // 172.16.0.0/12
    if ((address & 0xFFFF0000u) == 0xC0A80000u) return true;   // 192.168.0.0/16
    return false;
}

bool NetworkUtils::is_rfc1918(const std::string& ipv4) {
    auto address = parse_ipv4(ipv4);
    return address && is_rfc1918(*address);
}

std::vector<std::string> NetworkUtils::subnet_hosts(uint32_t address, uint32_t netmask, int min_prefix) {
    int prefix = 0;
    for (uint32_t m = netmask; m & 0x80000000u; m <<= 1) {
        prefix++;
    }
    if (prefix < min_prefix) {
        prefix = min_prefix;
    }

    std::vector<std::string> hosts;
    if (prefix >= 31) {
        return hosts;
    }

    uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
    uint32_t network = address & mask;
    uint32_t broadcast = network | ~mask;

    hosts.reserve(broadcast - network - 1);
    for (uint32_t host = network + 1; host < broadcast; ++host) {
        hosts.push_back(ipv4_to_string(host));
    }
    return hosts;
}

std::vector<std::string> NetworkUtils::parse_neighbor_table(const std::string& table_text) {
    std::vector<std::string> neighbors;
    std::istringstream stream(table_text);
    std::string line;

    // Header: IP address  HW type  Flags  HW address  Mask  Device
    std::getline(stream, line);

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string ip, hw_type, flags, hw_address;
        if (!(fields >> ip >> hw_type >> flags >> hw_address)) {
            continue;
        }

        // ATF_COM (0x2) marks a resolved entry
        unsigned long flag_bits = 0;
        try {
            flag_bits = std::stoul(flags, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (!(flag_bits & 0x2) || hw_address == "00:00:00:00:00:00") {
            continue;
        }
        if (!parse_ipv4(ip)) {
            continue;
        }
        neighbors.push_back(ip);
    }
    return neighbors;
}

std::vector<std::string> NetworkUtils::read_neighbor_table() {
#ifdef __linux__
    std::ifstream file("/proc/net/arp");
    if (!file.is_open()) {
        return {};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_neighbor_table(buffer.str());
#else
    return {};
#endif
}

bool NetworkUtils::parse_http_url(const std::string& url, std::string& host, int& port) {
    std::string rest = url;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    } else if (rest.find("://") != std::string::npos) {
        return false;  // Only plain HTTP endpoints
    }

    size_t slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (authority.empty()) {
        return false;
    }

    std::string host_part = authority;
    std::string port_part;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return false;
        }
        host_part = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_part = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host_part = authority.substr(0, colon);
            port_part = authority.substr(colon + 1);
        }
    }

    if (host_part.empty()) {
        return false;
    }

    int parsed_port = 80;
    if (!port_part.empty()) {
        try {
            size_t consumed = 0;
            parsed_port = std::stoi(port_part, &consumed);
            if (consumed != port_part.size()) {
                return false;
            }
        } catch (const std::exception&) {
            return false;
        }
    }
    if (parsed_port <= 0 || parsed_port > 65535) {
        return false;
    }

    host = host_part;
    port = parsed_port;
    return true;
}

} // namespace utils
} // namespace lodestar
