#include "lodestar/tiers/subnet_scan_tier.h"
#include "lodestar/utils/network_utils.h"
#include <algorithm>
#include <iostream>
#include <set>

using namespace lodestar::utils;

#define DEBUG_LOG(tier, msg) \
    if ((tier)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {
namespace tiers {

SubnetScanTier::SubnetScanTier(std::vector<uint16_t> ports, SweepOptions options,
                               const std::string& log_level, HostSource hosts)
    : DiscoveryTierProbe(DiscoveryTier::SUBNET_SCAN, log_level),
      ports_(std::move(ports)),
      sweep_(options, log_level),
      hosts_(hosts ? std::move(hosts) : HostSource(&SubnetScanTier::local_subnet_hosts)) {}

std::vector<std::string> SubnetScanTier::local_subnet_hosts() {
    std::vector<std::string> hosts;
    std::set<std::string> seen;
    std::set<std::string> own;

    auto interfaces = NetworkUtils::list_ipv4_interfaces();
    for (const auto& iface : interfaces) {
        own.insert(NetworkUtils::ipv4_to_string(iface.address));
    }

    for (const auto& iface : interfaces) {
        if (!NetworkUtils::is_rfc1918(iface.address)) {
            continue;
        }
        for (auto& host : NetworkUtils::subnet_hosts(iface.address, iface.netmask)) {
            if (own.count(host) || !seen.insert(host).second) {
                continue;
            }
            hosts.push_back(std::move(host));
        }
    }
    return hosts;
}

std::optional<DiscoveredServer> SubnetScanTier::discover(std::chrono::milliseconds timeout,
                                                         const CancellationToken& token) {
    std::vector<std::string> hosts = hosts_();
    if (hosts.empty()) {
        DEBUG_LOG(this, "[SubnetScanTier] No private IPv4 subnet to scan");
        return std::nullopt;
    }

    std::cout << "[SubnetScanTier] Scanning " << hosts.size() << " host(s) on "
              << ports_.size() << " port(s)" << std::endl;

    auto hit = sweep_.run(EndpointSweep::expand(hosts, ports_), timeout, token);
    if (!hit) {
        return std::nullopt;
    }

    std::cout << "[SubnetScanTier] Found server at " << hit->host << ":" << hit->port << std::endl;
    return DiscoveredServer(hit->host, hit->host, hit->port, DiscoveryMethod::SUBNET_SCAN);
}

} // namespace tiers
} // namespace lodestar
