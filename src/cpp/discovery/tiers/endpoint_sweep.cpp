#include "lodestar/tiers/endpoint_sweep.h"
#include "lodestar/error_types.h"
#include "lodestar/utils/http_client.h"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

using namespace lodestar::utils;

#define DEBUG_LOG(sweep, msg) \
    if ((sweep)->is_debug()) { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace lodestar {
namespace tiers {

EndpointSweep::EndpointSweep(SweepOptions options, const std::string& log_level)
    : options_(options), log_level_(log_level) {
    if (options_.parallelism == 0) {
        options_.parallelism = 1;
    }
}

std::vector<SweepTarget> EndpointSweep::expand(const std::vector<std::string>& hosts,
                                               const std::vector<uint16_t>& ports) {
    std::vector<SweepTarget> targets;
    targets.reserve(hosts.size() * ports.size());
    for (const auto& host : hosts) {
        for (uint16_t port : ports) {
            targets.push_back({host, port});
        }
    }
    return targets;
}

std::optional<SweepTarget> EndpointSweep::run(const std::vector<SweepTarget>& targets,
                                              std::chrono::milliseconds deadline,
                                              const CancellationToken& token) const {
    if (targets.empty() || token.cancelled()) {
        return std::nullopt;
    }

    auto stop_at = std::chrono::steady_clock::now() + deadline;
    std::atomic<size_t> next_index{0};
    std::atomic<bool> found{false};
    std::mutex result_mutex;
    std::optional<SweepTarget> result;

    auto worker = [&]() {
        while (!found.load() && !token.cancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= stop_at) {
                return;
            }
            size_t index = next_index.fetch_add(1);
            if (index >= targets.size()) {
                return;
            }

            const SweepTarget& target = targets[index];
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(stop_at - now);
            auto read_timeout = std::min(options_.read_timeout, remaining);
            auto connect_timeout = std::min(options_.connect_timeout, remaining);
            std::string path = server_type_health_path(infer_server_type(target.port));

            try {
                HttpResponse response = HttpClient::get(target.host, target.port, path,
                                                        read_timeout, connect_timeout);
                if (response.status != 200) {
                    continue;
                }
                std::lock_guard<std::mutex> lock(result_mutex);
                if (!result) {
                    result = target;
                    found = true;
                }
            } catch (const NetworkException&) {
                // Nothing listening there
            }
        }
    };

    size_t worker_count = std::min(options_.parallelism, targets.size());
    DEBUG_LOG(this, "[EndpointSweep] Probing " << targets.size() << " endpoint(s) with "
              << worker_count << " worker(s)");

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (result) {
        DEBUG_LOG(this, "[EndpointSweep] Found " << result->host << ":" << result->port);
    }
    return result;
}

} // namespace tiers
} // namespace lodestar
