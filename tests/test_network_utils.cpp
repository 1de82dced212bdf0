#include <fstream>
#include <iostream>
#include <string>

#include <lodestar/error_types.h>
#include <lodestar/utils/http_client.h>
#include <lodestar/utils/json_utils.h>
#include <lodestar/utils/network_utils.h>
#include <lodestar/utils/path_utils.h>
#include "test_support.h"

using namespace lodestar;
using namespace lodestar::utils;
using lodestar_test::expect;

int main() {
    int failures = 0;

    // Test 1: IPv4 helpers
    {
        std::cout << "[TEST] IPv4 helpers\n";
        auto addr = NetworkUtils::parse_ipv4("192.168.1.20");
        expect(addr && *addr == 0xC0A80114u, "dotted quad parses to host order", failures);
        expect(!NetworkUtils::parse_ipv4("192.168.1"), "short address rejected", failures);
        expect(NetworkUtils::ipv4_to_string(0x0A000001u) == "10.0.0.1", "host order prints", failures);

        expect(NetworkUtils::is_rfc1918("10.20.30.40"), "10/8 private", failures);
        expect(NetworkUtils::is_rfc1918("172.31.255.1"), "172.16/12 private", failures);
        expect(!NetworkUtils::is_rfc1918("172.32.0.1"), "172.32 public", failures);
        expect(NetworkUtils::is_rfc1918("192.168.0.1"), "192.168/16 private", failures);
        expect(!NetworkUtils::is_rfc1918("8.8.8.8"), "public address", failures);
        expect(!NetworkUtils::is_rfc1918("not an ip"), "garbage is not private", failures);
    }

    // Test 2: subnet enumeration
    {
        std::cout << "[TEST] Subnet hosts\n";
        uint32_t addr = *NetworkUtils::parse_ipv4("192.168.1.20");

        auto slash24 = NetworkUtils::subnet_hosts(addr, 0xFFFFFF00u);
        expect(slash24.size() == 254, "a /24 has 254 hosts", failures);
        if (!slash24.empty()) {
            expect(slash24.front() == "192.168.1.1" && slash24.back() == "192.168.1.254",
                   "network and broadcast excluded", failures);
        }

        auto slash16 = NetworkUtils::subnet_hosts(addr, 0xFFFF0000u);
        expect(slash16.size() == 254 && slash16.front() == "192.168.1.1",
               "wide subnet narrowed to the /24 around the interface", failures);

        auto slash28 = NetworkUtils::subnet_hosts(addr, 0xFFFFFFF0u);
        expect(slash28.size() == 14 && slash28.front() == "192.168.1.17", "a /28 has 14 hosts", failures);

        expect(NetworkUtils::subnet_hosts(addr, 0xFFFFFFFFu).empty(), "a /32 has no other hosts", failures);
    }

    // Test 3: neighbour table parsing
    {
        std::cout << "[TEST] Neighbour table\n";
        std::string table =
            "IP address       HW type     Flags       HW address            Mask     Device\n"
            "192.168.1.1      0x1         0x2         aa:bb:cc:dd:ee:ff     *        wlan0\n"
            "192.168.1.30     0x1         0x0         00:00:00:00:00:00     *        wlan0\n"
            "192.168.1.31     0x1         0x2         00:00:00:00:00:00     *        wlan0\n"
            "192.168.1.42     0x1         0x6         11:22:33:44:55:66     *        wlan0\n"
            "garbage line\n";

        auto peers = NetworkUtils::parse_neighbor_table(table);
        expect(peers == std::vector<std::string>({"192.168.1.1", "192.168.1.42"}),
               "only resolved entries are kept", failures);
        expect(NetworkUtils::parse_neighbor_table("").empty(), "empty table", failures);
    }

    // Test 4: URL parsing
    {
        std::cout << "[TEST] URL parsing\n";
        std::string host;
        int port = 0;
        expect(NetworkUtils::parse_http_url("http://192.168.1.20:11400/health", host, port) &&
               host == "192.168.1.20" && port == 11400, "host, port and path", failures);
        expect(NetworkUtils::parse_http_url("lab-pc.local", host, port) && host == "lab-pc.local" && port == 80,
               "bare host defaults to port 80", failures);
        expect(NetworkUtils::parse_http_url("http://[fe80::1]:8080", host, port) && host == "fe80::1" && port == 8080,
               "bracketed IPv6", failures);
        expect(!NetworkUtils::parse_http_url("https://secure.example:443", host, port), "https rejected", failures);
        expect(!NetworkUtils::parse_http_url("http://host:99999", host, port), "port out of range", failures);
        expect(!NetworkUtils::parse_http_url("http://:8080", host, port), "missing host", failures);
    }

    // Test 5: JSON helpers
    {
        std::cout << "[TEST] JSON helpers\n";
        json obj = {{"port", "not a number"}, {"name", "Lab"}, {"models", {{{"name", "a"}}, {{"id", 1}}, {{"name", "b"}}}}};
        expect(JsonUtils::get_or_default<int>(obj, "port", 7) == 7, "wrong type falls back", failures);
        expect(JsonUtils::get_or_default<std::string>(obj, "name", "") == "Lab", "string read", failures);
        expect(JsonUtils::string_list(obj, "models", "name") == std::vector<std::string>({"a", "b"}),
               "names extracted from objects", failures);
        expect(JsonUtils::parse_lenient("{oops").is_discarded(), "lenient parse flags bad input", failures);

        lodestar_test::TempDir dir;
        std::string path = dir.file("nested/data.json");
        JsonUtils::save_to_file({{"k", 1}}, path);
        expect(JsonUtils::load_from_file(path)["k"] == 1, "file written and read back", failures);

        bool threw = false;
        try {
            JsonUtils::load_from_file(dir.file("missing.json"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        expect(threw, "missing file throws", failures);
    }

    // Test 6: ids
    {
        std::cout << "[TEST] UUIDs\n";
        std::string a = generate_uuid();
        std::string b = generate_uuid();
        expect(a.size() == 36 && a[14] == '4', "version 4 layout", failures);
        expect(a != b, "ids are unique", failures);
        expect(!get_default_store_path().empty(), "default store path resolved", failures);
    }

    // Test 7: HTTP client against a loopback server
    {
        std::cout << "[TEST] HTTP client\n";
        lodestar_test::LoopbackServer server;
        server.routes().Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"status\":\"ok\"}", "application/json");
        });
        server.routes().Get("/busy", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
        });
        server.routes().Get("/text", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("<html>ok</html>", "text/html");
        });
        int port = server.start();

        if (expect(port > 0, "loopback server started", failures)) {
            HttpResponse ok = HttpClient::get("127.0.0.1", port, "/health", std::chrono::milliseconds(2000));
            expect(ok.status == 200 && ok.body.find("ok") != std::string::npos, "200 with body", failures);

            HttpResponse busy = HttpClient::get("127.0.0.1", port, "/busy", std::chrono::milliseconds(2000));
            expect(busy.status == 503, "non-200 returned, not thrown", failures);

            expect(HttpClient::is_reachable("127.0.0.1", port, "/health", std::chrono::milliseconds(2000)),
                   "reachable on 200", failures);
            expect(!HttpClient::is_reachable("127.0.0.1", port, "/busy", std::chrono::milliseconds(2000)),
                   "not reachable on 503", failures);

            nlohmann::json health =
                HttpClient::get_json("127.0.0.1", port, "/health", std::chrono::milliseconds(2000));
            expect(health.value("status", "") == "ok", "JSON object returned", failures);

            bool protocol = false;
            try {
                HttpClient::get_json("127.0.0.1", port, "/busy", std::chrono::milliseconds(2000));
            } catch (const ProtocolException&) {
                protocol = true;
            }
            expect(protocol, "non-200 JSON request is a protocol error", failures);

            protocol = false;
            try {
                HttpClient::get_json("127.0.0.1", port, "/text", std::chrono::milliseconds(2000));
            } catch (const ProtocolException&) {
                protocol = true;
            }
            expect(protocol, "non-JSON body is a protocol error", failures);
        }
        server.stop();

        bool transient = false;
        try {
            HttpClient::get("127.0.0.1", port, "/health", std::chrono::milliseconds(500));
        } catch (const TransientNetworkException&) {
            transient = true;
        }
        expect(transient, "refused connection is transient", failures);
    }

#ifndef _WIN32
    // Test 8: the timeout caps the whole request
    {
        std::cout << "[TEST] HTTP client overall deadline\n";
        lodestar_test::TrickleServer slow;
        int port = slow.start();
        if (expect(port > 0, "trickle server started", failures)) {
            auto began = std::chrono::steady_clock::now();
            bool transient = false;
            try {
                HttpClient::get("127.0.0.1", port, "/health", std::chrono::milliseconds(1000));
            } catch (const TransientNetworkException&) {
                transient = true;
            }
            auto elapsed = std::chrono::steady_clock::now() - began;
            expect(transient, "trickled answer is a transient failure", failures);
            expect(elapsed < std::chrono::milliseconds(2500), "request ends near its deadline", failures);
            expect(!HttpClient::is_reachable("127.0.0.1", port, "/health", std::chrono::milliseconds(500)),
                   "trickled answer is not reachable", failures);
        }
    }
#endif

    return lodestar_test::finish("network utils", failures);
}
