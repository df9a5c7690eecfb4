// apps/probe_tool/src/main.cpp
// Conduit Gateway: probe_tool
// Purpose: one-shot health probe of a backend URL, the same GET the registry
// health loop issues. Handy when an instance is reported unhealthy.
//
// Usage:
//   ./conduit_probe <url> [count] [timeout_ms]
//   ./conduit_probe http://10.0.0.5:8080/health 3 2000
//
// Exit status: 0 if every probe returned 2xx, 1 otherwise, 2 on usage errors.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "conduit/config/constants.hpp"
#include "conduit/obs/logging.hpp"
#include "conduit/proxy/beast_transport.hpp"
#include "conduit/version.hpp"

using namespace conduit;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <url> [count] [timeout_ms]\n";
        return 2;
    }
    const std::string url = argv[1];
    const int count = (argc > 2) ? std::atoi(argv[2]) : 1;
    const long timeout_ms = (argc > 3) ? std::atol(argv[3]) : config::constants::HEALTH_TIMEOUT_MS;
    if (count < 1 || timeout_ms < 1) {
        std::cerr << "count and timeout_ms must be positive\n";
        return 2;
    }
    if (!proxy::parse_http_url(url)) {
        std::cerr << "unsupported url (http:// only): " << url << "\n";
        return 2;
    }

    auto log = obs::logger("probe");
    log->info("{} probing {} ({}x, timeout {} ms)", user_agent, url, count, timeout_ms);

    proxy::BeastTransport transport;
    int healthy = 0;
    for (int i = 0; i < count; ++i) {
        proxy::OutboundRequest req;
        req.method = "GET";
        req.url = url;

        const auto t0 = std::chrono::steady_clock::now();
        auto res = transport.send(req, std::chrono::milliseconds{timeout_ms}, {});
        const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

        if (!res) {
            std::cout << "PROBE " << url << " seq=" << i << " error=" << proxy::to_string(res.error().kind)
                      << " (" << res.error().message << ") time=" << ms << " ms\n";
        } else {
            const bool ok = res->status >= 200 && res->status < 300;
            healthy += ok ? 1 : 0;
            std::cout << "PROBE " << url << " seq=" << i << " status=" << res->status
                      << (ok ? " healthy" : " unhealthy") << " time=" << ms << " ms\n";
        }
        if (i + 1 < count) std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::cout << healthy << "/" << count << " probes healthy\n";
    return healthy == count ? 0 : 1;
}
