// apps/converge_probe/src/main.cpp
// converge: converge_probe
// Purpose: one-shot dependency check outside a reconcile run.
//
// Usage:
//   ./converge_probe <url|host:port> [attempts]
//
// Notes:
// - http:// and https:// targets are probed as remote HTTP dependencies,
//   host:port targets as local TCP dependencies.
// - Polling policy comes from the built-in verify.* defaults; attempts overrides max_attempts.
// - Exit status: 0 healthy, 1 not healthy, 64 usage error.

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "converge/health/probe.hpp"
#include "converge/health/verifier.hpp"
#include "converge/obs/observability.hpp"

namespace {

constexpr int EXIT_USAGE = 64;

using converge::model::HealthCheckDescriptor;

template <class T>
std::optional<T> parse_number(std::string_view s) {
    T v{};
    const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
    return v;
}

/// URL → remote HTTP check; host:port → local TCP check.
std::optional<HealthCheckDescriptor> descriptor_for(std::string_view arg) {
    HealthCheckDescriptor d;
    d.target = std::string(arg);
    if (arg.find("://") != std::string_view::npos) {
        if (auto parsed = converge::health::parse_url(arg); !parsed) {
            std::cerr << "converge_probe: " << parsed.error() << "\n";
            return std::nullopt;
        }
        d.scope = converge::model::HealthScope::Remote;
        d.kind  = converge::model::ProbeKind::Http;
        d.url   = std::string(arg);
        return d;
    }
    const auto colon = arg.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        std::cerr << "converge_probe: expected URL or host:port, got " << arg << "\n";
        return std::nullopt;
    }
    const auto port = parse_number<std::uint16_t>(arg.substr(colon + 1));
    if (!port || *port == 0) {
        std::cerr << "converge_probe: bad port in " << arg << "\n";
        return std::nullopt;
    }
    d.kind = converge::model::ProbeKind::Tcp;
    d.host = std::string(arg.substr(0, colon));
    d.port = *port;
    return d;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: converge_probe <url|host:port> [attempts]\n";
        return EXIT_USAGE;
    }
    const auto check = descriptor_for(argv[1]);
    if (!check) return EXIT_USAGE;

    converge::health::VerifyOptions opts;
    opts.concurrency = 1;
    if (argc == 3) {
        const auto attempts = parse_number<std::uint32_t>(argv[2]);
        if (!attempts || *attempts == 0) {
            std::cerr << "converge_probe: attempts must be a positive integer\n";
            return EXIT_USAGE;
        }
        opts.max_attempts = *attempts;
    }

    converge::obs::set_run_id(converge::obs::make_run_id());
    const converge::health::DependencyHealthVerifier verifier(nullptr, opts);
    const auto results = verifier.verify(std::span<const HealthCheckDescriptor>(&*check, 1));
    const auto& r = results.front();

    std::cout << r.target << ": " << converge::health::to_string(r.status)
              << " attempts=" << r.attempts
              << " elapsed=" << r.elapsed.count() << "ms";
    if (r.last_status != 0) std::cout << " http=" << r.last_status;
    if (r.empty_response) std::cout << " (empty response)";
    if (!r.healthy()) std::cout << " " << converge::health::to_string(r.failure) << ": " << r.last_error;
    std::cout << std::endl;

    return r.healthy() ? 0 : 1;
}
