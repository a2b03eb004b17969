#pragma once
/**
 * @file probe.hpp
 * @brief Single-attempt health probes: TCP connect and HTTP(S) GET.
 *
 * A Prober performs exactly one attempt within a time budget and reports what it
 * saw. Deciding whether that observation counts as healthy is judge()'s job, so
 * fakes in tests only need to fabricate a ProbeOutcome.
 *
 * All probes observe the caller's stop_token at least every PROBE_SLICE_MS.
 */

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>

#include "converge/compat/expected.hpp"
#include "converge/model/service_spec.hpp"

namespace converge::health {

/**
 * @brief Raw observation of one probe attempt.
 */
struct ProbeOutcome final {
  bool        connected{false}; ///< Transport (TCP/TLS) established and request answered
  int         status{0};        ///< HTTP status (0 for TCP probes)
  std::string body;             ///< HTTP response body
  std::string error;            ///< Transport error when !connected
  bool        cancelled{false}; ///< Stop was requested mid-attempt
};

/**
 * @brief Verdict on one outcome against its descriptor.
 */
struct Judgement final {
  bool        healthy{false};
  bool        empty_response{false}; ///< Healthy HTTP answer with an empty body
  std::string error;                 ///< Why it is not healthy
};

/// Apply status range and expected-body rules.
[[nodiscard]] Judgement judge(const model::HealthCheckDescriptor& check, const ProbeOutcome& outcome);

/**
 * @brief Parsed http(s) URL.
 */
struct HttpTarget final {
  bool        tls{false};
  std::string host;
  std::string port;   ///< Numeric service ("80", "443", "8080")
  std::string target; ///< Origin-form request target ("/health?x=1")

  bool operator==(const HttpTarget&) const = default;
};

/// "https://host:8443/p" → {tls, host, "8443", "/p"}. Error text on malformed input.
[[nodiscard]] converge_detail::expected<HttpTarget, std::string> parse_url(std::string_view url);

/// Host header value: host[:port], IPv6 literals bracketed, default port omitted.
[[nodiscard]] std::string host_header(const HttpTarget& target);

/// URL for an HTTP check: `url` when set, else http://host:port/path.
[[nodiscard]] std::string url_for(const model::HealthCheckDescriptor& check);

/**
 * @brief One-attempt probe interface.
 */
class Prober {
public:
  virtual ~Prober() = default;

  /// Run one attempt against `check`, bounded by `budget`.
  virtual ProbeOutcome probe(const model::HealthCheckDescriptor& check,
                             std::chrono::milliseconds budget,
                             std::stop_token stop) = 0;
};

/**
 * @brief Real network prober: POSIX TCP connect, Boost.Beast HTTP(S) GET.
 */
class NetworkProber final : public Prober {
public:
  explicit NetworkProber(bool tls_verify = true) : tls_verify_(tls_verify) {}

  ProbeOutcome probe(const model::HealthCheckDescriptor& check,
                     std::chrono::milliseconds budget,
                     std::stop_token stop) override;

private:
  bool tls_verify_;
};

/// Non-blocking connect to host:port, polled in slices.
ProbeOutcome tcp_probe(const std::string& host, std::uint16_t port,
                       std::chrono::milliseconds budget, std::stop_token stop);

/// GET `target` and read the full response.
ProbeOutcome http_probe(const HttpTarget& target, std::chrono::milliseconds budget,
                        std::stop_token stop, bool tls_verify);

} // namespace converge::health
