#pragma once
/**
 * @file verifier.hpp
 * @brief DependencyHealthVerifier: bounded-retry liveness checks of local and remote dependencies.
 *
 * Targets are polled concurrently by a fixed pool of std::jthread workers. Each worker
 * claims the next unclaimed target index and writes only that target's result slot,
 * so the result vector needs no lock. Cancellation flows from the caller's
 * stop_token to every in-flight probe and inter-poll wait.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "converge/config/constants.hpp"
#include "converge/health/probe.hpp"
#include "converge/model/service_spec.hpp"
#include "converge/obs/observability.hpp"

namespace converge::health {

/// Final state of one verified target.
enum class HealthStatus : std::uint8_t {
  Healthy,   ///< A probe succeeded
  Unhealthy, ///< max_attempts exhausted without success
  TimedOut,  ///< Overall deadline reached first
  Cancelled  ///< Stop requested before a verdict
};

/// Failure class derived from the target's scope. None for healthy/cancelled targets.
enum class HealthFailure : std::uint8_t { None, LocalUnhealthy, RemoteUnreachable };

std::string_view to_string(HealthStatus s) noexcept;
std::string_view to_string(HealthFailure f) noexcept;

/**
 * @brief Per-target verification outcome.
 */
struct HealthCheckResult final {
  std::string       target;
  model::HealthScope scope{model::HealthScope::Local};
  model::ProbeKind  kind{model::ProbeKind::Tcp};
  std::uint32_t     attempts{0};
  HealthStatus      status{HealthStatus::Cancelled};
  HealthFailure     failure{HealthFailure::None};
  bool              empty_response{false}; ///< Healthy, but the HTTP body was empty
  int               last_status{0};        ///< Last HTTP status seen (0: none)
  std::string       last_error;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] bool healthy() const noexcept { return status == HealthStatus::Healthy; }
};

/**
 * @brief Polling policy (verify.* keys).
 */
struct VerifyOptions final {
  std::chrono::milliseconds timeout{config::constants::VERIFY_TIMEOUT_MS};
  std::chrono::milliseconds poll_interval{config::constants::VERIFY_POLL_INTERVAL_MS};
  std::uint32_t             max_attempts{config::constants::VERIFY_MAX_ATTEMPTS};
  std::chrono::milliseconds attempt_timeout{config::constants::VERIFY_ATTEMPT_TIMEOUT_MS};
  std::uint32_t             concurrency{config::constants::VERIFY_CONCURRENCY};
  bool                      tls_verify{config::constants::VERIFY_TLS_VERIFY};
};

/**
 * @brief Polls health targets until healthy, out of attempts, past the deadline or cancelled.
 *
 * Stateless between calls; one instance may serve the executor's readiness gate
 * and the final verification stage.
 */
class DependencyHealthVerifier final {
public:
  DependencyHealthVerifier(std::shared_ptr<Prober> prober, VerifyOptions options,
                           std::shared_ptr<obs::Observer> observer = nullptr);

  /**
   * @brief Verify every target; results are in target order.
   * @param targets Descriptors to poll.
   * @param stop    Cancellation; unfinished targets come back Cancelled.
   */
  [[nodiscard]] std::vector<HealthCheckResult>
  verify(std::span<const model::HealthCheckDescriptor> targets, std::stop_token stop = {}) const;

  [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
  HealthCheckResult poll_one(const model::HealthCheckDescriptor& check,
                             std::chrono::steady_clock::time_point started,
                             std::chrono::steady_clock::time_point deadline,
                             const std::stop_token& stop) const;

  std::shared_ptr<Prober> prober_;
  VerifyOptions options_;
  std::shared_ptr<obs::Observer> observer_;
};

} // namespace converge::health
