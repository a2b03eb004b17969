/**
 * @file verifier.cpp
 * @brief Worker pool, polling loop and failure classification.
 */

#include "converge/health/verifier.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace converge::health {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point t0) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);
}

/// Sleep until `until` unless stop is requested first. Returns false when stopped.
bool wait_until(Clock::time_point until, const std::stop_token& stop) {
  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(mu);
  cv.wait_until(lk, stop, until, [] { return false; });
  return !stop.stop_requested();
}

} // namespace

std::string_view to_string(HealthStatus s) noexcept {
  switch (s) {
    case HealthStatus::Healthy:   return "healthy";
    case HealthStatus::Unhealthy: return "unhealthy";
    case HealthStatus::TimedOut:  return "timed-out";
    case HealthStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

std::string_view to_string(HealthFailure f) noexcept {
  switch (f) {
    case HealthFailure::None:              return "none";
    case HealthFailure::LocalUnhealthy:    return "LocalUnhealthy";
    case HealthFailure::RemoteUnreachable: return "RemoteUnreachable";
  }
  return "unknown";
}

DependencyHealthVerifier::DependencyHealthVerifier(std::shared_ptr<Prober> prober, VerifyOptions options,
                                                   std::shared_ptr<obs::Observer> observer)
    : prober_(std::move(prober)), options_(options), observer_(std::move(observer)) {
  if (!prober_) prober_ = std::make_shared<NetworkProber>(options_.tls_verify);
  options_.concurrency  = std::max<std::uint32_t>(options_.concurrency, 1);
  options_.max_attempts = std::max<std::uint32_t>(options_.max_attempts, 1);
}

HealthCheckResult DependencyHealthVerifier::poll_one(const model::HealthCheckDescriptor& check,
                                                     Clock::time_point started,
                                                     Clock::time_point deadline,
                                                     const std::stop_token& stop) const {
  HealthCheckResult r;
  r.target = check.target;
  r.scope  = check.scope;
  r.kind   = check.kind;

  for (;;) {
    if (stop.stop_requested()) { r.status = HealthStatus::Cancelled; break; }
    const auto now = Clock::now();
    if (now >= deadline) {
      r.status = HealthStatus::TimedOut;
      if (r.last_error.empty()) r.last_error = "deadline reached before a successful probe";
      break;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto budget = std::min(options_.attempt_timeout, left);
    const ProbeOutcome outcome = prober_->probe(check, budget, stop);
    ++r.attempts;

    if (outcome.cancelled || stop.stop_requested()) { r.status = HealthStatus::Cancelled; break; }

    const Judgement j = judge(check, outcome);
    r.last_status = outcome.status;
    if (j.healthy) {
      r.status = HealthStatus::Healthy;
      r.empty_response = j.empty_response;
      r.last_error.clear();
      break;
    }
    r.last_error = j.error;

    if (r.attempts >= options_.max_attempts) { r.status = HealthStatus::Unhealthy; break; }
    const auto next = std::min(Clock::now() + options_.poll_interval, deadline);
    if (!wait_until(next, stop)) { r.status = HealthStatus::Cancelled; break; }
  }

  if (r.status == HealthStatus::Unhealthy || r.status == HealthStatus::TimedOut) {
    r.failure = check.scope == model::HealthScope::Remote ? HealthFailure::RemoteUnreachable
                                                          : HealthFailure::LocalUnhealthy;
  }
  r.elapsed = since(started);
  return r;
}

std::vector<HealthCheckResult>
DependencyHealthVerifier::verify(std::span<const model::HealthCheckDescriptor> targets,
                                 std::stop_token stop) const {
  const auto started  = Clock::now();
  const auto deadline = started + options_.timeout;

  // Pre-sized slots: one writer each. Unclaimed slots stay Cancelled.
  std::vector<HealthCheckResult> results(targets.size());
  for (std::size_t i = 0; i < targets.size(); ++i) {
    results[i].target = targets[i].target;
    results[i].scope  = targets[i].scope;
    results[i].kind   = targets[i].kind;
    results[i].status = HealthStatus::Cancelled;
  }
  if (targets.empty()) return results;

  // Forward the caller's cancellation to one source shared by all workers.
  std::stop_source internal;
  std::stop_callback forward(stop, [&internal] { internal.request_stop(); });
  const std::stop_token token = internal.get_token();

  std::atomic<std::size_t> next{0};
  const auto workers = std::min<std::size_t>(options_.concurrency, targets.size());
  {
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      pool.emplace_back([&] {
        for (;;) {
          const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
          if (i >= targets.size() || token.stop_requested()) return;
          results[i] = poll_one(targets[i], started, deadline, token);
        }
      });
    }
  } // jthreads join here

  for (auto& r : results) {
    if (r.status == HealthStatus::Cancelled && r.attempts == 0) r.elapsed = since(started);
    if (observer_) {
      observer_->record(obs::Event{
          .kind    = obs::EventKind::Probe,
          .subject = r.target,
          .outcome = std::string(to_string(r.status)),
          .detail  = r.healthy() ? (r.empty_response ? "empty response" : "")
                                 : std::string(to_string(r.failure)) + ": " + r.last_error,
          .elapsed = r.elapsed,
          .failure = !r.healthy() && r.status != HealthStatus::Cancelled});
    }
  }
  return results;
}

} // namespace converge::health
