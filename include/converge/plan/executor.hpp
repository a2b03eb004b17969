#pragma once
/**
 * @file executor.hpp
 * @brief ReconciliationExecutor: applies a Plan strictly in order, never rolls back.
 *
 * Failure policy:
 *  - a failed action is recorded and execution continues;
 *  - an action whose target or needed identity failed/was skipped earlier is Skipped,
 *    and its own target then counts as failed (skips propagate transitively);
 *  - before a start, direct dependencies with health checks must verify healthy
 *    (checked once per run, cached);
 *  - NotFound on stop/remove is success;
 *  - a stop request skips every remaining action.
 */

#include <map>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "converge/health/verifier.hpp"
#include "converge/obs/observability.hpp"
#include "converge/plan/action.hpp"
#include "converge/runtime/runtime.hpp"

namespace converge::plan {

/** @struct ExecutionReport
 *  @brief Per-action results plus the readiness checks the gate ran.
 */
struct ExecutionReport {
    std::vector<ActionResult> results;                 ///< Same order as the plan
    std::vector<health::HealthCheckResult> gates;      ///< Readiness checks, first-use order
    bool cancelled{false};                             ///< Stop was requested mid-run
};

/** @class ReconciliationExecutor
 *  @brief Sequential plan runner with dependency-failure propagation.
 */
class ReconciliationExecutor {
public:
    /**
     * @param runtime  Engine to mutate.
     * @param gate     Verifier used for readiness checks; nullptr disables the gate.
     * @param observer Optional event sink.
     */
    explicit ReconciliationExecutor(runtime::Runtime& runtime,
                                    const health::DependencyHealthVerifier* gate = nullptr,
                                    std::shared_ptr<obs::Observer> observer = nullptr)
        : runtime_(runtime), gate_(gate), observer_(std::move(observer)) {}

    [[nodiscard]] ExecutionReport execute(const Plan& plan, std::stop_token stop = {});

private:
    runtime::Result<void> apply(const Action& action);

    /// Cached readiness result for one dependency check.
    const health::HealthCheckResult& readiness(const model::HealthCheckDescriptor& check,
                                               const std::stop_token& stop, ExecutionReport& report);

    runtime::Runtime& runtime_;
    const health::DependencyHealthVerifier* gate_;
    std::shared_ptr<obs::Observer> observer_;
    std::map<std::string, health::HealthCheckResult> gate_cache_;
};

} // namespace converge::plan
