/**
 * @file executor.cpp
 * @brief Sequential action application with skip propagation and readiness gating.
 */
#include "converge/plan/executor.hpp"

#include <chrono>

namespace converge::plan {

    namespace {
        using Clock = std::chrono::steady_clock;

        std::chrono::milliseconds since(Clock::time_point t0) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);
        }
    } // namespace

    runtime::Result<void> ReconciliationExecutor::apply(const Action& a) {
        switch (a.kind) {
            case ActionKind::Stop: {
                auto r = runtime_.stop(a.target);
                if (!r && r.error().code == runtime::RuntimeErrc::NotFound) return {}; // already gone
                return r;
            }
            case ActionKind::Remove: {
                auto r = runtime_.remove(a.object, a.target);
                if (!r && r.error().code == runtime::RuntimeErrc::NotFound) return {};
                return r;
            }
            case ActionKind::Create:
                return runtime_.create(a.create);
            case ActionKind::Start:
                return runtime_.start(a.target);
        }
        return converge_detail::unexpected(runtime::RuntimeError{runtime::RuntimeErrc::Failed, "unknown action"});
    }

    const health::HealthCheckResult&
    ReconciliationExecutor::readiness(const model::HealthCheckDescriptor& check,
                                      const std::stop_token& stop, ExecutionReport& report) {
        if (const auto it = gate_cache_.find(check.target); it != gate_cache_.end()) return it->second;

        obs::logger()->info("gate: verifying {} before dependent start", check.target);
        const model::HealthCheckDescriptor one[] = {check};
        auto results = gate_->verify(one, stop);
        report.gates.push_back(results.front());
        return gate_cache_.emplace(check.target, std::move(results.front())).first->second;
    }

    ExecutionReport ReconciliationExecutor::execute(const Plan& plan, std::stop_token stop) {
        ExecutionReport report;
        report.results.reserve(plan.size());
        gate_cache_.clear();

        std::set<ObjectRef> failed; // identities that failed or were skipped this run

        auto skip_reason = [&](const Action& a) -> std::string {
            if (failed.contains(ObjectRef{a.object, a.target})) return "dependency failed: " + a.target;
            for (const auto& n : a.needs) {
                if (failed.contains(n)) return "dependency failed: " + n.name;
            }
            return {};
        };

        for (const auto& action : plan) {
            const auto t0 = Clock::now();
            ActionResult res{.action = action};

            if (stop.stop_requested()) {
                report.cancelled = true;
                res.outcome = ActionOutcome::Skipped;
                res.error = "cancelled";
            } else if (auto reason = skip_reason(action); !reason.empty()) {
                res.outcome = ActionOutcome::Skipped;
                res.error = std::move(reason);
            } else {
                // Readiness gate: every direct dependency with a health check must be healthy.
                if (action.kind == ActionKind::Start && gate_ != nullptr) {
                    for (const auto& check : action.readiness) {
                        const auto& gr = readiness(check, stop, report);
                        if (!gr.healthy()) {
                            res.outcome = ActionOutcome::Skipped;
                            res.error = "dependency unhealthy: " + check.target + " (" +
                                        std::string(health::to_string(gr.status)) + ")";
                            break;
                        }
                    }
                }
                if (res.error.empty()) {
                    if (auto r = apply(action)) {
                        res.outcome = ActionOutcome::Succeeded;
                    } else {
                        res.outcome = ActionOutcome::Failed;
                        res.error = std::string(runtime::to_string(r.error().code)) + ": " + r.error().message;
                    }
                }
            }

            if (res.outcome != ActionOutcome::Succeeded) failed.insert(ObjectRef{action.object, action.target});
            res.duration = since(t0);

            if (observer_) {
                observer_->record(obs::Event{
                    .kind    = obs::EventKind::Action,
                    .subject = action.label(),
                    .outcome = std::string(to_string(res.outcome)),
                    .detail  = res.error,
                    .elapsed = res.duration,
                    .failure = res.outcome != ActionOutcome::Succeeded});
            }
            report.results.push_back(std::move(res));
        }
        return report;
    }

} // namespace converge::plan
