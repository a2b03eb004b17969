/**
 * @file diagnostic_report.cpp
 * @brief Verdict fold and per-stage summaries.
 */
#include "converge/report/diagnostic_report.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace converge::report {

namespace {

std::chrono::milliseconds timing_of(const ReportInputs& in, std::string_view stage) {
    for (const auto& t : in.timings) {
        if (t.name == stage) return t.elapsed;
    }
    return std::chrono::milliseconds{0};
}

std::size_t count_outcome(const std::vector<plan::ActionResult>& rs, plan::ActionOutcome o) {
    return static_cast<std::size_t>(
        std::count_if(rs.begin(), rs.end(), [o](const plan::ActionResult& r) { return r.outcome == o; }));
}

} // namespace

std::string_view to_string(Verdict v) noexcept {
    switch (v) {
        case Verdict::Success:        return "Success";
        case Verdict::PartialSuccess: return "PartialSuccess";
        case Verdict::Failed:         return "Failed";
    }
    return "Failed";
}

int exit_code(Verdict v) noexcept {
    switch (v) {
        case Verdict::Success:        return 0;
        case Verdict::PartialSuccess: return 2;
        case Verdict::Failed:         return 1;
    }
    return 1;
}

std::string_view to_string(StageStatus s) noexcept {
    switch (s) {
        case StageStatus::Ok:      return "ok";
        case StageStatus::Failed:  return "failed";
        case StageStatus::Skipped: return "skipped";
    }
    return "failed";
}

Verdict DiagnosticReporter::fold(const ReportInputs& in) noexcept {
    if (!in.config_errors.empty() || !in.fatal_errors.empty()) return Verdict::Failed;

    const bool action_failed = std::any_of(in.actions.begin(), in.actions.end(), [](const plan::ActionResult& r) {
        return r.outcome != plan::ActionOutcome::Succeeded;
    });
    if (action_failed) return Verdict::Failed;

    bool partial = in.verification_cancelled;
    for (const auto& h : in.health) {
        if (h.healthy()) continue;
        if (h.status == health::HealthStatus::Cancelled) { partial = true; continue; }
        if (h.scope == model::HealthScope::Local) return Verdict::Failed;
        partial = true; // remote dependency down: we did our part
    }
    return partial ? Verdict::PartialSuccess : Verdict::Success;
}

std::string summarize(const runtime::Inventory& inv) {
    return fmt::format("{} objects: {} running, {} stopped/created, {} orphaned, {} absent",
                       inv.size(),
                       runtime::count_state(inv, runtime::LifecycleState::Running),
                       runtime::count_state(inv, runtime::LifecycleState::Stopped) +
                           runtime::count_state(inv, runtime::LifecycleState::Created),
                       runtime::count_state(inv, runtime::LifecycleState::Orphaned),
                       runtime::count_state(inv, runtime::LifecycleState::Absent));
}

DiagnosticReport DiagnosticReporter::report(const ReportInputs& in) {
    DiagnosticReport r;
    r.run_id  = in.run_id;
    r.project = in.project;
    r.dry_run = in.dry_run;
    r.verdict = fold(in);
    if (in.inventory) r.inventory = *in.inventory;
    r.inventory_after = in.inventory_after;
    if (in.plan) r.plan = *in.plan;
    r.actions = in.actions;
    r.gates   = in.gates;
    r.health  = in.health;

    for (const auto& e : in.config_errors) {
        r.errors.push_back(fmt::format("{}: {} ({})", config::to_string(e.code), e.message, e.key));
    }
    r.errors.insert(r.errors.end(), in.fatal_errors.begin(), in.fatal_errors.end());

    // config
    {
        StageSummary s{"config", StageStatus::Ok, {}, timing_of(in, "config")};
        if (!in.config_errors.empty()) {
            s.status  = StageStatus::Failed;
            s.summary = r.errors.front();
        } else {
            s.summary = fmt::format("project {} resolved", in.project);
        }
        r.stages.push_back(std::move(s));
    }

    // inventory
    {
        StageSummary s{"inventory", StageStatus::Skipped, "not reached", timing_of(in, "inventory")};
        if (in.inventory) {
            s.status  = StageStatus::Ok;
            s.summary = summarize(*in.inventory);
        } else if (in.config_errors.empty() && !in.fatal_errors.empty()) {
            s.status  = StageStatus::Failed;
            s.summary = in.fatal_errors.front();
        }
        r.stages.push_back(std::move(s));
    }

    // plan
    {
        StageSummary s{"plan", StageStatus::Skipped, "not reached", timing_of(in, "plan")};
        if (in.plan) {
            s.status  = StageStatus::Ok;
            s.summary = in.plan->empty() ? std::string("already converged, nothing to do")
                                         : fmt::format("{} actions", in.plan->size());
        } else if (in.inventory && !in.fatal_errors.empty()) {
            s.status  = StageStatus::Failed;
            s.summary = in.fatal_errors.front();
        }
        r.stages.push_back(std::move(s));
    }

    // execute
    {
        StageSummary s{"execute", StageStatus::Skipped, in.dry_run ? "dry run" : "not reached",
                       timing_of(in, "execute")};
        if (in.plan && !in.dry_run) {
            const auto failed  = count_outcome(in.actions, plan::ActionOutcome::Failed);
            const auto skipped = count_outcome(in.actions, plan::ActionOutcome::Skipped);
            s.status  = failed + skipped == 0 ? StageStatus::Ok : StageStatus::Failed;
            s.summary = fmt::format("{} succeeded, {} failed, {} skipped",
                                    count_outcome(in.actions, plan::ActionOutcome::Succeeded), failed, skipped);
        }
        r.stages.push_back(std::move(s));
    }

    // verify
    {
        StageSummary s{"verify", StageStatus::Skipped, in.dry_run ? "dry run" : "not reached",
                       timing_of(in, "verify")};
        if (in.verification_ran) {
            const auto healthy = static_cast<std::size_t>(std::count_if(
                in.health.begin(), in.health.end(), [](const health::HealthCheckResult& h) { return h.healthy(); }));
            s.status  = healthy == in.health.size() ? StageStatus::Ok : StageStatus::Failed;
            s.summary = in.health.empty() ? std::string("no health checks declared")
                                          : fmt::format("{}/{} healthy{}", healthy, in.health.size(),
                                                        in.verification_cancelled ? " (cancelled)" : "");
        }
        r.stages.push_back(std::move(s));
    }

    return r;
}

} // namespace converge::report
