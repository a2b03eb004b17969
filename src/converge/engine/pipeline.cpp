/**
 * @file pipeline.cpp
 * @brief Stage sequencing, timing and fatal-error short-circuit for one run.
 */
#include "converge/engine/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "converge/config/config_loader.hpp"
#include "converge/config/config_resolver.hpp"
#include "converge/config/constants.hpp"
#include "converge/health/verifier.hpp"
#include "converge/plan/executor.hpp"
#include "converge/plan/planner.hpp"
#include "converge/runtime/docker_cli_runtime.hpp"
#include "converge/runtime/inventory.hpp"
#include "converge/runtime/simulated_runtime.hpp"

namespace converge::engine {

namespace {

using Clock = std::chrono::steady_clock;
namespace K = config::constants;

/// Times one stage and reports it to the observer when closed.
class StageTimer {
public:
    StageTimer(std::string name, report::ReportInputs& in, obs::Observer& observer)
        : name_(std::move(name)), in_(in), observer_(observer), started_(Clock::now()) {}

    void close(std::string_view outcome, std::string detail = {}, bool failure = false) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
        in_.timings.push_back({name_, elapsed});
        observer_.record(obs::Event{.kind    = obs::EventKind::Stage,
                                    .subject = name_,
                                    .outcome = std::string(outcome),
                                    .detail  = std::move(detail),
                                    .elapsed = elapsed,
                                    .failure = failure});
    }

private:
    std::string name_;
    report::ReportInputs& in_;
    obs::Observer& observer_;
    Clock::time_point started_;
};

} // namespace

RuntimeFactory default_runtime_factory() {
    return [](const runtime::RuntimeSettings& s) -> std::shared_ptr<runtime::Runtime> {
        if (s.kind == K::RUNTIME_KIND_DOCKER) return std::make_shared<runtime::DockerCliRuntime>(s);
        if (s.kind == K::RUNTIME_KIND_SIMULATED) return std::make_shared<runtime::SimulatedRuntime>();
        return nullptr;
    };
}

Pipeline::Pipeline(RuntimeFactory factory, std::shared_ptr<health::Prober> prober,
                   std::shared_ptr<obs::Observer> observer)
    : factory_(std::move(factory)), prober_(std::move(prober)), observer_(std::move(observer)) {
    if (!factory_) factory_ = default_runtime_factory();
    if (!observer_) observer_ = obs::make_log_observer();
}

report::DiagnosticReport Pipeline::run(std::span<const config::ConfigLayer> layers,
                                       const PipelineOptions& options, std::stop_token stop) {
    report::ReportInputs in;
    in.run_id  = options.run_id.empty() ? obs::make_run_id() : options.run_id;
    in.dry_run = options.dry_run;
    obs::set_run_id(in.run_id);

    auto finish = [&in]() {
        auto r = report::DiagnosticReporter::report(in);
        obs::logger()->info("run finished: verdict={}", report::to_string(r.verdict));
        return r;
    };

    // ---- config ----
    std::optional<model::Topology> topology;
    config::RunSettings settings;
    {
        StageTimer t("config", in, *observer_);
        const config::ConfigResolver resolver({std::string(K::KEY_PROJECT_NAME),
                                               std::string(K::KEY_TOPOLOGY_SERVICES)});
        auto snap = resolver.resolve(layers);
        if (!snap) {
            in.config_errors.push_back(snap.error());
        } else {
            in.project = snap->get_or(K::KEY_PROJECT_NAME, "");
            auto rs = config::Loader::load_run_settings(*snap);
            if (!rs) in.config_errors.push_back(rs.error());
            else settings = std::move(*rs);

            auto topo = config::Loader::build_topology(*snap);
            if (!topo) in.config_errors.push_back(topo.error());
            else topology = std::move(*topo);
        }

        if (in.config_errors.empty() && options.configure_logging) {
            auto logged = obs::init_logging(settings.log);
            if (!logged) {
                in.config_errors.push_back(
                    {config::ConfigErrc::InvalidValue, "log", logged.error()});
            } else {
                obs::set_run_id(in.run_id);
            }
        }
        in.dry_run = options.dry_run || settings.dry_run;

        if (!in.config_errors.empty()) {
            const auto& e = in.config_errors.front();
            obs::logger()->error("config: {} {} ({})", config::to_string(e.code), e.message, e.key);
            t.close("failed", e.message, true);
            return finish();
        }
        obs::logger()->info("config: project={} services={} externals={}{}", in.project,
                            topology->services().size(), topology->externals().size(),
                            in.dry_run ? " (dry run)" : "");
        t.close("ok");
    }

    // ---- inventory ----
    std::shared_ptr<runtime::Runtime> backend = factory_(settings.runtime);
    if (!backend) {
        StageTimer t("inventory", in, *observer_);
        in.fatal_errors.push_back(fmt::format("no runtime backend \"{}\"", settings.runtime.kind));
        t.close("failed", in.fatal_errors.back(), true);
        return finish();
    }
    runtime::RuntimeInventory inventory(*backend, *topology);
    {
        StageTimer t("inventory", in, *observer_);
        auto inv = inventory.refresh();
        if (!inv) {
            in.fatal_errors.push_back(fmt::format("runtime {}: {}", runtime::to_string(inv.error().code),
                                                  inv.error().message));
            obs::logger()->error("inventory: {}", in.fatal_errors.back());
            t.close("failed", in.fatal_errors.back(), true);
            return finish();
        }
        in.inventory = std::move(*inv);
        t.close("ok", fmt::format("{} objects", in.inventory->size()));
    }

    // ---- plan ----
    {
        StageTimer t("plan", in, *observer_);
        auto p = plan::ReconciliationPlanner{}.plan(*topology, *in.inventory);
        if (!p) {
            in.fatal_errors.push_back(p.error().message);
            obs::logger()->error("plan: {}", p.error().message);
            t.close("failed", p.error().message, true);
            return finish();
        }
        in.plan = std::move(*p);
        for (const auto& a : *in.plan) {
            obs::logger()->debug("plan: [{}] {}", a.rank, a.label());
        }
        t.close("ok", fmt::format("{} actions", in.plan->size()));
    }

    if (in.dry_run) {
        obs::logger()->info("dry run: {} actions planned, nothing applied", in.plan->size());
        return finish();
    }

    const health::DependencyHealthVerifier verifier(prober_, settings.verify, observer_);

    // ---- execute ----
    {
        StageTimer t("execute", in, *observer_);
        plan::ReconciliationExecutor executor(*backend, &verifier, observer_);
        auto rep = executor.execute(*in.plan, stop);
        in.actions = std::move(rep.results);
        in.gates   = std::move(rep.gates);
        const bool failed = std::any_of(in.actions.begin(), in.actions.end(), [](const plan::ActionResult& r) {
            return r.outcome != plan::ActionOutcome::Succeeded;
        });
        t.close(rep.cancelled ? "cancelled" : failed ? "failed" : "ok", {}, failed);
    }

    if (stop.stop_requested()) {
        obs::logger()->warn("stop requested, skipping verification");
        in.verification_cancelled = true;
        return finish();
    }

    // ---- verify ----
    {
        StageTimer t("verify", in, *observer_);
        if (auto again = inventory.refresh(); again) {
            in.inventory_after = std::move(*again);
        } else {
            // verification still runs; the probes decide what is reachable
            obs::logger()->warn("inventory refresh before verify failed: {}", again.error().message);
        }
        const auto checks = topology->health_checks();
        in.health = verifier.verify(checks, stop);
        in.verification_ran       = true;
        in.verification_cancelled = stop.stop_requested();
        const bool unhealthy = std::any_of(in.health.begin(), in.health.end(),
                                           [](const health::HealthCheckResult& h) { return !h.healthy(); });
        t.close(in.verification_cancelled ? "cancelled" : unhealthy ? "failed" : "ok", {}, unhealthy);
    }

    return finish();
}

} // namespace converge::engine
