#pragma once
/**
 * @file pipeline.hpp
 * @brief One reconcile run: resolve → refresh → plan → execute → verify → report.
 *
 * Ordering is a correctness invariant: every stage runs on the calling thread and
 * only verification fans out to a worker pool. Fatal errors (configuration,
 * unreachable runtime, dependency cycle) end the run before any mutation.
 */

#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>

#include "converge/config/config_snapshot.hpp"
#include "converge/health/probe.hpp"
#include "converge/obs/observability.hpp"
#include "converge/report/diagnostic_report.hpp"
#include "converge/runtime/runtime.hpp"

namespace converge::engine {

/** @struct PipelineOptions
 *  @brief Per-invocation switches that are not part of the layered config.
 */
struct PipelineOptions {
    bool        dry_run{false};           ///< Plan only; OR-ed with reconcile.dry_run
    bool        configure_logging{true};  ///< Install the logger from log.* keys
    std::string run_id;                   ///< Empty → generated
};

/// Builds the runtime backend selected by runtime.kind. nullptr → unknown kind.
using RuntimeFactory = std::function<std::shared_ptr<runtime::Runtime>(const runtime::RuntimeSettings&)>;

/// DockerCliRuntime for "docker", a fresh SimulatedRuntime for "simulated".
RuntimeFactory default_runtime_factory();

/** @class Pipeline
 *  @brief Wires the reconcile stages together and folds them into a report.
 */
class Pipeline {
public:
    /**
     * @param factory  Runtime backend source.
     * @param prober   Probe implementation shared by gate and verification; nullptr → network probes.
     * @param observer Event sink; nullptr → log observer.
     */
    explicit Pipeline(RuntimeFactory factory,
                      std::shared_ptr<health::Prober> prober = nullptr,
                      std::shared_ptr<obs::Observer> observer = nullptr);

    /**
     * @brief Run once over the given layers (low → high precedence).
     * @param stop Cancels execution and verification; the report records it.
     */
    [[nodiscard]] report::DiagnosticReport run(std::span<const config::ConfigLayer> layers,
                                               const PipelineOptions& options,
                                               std::stop_token stop = {});

    [[nodiscard]] const std::shared_ptr<obs::Observer>& observer() const noexcept { return observer_; }

private:
    RuntimeFactory factory_;
    std::shared_ptr<health::Prober> prober_;
    std::shared_ptr<obs::Observer> observer_;
};

} // namespace converge::engine
