#pragma once
/**
 * @file diagnostic_report.hpp
 * @brief DiagnosticReporter: folds every stage's outcome into one report and verdict.
 *
 * Verdict fold (strict):
 *  - Failed         any fatal error, any Failed/Skipped action, any local target not healthy
 *                   (cancelled targets excepted);
 *  - PartialSuccess otherwise, if a remote target is not healthy or verification was cancelled;
 *  - Success        otherwise.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "converge/config/config_snapshot.hpp"
#include "converge/health/verifier.hpp"
#include "converge/plan/action.hpp"
#include "converge/runtime/inventory.hpp"

namespace converge::report {

enum class Verdict : std::uint8_t { Success, PartialSuccess, Failed };

std::string_view to_string(Verdict v) noexcept;

/// CLI exit status: Success 0, Failed 1, PartialSuccess 2.
int exit_code(Verdict v) noexcept;

/// Stage status in the summary.
enum class StageStatus : std::uint8_t { Ok, Failed, Skipped };

std::string_view to_string(StageStatus s) noexcept;

/// Wall-clock time one pipeline stage took.
struct StageTiming {
    std::string name;
    std::chrono::milliseconds elapsed{0};
};

/** @struct ReportInputs
 *  @brief Everything the pipeline collected; absent stages stay empty.
 */
struct ReportInputs {
    std::string run_id;
    std::string project;
    bool dry_run{false};
    std::vector<config::ConfigError> config_errors;        ///< Fatal, stage "config"
    std::vector<std::string> fatal_errors;                 ///< Runtime/plan fatal errors
    std::optional<runtime::Inventory> inventory;           ///< Observed before execution
    std::optional<runtime::Inventory> inventory_after;     ///< Observed after execution
    std::optional<plan::Plan> plan;
    std::vector<plan::ActionResult> actions;
    std::vector<health::HealthCheckResult> gates;          ///< Readiness checks
    std::vector<health::HealthCheckResult> health;         ///< Final verification
    bool verification_ran{false};
    bool verification_cancelled{false};
    std::vector<StageTiming> timings;
};

/** @struct StageSummary
 *  @brief One summary line per stage.
 */
struct StageSummary {
    std::string name;
    StageStatus status{StageStatus::Ok};
    std::string summary;
    std::chrono::milliseconds elapsed{0};
};

/** @struct DiagnosticReport
 *  @brief Structured result of a run.
 */
struct DiagnosticReport {
    std::string run_id;
    std::string project;
    bool dry_run{false};
    Verdict verdict{Verdict::Failed};
    std::vector<StageSummary> stages;
    std::vector<std::string> errors;                       ///< Fatal errors, rendered
    runtime::Inventory inventory;                          ///< Before execution
    std::optional<runtime::Inventory> inventory_after;     ///< After execution, if re-read
    plan::Plan plan;
    std::vector<plan::ActionResult> actions;
    std::vector<health::HealthCheckResult> gates;
    std::vector<health::HealthCheckResult> health;
};

/// "5 objects: 4 running, 0 stopped/created, 0 orphaned, 1 absent"
[[nodiscard]] std::string summarize(const runtime::Inventory& inv);

/** @class DiagnosticReporter
 *  @brief Pure aggregation; no I/O.
 */
class DiagnosticReporter {
public:
    [[nodiscard]] static DiagnosticReport report(const ReportInputs& in);

    [[nodiscard]] static Verdict fold(const ReportInputs& in) noexcept;
};

} // namespace converge::report
