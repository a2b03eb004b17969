#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: run events + counters, spdlog-backed logging.
 * @details One named logger ("converge") is shared by every module. A run id is
 *          stamped on every line once set_run_id() is called for the run.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "converge/compat/expected.hpp"

namespace converge::obs {

    /** @struct LogSettings
     *  @brief Logger configuration (log.* keys).
     */
    struct LogSettings {
        std::string level{"info"};         ///< trace|debug|info|warn|error|critical|off
        std::string file;                  ///< Rotating log file; empty → console only
        std::uint32_t file_max_size_mb{20};///< Rotate after this many MiB
        std::uint32_t file_backup_count{5};///< Rotated files kept
        std::string pattern;               ///< spdlog pattern; empty → default
    };

    /** @struct Counters
     *  @brief Per-observer counters for one reconcile run.
     */
    struct Counters {
        uint64_t stages{0};            ///< Stages completed
        uint64_t actions_applied{0};   ///< Actions that succeeded
        uint64_t actions_failed{0};    ///< Actions the runtime rejected
        uint64_t actions_skipped{0};   ///< Actions skipped (dependency/cancel)
        uint64_t probes{0};            ///< Health targets verified
        uint64_t probe_failures{0};    ///< Targets that did not end healthy
    };

    /// Event category.
    enum class EventKind : std::uint8_t { Stage, Action, Probe };

    /** @struct Event
     *  @brief Payload describing one stage, action or probe outcome.
     */
    struct Event {
        EventKind   kind{EventKind::Stage};
        std::string subject;    ///< Stage name, action label or probe target
        std::string outcome;    ///< "ok", "failed", "skipped", "healthy", ...
        std::string detail;     ///< Reason/error for humans
        std::chrono::milliseconds elapsed{0};
        bool        failure{false}; ///< Counts against the run
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const Event& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Observer that counts and writes one structured line per event to logger().
    std::shared_ptr<Observer> make_log_observer();

    /// Install the "converge" logger (stdout color sink + optional rotating file).
    /// Unknown level or unopenable file → error message.
    converge_detail::expected<void, std::string> init_logging(const LogSettings& settings);

    /// The shared logger; a console logger is created on first use if none is installed.
    std::shared_ptr<spdlog::logger> logger();

    /// Short random id ("a3f09c1e") identifying one run.
    std::string make_run_id();

    /// Stamp `run_id` on every subsequent log line (empty clears it).
    void set_run_id(std::string_view run_id);

    /// True if `level` names an spdlog level.
    bool is_valid_level(std::string_view level) noexcept;

} // namespace converge::obs
