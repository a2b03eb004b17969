/**
* @file observability.cpp
 * @brief spdlog-backed implementation of the Observer facade and logger setup.
 */
#include "converge/obs/observability.hpp"
#include "converge/config/constants.hpp"

#include <array>
#include <cstdio>
#include <mutex>
#include <random>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace converge::obs {
    using namespace converge::config::constants;

    namespace {
        std::mutex g_setup_mu;          // guards logger creation and pattern state
        std::string g_pattern{LOG_PATTERN};
        std::string g_run_id;

        constexpr std::array<std::string_view, 7> kLevels{
            "trace", "debug", "info", "warn", "error", "critical", "off"};

        std::string effective_pattern() {
            if (g_run_id.empty()) return g_pattern;
            std::string p = g_pattern;
            const auto pos = p.find("%v");
            const std::string tag = "[run " + g_run_id + "] ";
            if (pos == std::string::npos) return p + " " + tag;
            p.insert(pos, tag);
            return p;
        }

        std::string_view kind_name(EventKind k) noexcept {
            switch (k) {
                case EventKind::Stage:  return "stage";
                case EventKind::Action: return "action";
                case EventKind::Probe:  return "probe";
            }
            return "event";
        }
    } // namespace

    class LogObserver : public Observer {
    public:
        void record(const Event& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                switch (e.kind) {
                    case EventKind::Stage:
                        ctr_.stages++;
                        break;
                    case EventKind::Action:
                        if (e.outcome == "skipped") ctr_.actions_skipped++;
                        else if (e.failure)         ctr_.actions_failed++;
                        else                        ctr_.actions_applied++;
                        break;
                    case EventKind::Probe:
                        ctr_.probes++;
                        if (e.failure) ctr_.probe_failures++;
                        break;
                }
            }
            // key=value line; keeps grep/awk friendly
            const auto lvl = e.failure ? spdlog::level::warn : spdlog::level::info;
            logger()->log(lvl, "event={} subject=\"{}\" outcome={} elapsed_ms={}{}{}",
                          kind_name(e.kind), e.subject, e.outcome, e.elapsed.count(),
                          e.detail.empty() ? "" : " detail=\"", e.detail.empty() ? "" : e.detail + "\"");
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    std::shared_ptr<Observer> make_log_observer() {
        return std::make_shared<LogObserver>();
    }

    bool is_valid_level(std::string_view level) noexcept {
        for (auto l : kLevels) if (l == level) return true;
        return false;
    }

    converge_detail::expected<void, std::string> init_logging(const LogSettings& settings) {
        if (!is_valid_level(settings.level)) {
            return converge_detail::unexpected("unknown log level \"" + settings.level + "\"");
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!settings.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    settings.file,
                    static_cast<std::size_t>(settings.file_max_size_mb) * 1024u * 1024u,
                    static_cast<std::size_t>(settings.file_backup_count)));
            } catch (const spdlog::spdlog_ex& ex) {
                return converge_detail::unexpected(std::string("cannot open log file: ") + ex.what());
            }
        }

        std::lock_guard<std::mutex> lk(g_setup_mu);
        g_pattern = settings.pattern.empty() ? std::string(LOG_PATTERN) : settings.pattern;

        auto lg = std::make_shared<spdlog::logger>(std::string(LOGGER_NAME), sinks.begin(), sinks.end());
        lg->set_level(spdlog::level::from_str(settings.level));
        lg->set_pattern(effective_pattern());
        lg->flush_on(spdlog::level::warn);

        spdlog::drop(std::string(LOGGER_NAME));
        spdlog::register_logger(lg);
        return {};
    }

    std::shared_ptr<spdlog::logger> logger() {
        if (auto lg = spdlog::get(std::string(LOGGER_NAME))) return lg;

        std::lock_guard<std::mutex> lk(g_setup_mu);
        if (auto lg = spdlog::get(std::string(LOGGER_NAME))) return lg; // lost the race
        auto lg = spdlog::stdout_color_mt(std::string(LOGGER_NAME));
        lg->set_pattern(effective_pattern());
        return lg;
    }

    std::string make_run_id() {
        std::random_device rd;
        std::uniform_int_distribution<std::uint32_t> dist;
        char buf[9];
        std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(dist(rd)));
        return buf;
    }

    void set_run_id(std::string_view run_id) {
        auto lg = logger();
        std::lock_guard<std::mutex> lk(g_setup_mu);
        g_run_id = std::string(run_id);
        lg->set_pattern(effective_pattern());
    }

} // namespace converge::obs
