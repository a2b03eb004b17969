/**
 * @file main.cpp
 * @brief converge: reconcile a declared topology against the container runtime.
 *
 * **Layers (low → high precedence)**
 * - defaults:         built-in constants, then --defaults FILE on top
 * - example-template: --template FILE
 * - environment:      --env-file FILE, then CONVERGE_* process variables
 * - user-override:    --config FILE, then --set k=v (and --simulate)
 *
 * **Exit status**
 * - 0 Success, 2 PartialSuccess, 1 Failed, 64 usage error.
 *
 * SIGINT/SIGTERM request a stop: the executor skips what is left and verification
 * returns with unfinished targets cancelled. The report is still written.
 */

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <time.h>

#include "converge/config/config_loader.hpp"
#include "converge/config/constants.hpp"
#include "converge/engine/pipeline.hpp"
#include "converge/obs/observability.hpp"
#include "converge/report/report_writer.hpp"
#include "converge/version.hpp"

extern char** environ;

namespace {

constexpr int EXIT_USAGE = 64;

namespace K = converge::config::constants;
using converge::config::ConfigError;
using converge::config::ConfigLayer;
using converge::config::Loader;

struct CliArgs {
    std::optional<std::string> defaults_file;
    std::optional<std::string> template_file;
    std::optional<std::string> env_file;
    std::optional<std::string> config_file;
    std::vector<std::string>   sets;
    bool dry_run{false};
    bool simulate{false};
    std::string format{"text"};
};

void usage(std::ostream& os) {
    os << "usage: converge [--defaults F] [--template F] [--env-file F] [--config F]\n"
          "                [--set key=value]... [--dry-run] [--simulate] [--format text|yaml]\n";
}

/// Returns nullopt (after printing why) on malformed arguments.
std::optional<CliArgs> parse_args(int argc, char** argv) {
    CliArgs a;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "converge: " << arg << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--dry-run")       { a.dry_run = true; continue; }
        if (arg == "--simulate")      { a.simulate = true; continue; }
        if (arg == "--help" || arg == "-h") { usage(std::cout); std::exit(0); }
        if (arg == "--version") { std::cout << "converge " << converge::version_string << "\n"; std::exit(0); }

        std::optional<std::string> v;
        if (arg == "--defaults" || arg == "--template" || arg == "--env-file" || arg == "--config" ||
            arg == "--set" || arg == "--format") {
            v = value();
            if (!v) return std::nullopt;
        } else {
            std::cerr << "converge: unknown argument " << arg << "\n";
            return std::nullopt;
        }

        if (arg == "--defaults")      a.defaults_file = *v;
        else if (arg == "--template") a.template_file = *v;
        else if (arg == "--env-file") a.env_file = *v;
        else if (arg == "--config")   a.config_file = *v;
        else if (arg == "--set")      a.sets.push_back(*v);
        else                          a.format = *v;
    }
    return a;
}

/// Copy `over` on top of `base` (last writer wins).
void overlay(ConfigLayer& base, const ConfigLayer& over) {
    for (const auto& [k, v] : over.values) base.values[k] = v;
}

converge_detail::expected<std::vector<ConfigLayer>, ConfigError> build_layers(const CliArgs& a) {
    std::vector<ConfigLayer> layers;

    ConfigLayer defaults = Loader::builtin_defaults();
    if (a.defaults_file) {
        auto file = Loader::load_yaml_file(*a.defaults_file, std::string(K::LAYER_DEFAULTS));
        if (!file) return converge_detail::unexpected(file.error());
        overlay(defaults, *file);
    }
    layers.push_back(std::move(defaults));

    if (a.template_file) {
        auto tmpl = Loader::load_yaml_file(*a.template_file, std::string(K::LAYER_EXAMPLE_TEMPLATE));
        if (!tmpl) return converge_detail::unexpected(tmpl.error());
        layers.push_back(std::move(*tmpl));
    }

    ConfigLayer env{std::string(K::LAYER_ENVIRONMENT), {}};
    if (a.env_file) {
        auto dotenv = Loader::load_env_file(*a.env_file, std::string(K::LAYER_ENVIRONMENT));
        if (!dotenv) return converge_detail::unexpected(dotenv.error());
        overlay(env, *dotenv);
    }
    overlay(env, Loader::from_environment(environ));
    layers.push_back(std::move(env));

    if (a.config_file) {
        auto user = Loader::load_yaml_file(*a.config_file, std::string(K::LAYER_USER_OVERRIDE));
        if (!user) return converge_detail::unexpected(user.error());
        layers.push_back(std::move(*user));
    }
    std::vector<std::string> sets = a.sets;
    if (a.simulate) sets.push_back("runtime.kind=" + std::string(K::RUNTIME_KIND_SIMULATED));
    if (!sets.empty()) {
        auto pairs = Loader::from_pairs(sets);
        if (!pairs) return converge_detail::unexpected(pairs.error());
        layers.push_back(std::move(*pairs));
    }
    return layers;
}

/// Forwards SIGINT/SIGTERM to `source` from a dedicated thread (sigtimedwait, no handler).
std::jthread start_signal_watcher(std::stop_source source) {
    return std::jthread([source](std::stop_token self) mutable {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        const timespec slice{0, static_cast<long>(K::PROBE_SLICE_MS) * 1000000L * 2};
        while (!self.stop_requested()) {
            const int sig = sigtimedwait(&set, nullptr, &slice);
            if (sig == SIGINT || sig == SIGTERM) {
                converge::obs::logger()->warn("signal {} received, stopping", sig);
                source.request_stop();
                return;
            }
        }
    });
}

} // namespace

int main(int argc, char** argv) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        usage(std::cerr);
        return EXIT_USAGE;
    }
    const auto format = converge::report::parse_format(args->format);
    if (!format) {
        std::cerr << "converge: " << format.error() << "\n";
        return EXIT_USAGE;
    }

    // Block before any thread starts so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    auto layers = build_layers(*args);
    if (!layers) {
        converge::report::ReportInputs in;
        in.run_id  = converge::obs::make_run_id();
        in.dry_run = args->dry_run;
        in.config_errors.push_back(layers.error());
        converge::obs::logger()->error("config: {} {} ({})", converge::config::to_string(layers.error().code),
                                       layers.error().message, layers.error().key);
        const auto report = converge::report::DiagnosticReporter::report(in);
        converge::report::write(report, *format, std::cout);
        return converge::report::exit_code(report.verdict);
    }

    std::stop_source stop;
    auto watcher = start_signal_watcher(stop);

    converge::engine::Pipeline pipeline(converge::engine::default_runtime_factory());
    const auto report = pipeline.run(*layers, {.dry_run = args->dry_run}, stop.get_token());

    watcher.request_stop();
    watcher.join();

    converge::report::write(report, *format, std::cout);
    return converge::report::exit_code(report.verdict);
}
