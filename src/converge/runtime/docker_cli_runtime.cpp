/**
 * @file docker_cli_runtime.cpp
 * @brief docker CLI adapter: argument building, output parsing, error mapping.
 */
#include "converge/runtime/docker_cli_runtime.hpp"
#include "converge/config/constants.hpp"
#include "converge/obs/observability.hpp"
#include "converge/os/process.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace converge::runtime {
    using namespace converge::config::constants;

    namespace {
        constexpr std::string_view kPsFormat  = "{{.Names}}\t{{.Image}}\t{{.State}}\t{{.Labels}}";
        constexpr std::string_view kLsFormat  = "{{.Name}}\t{{.Labels}}";

        std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\r' || s.front() == '\n')) s.remove_prefix(1);
            while (!s.empty() && (s.back()  == ' ' || s.back()  == '\r' || s.back()  == '\n')) s.remove_suffix(1);
            return s;
        }

        std::vector<std::string_view> split(std::string_view s, char sep) {
            std::vector<std::string_view> out;
            std::size_t start = 0;
            for (std::size_t i = 0; i <= s.size(); ++i) {
                if (i == s.size() || s[i] == sep) {
                    out.push_back(s.substr(start, i - start));
                    start = i + 1;
                }
            }
            return out;
        }

        bool contains_ci(std::string_view hay, std::string_view needle) {
            const auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end(),
                                        [](char a, char b) {
                                            return std::tolower(static_cast<unsigned char>(a)) ==
                                                   std::tolower(static_cast<unsigned char>(b));
                                        });
            return it != hay.end();
        }

        std::string_view noun(ObjectKind k) noexcept {
            switch (k) {
                case ObjectKind::Container: return "container";
                case ObjectKind::Network:   return "network";
                case ObjectKind::Volume:    return "volume";
            }
            return "container";
        }
    } // namespace

    DockerCliRuntime::DockerCliRuntime(RuntimeSettings settings) : settings_(std::move(settings)) {
        if (settings_.docker_binary.empty()) settings_.docker_binary = std::string(DOCKER_BINARY);
        if (settings_.command_timeout.count() <= 0) {
            settings_.command_timeout = std::chrono::milliseconds(RUNTIME_COMMAND_TIMEOUT_MS);
        }
    }

    //------------------------------- Parsing ------------------------------------

    ObjectState DockerCliRuntime::parse_state(std::string_view state) noexcept {
        state = trim(state);
        if (state == "created") return ObjectState::Created;
        // paused/restarting containers still hold their name and ports
        if (state == "running" || state == "restarting" || state == "paused") return ObjectState::Running;
        return ObjectState::Stopped; // exited, dead, removing
    }

    Labels DockerCliRuntime::parse_labels(std::string_view raw) {
        Labels out;
        for (auto item : split(trim(raw), ',')) {
            item = trim(item);
            if (item.empty()) continue;
            const auto eq = item.find('=');
            if (eq == std::string_view::npos) out.emplace(std::string(item), std::string{});
            else out.emplace(std::string(item.substr(0, eq)), std::string(item.substr(eq + 1)));
        }
        return out;
    }

    std::vector<RuntimeObject> DockerCliRuntime::parse_containers(std::string_view out) {
        std::vector<RuntimeObject> objs;
        for (auto line : split(out, '\n')) {
            line = trim(line);
            if (line.empty()) continue;
            const auto cols = split(line, '\t');
            if (cols.size() < 3) continue; // malformed row: ignore
            RuntimeObject o;
            o.kind   = ObjectKind::Container;
            o.name   = std::string(trim(cols[0]));
            o.image  = std::string(trim(cols[1]));
            o.state  = parse_state(cols[2]);
            if (cols.size() > 3) o.labels = parse_labels(cols[3]);
            objs.push_back(std::move(o));
        }
        return objs;
    }

    std::vector<RuntimeObject> DockerCliRuntime::parse_named(ObjectKind kind, std::string_view out) {
        std::vector<RuntimeObject> objs;
        for (auto line : split(out, '\n')) {
            line = trim(line);
            if (line.empty()) continue;
            const auto cols = split(line, '\t');
            RuntimeObject o;
            o.kind  = kind;
            o.name  = std::string(trim(cols[0]));
            o.state = ObjectState::Running;
            if (cols.size() > 1) o.labels = parse_labels(cols[1]);
            objs.push_back(std::move(o));
        }
        return objs;
    }

    RuntimeError DockerCliRuntime::classify_failure(int exit_code, std::string_view err_text) {
        const auto msg = std::string(trim(err_text));
        if (contains_ci(err_text, "cannot connect to the docker daemon") ||
            contains_ci(err_text, "is the docker daemon running") ||
            contains_ci(err_text, "permission denied while trying to connect")) {
            return RuntimeError{RuntimeErrc::Unavailable, msg};
        }
        if (contains_ci(err_text, "no such") || contains_ci(err_text, "not found")) {
            return RuntimeError{RuntimeErrc::NotFound, msg};
        }
        if (contains_ci(err_text, "conflict") || contains_ci(err_text, "already in use") ||
            contains_ci(err_text, "already exists")) {
            return RuntimeError{RuntimeErrc::Conflict, msg};
        }
        return RuntimeError{RuntimeErrc::Failed,
                            msg.empty() ? "exit status " + std::to_string(exit_code) : msg};
    }

    std::vector<std::string> DockerCliRuntime::create_args(const CreateRequest& req) {
        std::vector<std::string> args;
        if (req.kind != ObjectKind::Container) {
            args = {std::string(noun(req.kind)), "create"};
            for (const auto& [k, v] : req.labels) { args.emplace_back("--label"); args.push_back(k + "=" + v); }
            args.push_back(req.name);
            return args;
        }

        args = {"create", "--name", req.name};
        if (!req.network.empty()) { args.emplace_back("--network"); args.push_back(req.network); }
        for (const auto& [k, v] : req.labels) { args.emplace_back("--label"); args.push_back(k + "=" + v); }
        for (const auto& p : req.ports) {
            args.emplace_back("-p");
            args.push_back(std::to_string(p.host) + ":" + std::to_string(p.container));
        }
        for (const auto& v : req.volumes) { args.emplace_back("-v"); args.push_back(v.volume + ":" + v.path); }
        for (const auto& [k, v] : req.env) { args.emplace_back("-e"); args.push_back(k + "=" + v); }
        args.push_back(req.image);
        return args;
    }

    //------------------------------- Commands -----------------------------------

    Result<std::string> DockerCliRuntime::run(std::vector<std::string> args) const {
        args.insert(args.begin(), settings_.docker_binary);
        obs::logger()->debug("docker: {}", fmt::join(args, " "));

        auto r = os::run_process(args, settings_.command_timeout);
        if (!r) {
            const auto code = r.error().code == os::ProcessErrc::NotFound ? RuntimeErrc::Unavailable
                                                                          : RuntimeErrc::Failed;
            return converge_detail::unexpected(RuntimeError{code, r.error().message});
        }
        if (r->exit_code != 0) return converge_detail::unexpected(classify_failure(r->exit_code, r->err));
        return std::move(r->out);
    }

    Result<std::vector<RuntimeObject>> DockerCliRuntime::list() {
        auto ps = run({"ps", "-a", "--no-trunc", "--format", std::string(kPsFormat)});
        if (!ps) return converge_detail::unexpected(ps.error());
        auto nets = run({"network", "ls", "--format", std::string(kLsFormat)});
        if (!nets) return converge_detail::unexpected(nets.error());
        auto vols = run({"volume", "ls", "--format", std::string(kLsFormat)});
        if (!vols) return converge_detail::unexpected(vols.error());

        auto objs = parse_containers(*ps);
        for (auto& o : parse_named(ObjectKind::Network, *nets)) objs.push_back(std::move(o));
        for (auto& o : parse_named(ObjectKind::Volume, *vols))  objs.push_back(std::move(o));
        return objs;
    }

    Result<RuntimeObject> DockerCliRuntime::inspect(ObjectKind kind, const std::string& name) {
        auto all = list();
        if (!all) return converge_detail::unexpected(all.error());
        for (auto& o : *all) {
            if (o.kind == kind && o.name == name) return std::move(o);
        }
        return converge_detail::unexpected(RuntimeError{
            RuntimeErrc::NotFound, "no such " + std::string(noun(kind)) + ": " + name});
    }

    Result<void> DockerCliRuntime::create(const CreateRequest& req) {
        auto r = run(create_args(req));
        if (!r) return converge_detail::unexpected(r.error());
        return {};
    }

    Result<void> DockerCliRuntime::start(const std::string& container) {
        auto r = run({"start", container});
        if (!r) return converge_detail::unexpected(r.error());
        return {};
    }

    Result<void> DockerCliRuntime::stop(const std::string& container) {
        auto r = run({"stop", container});
        if (!r) return converge_detail::unexpected(r.error());
        return {};
    }

    Result<void> DockerCliRuntime::remove(ObjectKind kind, const std::string& name) {
        auto r = kind == ObjectKind::Container ? run({"rm", name})
                                               : run({std::string(noun(kind)), "rm", name});
        if (!r) return converge_detail::unexpected(r.error());
        return {};
    }

} // namespace converge::runtime
