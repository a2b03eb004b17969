/**
* @file config_loader.cpp
 * @brief YAML (yaml-cpp), dotenv, environment and --set sources; topology and settings parsing.
 */
#include "converge/config/config_loader.hpp"
#include "converge/config/constants.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <set>

#include <yaml-cpp/yaml.h>

namespace converge::config {
    using namespace converge::config::constants;

    namespace {

        std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
            return s;
        }

        converge_detail::unexpected<ConfigError> error(ConfigErrc code, std::string key, std::string message) {
            return converge_detail::unexpected<ConfigError>(ConfigError{code, std::move(key), std::move(message)});
        }

        converge_detail::unexpected<ConfigError> topology_error(std::string key, std::string message) {
            return error(ConfigErrc::InvalidTopology, std::move(key), std::move(message));
        }

        std::optional<std::uint16_t> parse_port(std::string_view s) {
            s = trim(s);
            unsigned v = 0;
            const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec != std::errc{} || ptr != s.data() + s.size() || v == 0 || v > 65535) return std::nullopt;
            return static_cast<std::uint16_t>(v);
        }

        /// "200-399" or "204" → inclusive range.
        std::optional<std::pair<std::uint16_t, std::uint16_t>> parse_status_range(std::string_view s) {
            s = trim(s);
            const auto dash = s.find('-');
            const auto lo_s = s.substr(0, dash);
            const auto hi_s = dash == std::string_view::npos ? lo_s : s.substr(dash + 1);
            unsigned lo = 0, hi = 0;
            const auto r1 = std::from_chars(lo_s.data(), lo_s.data() + lo_s.size(), lo);
            const auto r2 = std::from_chars(hi_s.data(), hi_s.data() + hi_s.size(), hi);
            if (r1.ec != std::errc{} || r1.ptr != lo_s.data() + lo_s.size()) return std::nullopt;
            if (r2.ec != std::errc{} || r2.ptr != hi_s.data() + hi_s.size()) return std::nullopt;
            if (lo < 100 || hi > 599 || lo > hi) return std::nullopt;
            return std::make_pair(static_cast<std::uint16_t>(lo), static_cast<std::uint16_t>(hi));
        }

        //--------------------------- YAML flattening ---------------------------

        ConfigResult<bool> flatten(const YAML::Node& node, const std::string& key, Values& out) {
            switch (node.Type()) {
                case YAML::NodeType::Null:
                case YAML::NodeType::Undefined:
                    if (!key.empty()) out.insert_or_assign(key, std::string{});
                    return true;
                case YAML::NodeType::Scalar:
                    out.insert_or_assign(key, node.Scalar());
                    return true;
                case YAML::NodeType::Sequence: {
                    std::string joined;
                    for (const auto& item : node) {
                        if (!item.IsScalar()) {
                            return error(ConfigErrc::InvalidValue, key, "only sequences of scalars are supported");
                        }
                        if (!joined.empty()) joined += ",";
                        joined += item.Scalar();
                    }
                    out.insert_or_assign(key, joined);
                    return true;
                }
                case YAML::NodeType::Map:
                    for (const auto& kv : node) {
                        const std::string child = kv.first.as<std::string>();
                        auto r = flatten(kv.second, key.empty() ? child : key + "." + child, out);
                        if (!r) return r;
                    }
                    return true;
            }
            return true;
        }

        ConfigResult<ConfigLayer> layer_from_yaml(const YAML::Node& root, std::string layer_name,
                                                  const std::string& origin) {
            ConfigLayer layer{std::move(layer_name), {}};
            if (root.IsNull()) return layer;
            if (!root.IsMap()) {
                return error(ConfigErrc::ParseFailure, origin, "top level must be a mapping");
            }
            auto r = flatten(root, {}, layer.values);
            if (!r) return converge_detail::unexpected(r.error());
            return layer;
        }

    } // namespace

    bool valid_name(std::string_view name) noexcept {
        if (name.empty() || name.size() > MAX_NAME_LEN) return false;
        if (!std::isalnum(static_cast<unsigned char>(name.front()))) return false;
        return std::all_of(name.begin(), name.end(), [](char c) {
            const auto u = static_cast<unsigned char>(c);
            return std::islower(u) || std::isdigit(u) || c == '-' || c == '_' || c == '.';
        });
    }

    std::string Loader::env_key(std::string_view name, std::string_view prefix) {
        if (name.starts_with(prefix)) name.remove_prefix(prefix.size());
        // "__" separates segments; names under services.<svc>.env keep their case.
        std::string out;
        out.reserve(name.size());
        std::size_t segment = 0;
        bool keep_case = false;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (name[i] == '_' && i + 1 < name.size() && name[i + 1] == '_') {
                ++segment;
                keep_case = keep_case || (segment == 3 && out.starts_with("services.") && out.ends_with(".env"));
                out.push_back('.');
                ++i;
            } else {
                out.push_back(keep_case ? name[i]
                                        : static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
            }
        }
        return out;
    }

    //------------------------------- Sources -----------------------------------

    ConfigResult<ConfigLayer> Loader::load_yaml_file(const std::string& path, std::string layer_name) {
        // yaml-cpp reports everything by exception; keep them inside this adapter.
        try {
            return layer_from_yaml(YAML::LoadFile(path), std::move(layer_name), path);
        } catch (const YAML::BadFile&) {
            return error(ConfigErrc::Unreadable, path, "cannot open config file");
        } catch (const YAML::Exception& ex) {
            return error(ConfigErrc::ParseFailure, path, ex.what());
        }
    }

    ConfigResult<ConfigLayer> Loader::load_yaml_string(std::string_view text, std::string layer_name) {
        try {
            return layer_from_yaml(YAML::Load(std::string(text)), std::move(layer_name), "<string>");
        } catch (const YAML::Exception& ex) {
            return error(ConfigErrc::ParseFailure, "<string>", ex.what());
        }
    }

    ConfigResult<ConfigLayer> Loader::load_env_file(const std::string& path, std::string layer_name) {
        std::ifstream in(path);
        if (!in) return error(ConfigErrc::Unreadable, path, "cannot open env file");

        ConfigLayer layer{std::move(layer_name), {}};
        std::string raw;
        std::size_t lineno = 0;
        while (std::getline(in, raw)) {
            ++lineno;
            std::string_view line = trim(raw);
            if (line.empty() || line.front() == '#') continue;
            if (line.starts_with("export ")) line = trim(line.substr(7));

            const auto eq = line.find('=');
            if (eq == std::string_view::npos || trim(line.substr(0, eq)).empty()) {
                return error(ConfigErrc::ParseFailure, path + ":" + std::to_string(lineno),
                             "expected KEY=VALUE");
            }
            const auto key = trim(line.substr(0, eq));
            auto value = trim(line.substr(eq + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            } else if (const auto hash = value.find(" #"); hash != std::string_view::npos) {
                value = trim(value.substr(0, hash)); // trailing comment on an unquoted value
            }
            layer.values.insert_or_assign(env_key(key, ENV_PREFIX), std::string(value));
        }
        return layer;
    }

    ConfigLayer Loader::from_environment(const char* const* envp, std::string_view prefix) {
        ConfigLayer layer{std::string(LAYER_ENVIRONMENT), {}};
        if (envp == nullptr) return layer;
        for (; *envp != nullptr; ++envp) {
            const std::string_view entry{*envp};
            const auto eq = entry.find('=');
            if (eq == std::string_view::npos) continue;
            const auto name = entry.substr(0, eq);
            if (!name.starts_with(prefix) || name.size() == prefix.size()) continue;
            layer.values.insert_or_assign(env_key(name, prefix), std::string(entry.substr(eq + 1)));
        }
        return layer;
    }

    ConfigResult<ConfigLayer> Loader::from_pairs(std::span<const std::string> pairs, std::string layer_name) {
        ConfigLayer layer{std::move(layer_name), {}};
        for (const auto& p : pairs) {
            const auto eq = p.find('=');
            const auto key = trim(std::string_view(p).substr(0, eq));
            if (eq == std::string::npos || key.empty()) {
                return error(ConfigErrc::InvalidValue, p, "expected key=value");
            }
            layer.values.insert_or_assign(std::string(key), p.substr(eq + 1));
        }
        return layer;
    }

    ConfigLayer Loader::builtin_defaults() {
        ConfigLayer layer{std::string(LAYER_DEFAULTS), {}};
        auto& v = layer.values;
        v["verify.timeout_ms"]          = std::to_string(VERIFY_TIMEOUT_MS);
        v["verify.poll_interval_ms"]    = std::to_string(VERIFY_POLL_INTERVAL_MS);
        v["verify.max_attempts"]        = std::to_string(VERIFY_MAX_ATTEMPTS);
        v["verify.attempt_timeout_ms"]  = std::to_string(VERIFY_ATTEMPT_TIMEOUT_MS);
        v["verify.concurrency"]         = std::to_string(VERIFY_CONCURRENCY);
        v["verify.tls_verify"]          = VERIFY_TLS_VERIFY ? "true" : "false";
        v["runtime.kind"]               = std::string(RUNTIME_KIND_DOCKER);
        v["runtime.docker_binary"]      = std::string(DOCKER_BINARY);
        v["runtime.command_timeout_ms"] = std::to_string(RUNTIME_COMMAND_TIMEOUT_MS);
        v["reconcile.dry_run"]          = "false";
        v["log.level"]                  = std::string(LOG_LEVEL);
        v["log.file"]                   = "";
        v["log.file_max_size_mb"]       = std::to_string(LOG_FILE_MAX_SIZE_MB);
        v["log.file_backup_count"]      = std::to_string(LOG_FILE_BACKUP_COUNT);
        v["log.pattern"]                = std::string(LOG_PATTERN);
        return layer;
    }

    //------------------------------- Topology ----------------------------------

    ConfigResult<model::Topology> Loader::build_topology(const ConfigSnapshot& snap) {
        const std::string project = snap.get_or(KEY_PROJECT_NAME, "");
        if (!valid_name(project)) {
            return topology_error(std::string(KEY_PROJECT_NAME), "invalid project name \"" + project + "\"");
        }

        const auto listed = snap.contains(KEY_TOPOLOGY_SERVICES) ? snap.get_list(KEY_TOPOLOGY_SERVICES)
                                                                 : snap.children("services");
        std::set<std::string> seen;
        std::vector<std::string> names;
        for (const auto& n : listed) {
            if (!seen.insert(n).second) {
                return topology_error(std::string(KEY_TOPOLOGY_SERVICES), "duplicate service \"" + n + "\"");
            }
            if (!valid_name(n)) return topology_error("services." + n, "invalid service name \"" + n + "\"");
            const std::string enabled_key = "services." + n + ".enabled";
            if (snap.contains(enabled_key)) {
                const auto on = snap.get_bool(enabled_key);
                if (!on) return error(ConfigErrc::InvalidValue, enabled_key, "expected a boolean");
                if (!*on) continue;
            }
            names.push_back(n);
        }
        const std::set<std::string> members(names.begin(), names.end());

        std::vector<model::ServiceSpec> services;
        services.reserve(names.size());
        for (const auto& n : names) {
            const std::string base = "services." + n;
            model::ServiceSpec s;
            s.name  = n;
            s.image = std::string(trim(snap.get_or(base + ".image", "")));
            if (s.image.empty()) return topology_error(base + ".image", "service \"" + n + "\" has no image");

            for (const auto& p : snap.get_list(base + ".ports")) {
                const auto colon = p.find(':');
                const auto host = colon == std::string::npos ? std::optional<std::uint16_t>{} : parse_port(std::string_view(p).substr(0, colon));
                const auto cont = colon == std::string::npos ? std::optional<std::uint16_t>{} : parse_port(std::string_view(p).substr(colon + 1));
                if (!host || !cont) return topology_error(base + ".ports", "malformed port mapping \"" + p + "\" (want host:container)");
                s.ports.push_back(model::PortMapping{*host, *cont});
            }

            for (const auto& d : snap.get_list(base + ".depends_on")) {
                if (!members.contains(d)) {
                    return topology_error(base + ".depends_on", "service \"" + n + "\" depends on unknown service \"" + d + "\"");
                }
                s.depends_on.push_back(d);
            }

            for (const auto& [k, v] : snap.subtree(base + ".env")) s.env.emplace(k, v);

            for (const auto& vm : snap.get_list(base + ".volumes")) {
                const auto colon = vm.find(':');
                if (colon == std::string::npos) {
                    return topology_error(base + ".volumes", "malformed volume \"" + vm + "\" (want name:/path)");
                }
                model::VolumeMount m{vm.substr(0, colon), vm.substr(colon + 1)};
                if (!valid_name(m.volume) || m.path.empty() || m.path.front() != '/') {
                    return topology_error(base + ".volumes", "malformed volume \"" + vm + "\" (want name:/path)");
                }
                s.volumes.push_back(std::move(m));
            }

            s.requires_keys = snap.get_list(base + ".requires");

            const std::string hb = base + ".health";
            if (!snap.children(hb).empty()) {
                model::HealthCheckDescriptor h;
                h.target = n;
                h.scope  = model::HealthScope::Local;
                const auto kind = snap.get_or(hb + ".kind", "tcp");
                if (kind == "tcp") {
                    h.kind = model::ProbeKind::Tcp;
                } else if (kind == "http") {
                    h.kind = model::ProbeKind::Http;
                } else {
                    return topology_error(hb + ".kind", "unknown probe kind \"" + kind + "\"");
                }
                h.host = snap.get_or(hb + ".host", HEALTH_DEFAULT_HOST);
                if (const auto port = snap.get(hb + ".port")) {
                    const auto p = parse_port(*port);
                    if (!p) return topology_error(hb + ".port", "invalid port \"" + *port + "\"");
                    h.port = *p;
                } else if (!s.ports.empty()) {
                    h.port = s.ports.front().host;
                } else {
                    return topology_error(hb + ".port", "health check of \"" + n + "\" has no port to probe");
                }
                h.path = snap.get_or(hb + ".path", HEALTH_DEFAULT_PATH);
                if (const auto st = snap.get(hb + ".expect_status")) {
                    const auto range = parse_status_range(*st);
                    if (!range) return topology_error(hb + ".expect_status", "invalid status range \"" + *st + "\"");
                    h.status_min = range->first;
                    h.status_max = range->second;
                }
                h.expect_body = snap.get_or(hb + ".expect_body", "");
                s.health = std::move(h);
            }
            services.push_back(std::move(s));
        }

        std::vector<model::HealthCheckDescriptor> externals;
        for (const auto& e : snap.children("externals")) {
            const std::string base = "externals." + e;
            if (snap.get_bool(base + ".enabled") == false) continue;
            model::HealthCheckDescriptor h;
            h.target = e;
            h.scope  = model::HealthScope::Remote;
            h.kind   = model::ProbeKind::Http;
            h.url    = std::string(trim(snap.get_or(base + ".url", "")));
            if (!h.url.starts_with("http://") && !h.url.starts_with("https://")) {
                return topology_error(base + ".url", "external \"" + e + "\" needs an http(s) URL");
            }
            if (const auto st = snap.get(base + ".expect_status")) {
                const auto range = parse_status_range(*st);
                if (!range) return topology_error(base + ".expect_status", "invalid status range \"" + *st + "\"");
                h.status_min = range->first;
                h.status_max = range->second;
            }
            h.expect_body = snap.get_or(base + ".expect_body", "");
            externals.push_back(std::move(h));
        }

        return model::Topology{project, std::move(services), std::move(externals)};
    }

    //------------------------------- Settings ----------------------------------

    ConfigResult<RunSettings> Loader::load_run_settings(const ConfigSnapshot& snap) {
        RunSettings rs;

        auto positive_ms = [&](std::string_view key, std::chrono::milliseconds& dst) -> bool {
            if (!snap.contains(key)) return true;
            const auto v = snap.get_ms(key);
            if (!v || v->count() <= 0) return false;
            dst = *v;
            return true;
        };
        auto positive_u32 = [&](std::string_view key, std::uint32_t& dst) -> bool {
            if (!snap.contains(key)) return true;
            const auto v = snap.get_int(key);
            if (!v || *v <= 0 || *v > 0xFFFFFFFFLL) return false;
            dst = static_cast<std::uint32_t>(*v);
            return true;
        };
        auto boolean = [&](std::string_view key, bool& dst) -> bool {
            if (!snap.contains(key)) return true;
            const auto v = snap.get_bool(key);
            if (!v) return false;
            dst = *v;
            return true;
        };
        auto bad = [](std::string_view key, std::string_view want) {
            return error(ConfigErrc::InvalidValue, std::string(key), "expected " + std::string(want));
        };

        if (!positive_ms("verify.timeout_ms", rs.verify.timeout))                 return bad("verify.timeout_ms", "a positive integer");
        if (!positive_ms("verify.poll_interval_ms", rs.verify.poll_interval))     return bad("verify.poll_interval_ms", "a positive integer");
        if (!positive_u32("verify.max_attempts", rs.verify.max_attempts))         return bad("verify.max_attempts", "a positive integer");
        if (!positive_ms("verify.attempt_timeout_ms", rs.verify.attempt_timeout)) return bad("verify.attempt_timeout_ms", "a positive integer");
        if (!positive_u32("verify.concurrency", rs.verify.concurrency))           return bad("verify.concurrency", "a positive integer");
        if (!boolean("verify.tls_verify", rs.verify.tls_verify))                  return bad("verify.tls_verify", "a boolean");

        rs.runtime.kind          = snap.get_or("runtime.kind", RUNTIME_KIND_DOCKER);
        rs.runtime.docker_binary = snap.get_or("runtime.docker_binary", DOCKER_BINARY);
        rs.runtime.command_timeout = std::chrono::milliseconds(RUNTIME_COMMAND_TIMEOUT_MS);
        if (rs.runtime.kind != RUNTIME_KIND_DOCKER && rs.runtime.kind != RUNTIME_KIND_SIMULATED) {
            return bad("runtime.kind", "\"docker\" or \"simulated\"");
        }
        if (!positive_ms("runtime.command_timeout_ms", rs.runtime.command_timeout)) {
            return bad("runtime.command_timeout_ms", "a positive integer");
        }

        if (!boolean("reconcile.dry_run", rs.dry_run)) return bad("reconcile.dry_run", "a boolean");

        rs.log.level   = snap.get_or("log.level", LOG_LEVEL);
        rs.log.file    = snap.get_or("log.file", "");
        rs.log.pattern = snap.get_or("log.pattern", LOG_PATTERN);
        if (!obs::is_valid_level(rs.log.level)) {
            return bad("log.level", "one of trace|debug|info|warn|error|critical|off");
        }
        if (!positive_u32("log.file_max_size_mb", rs.log.file_max_size_mb))   return bad("log.file_max_size_mb", "a positive integer");
        if (!positive_u32("log.file_backup_count", rs.log.file_backup_count)) return bad("log.file_backup_count", "a positive integer");
        return rs;
    }

} // namespace converge::config
