#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: YAML/dotenv/environment/--set sources → ConfigLayer,
 *        and resolved snapshot → Topology + run settings.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <span>
#include <string>
#include <string_view>

#include "converge/compat/expected.hpp"
#include "converge/config/config_snapshot.hpp"
#include "converge/health/verifier.hpp"
#include "converge/model/service_spec.hpp"
#include "converge/obs/observability.hpp"
#include "converge/runtime/runtime.hpp"

namespace converge::config {

    /** @struct RunSettings
     *  @brief Aggregate of sub-configs one reconcile run needs.
     */
    struct RunSettings {
        health::VerifyOptions    verify;   ///< Health polling policy
        runtime::RuntimeSettings runtime;  ///< Backend selection and CLI plumbing
        obs::LogSettings         log;      ///< Logger level/sinks/pattern
        bool                     dry_run{false}; ///< Plan only, no mutation
    };

    template <class T>
    using ConfigResult = converge_detail::expected<T, ConfigError>;

    /** @class Loader
     *  @brief Sources of configuration layers and the snapshot → model step.
     */
    class Loader {
    public:
        /**
         * @brief Flatten a YAML mapping into dotted keys.
         * @param path YAML file.
         * @param layer_name Name recorded as provenance.
         * @return Layer, or Unreadable / ParseFailure / InvalidValue.
         */
        static ConfigResult<ConfigLayer> load_yaml_file(const std::string& path, std::string layer_name);

        /// Same as load_yaml_file, from an in-memory document.
        static ConfigResult<ConfigLayer> load_yaml_string(std::string_view text, std::string layer_name);

        /// dotenv file: KEY=VALUE lines, '#' comments, optional quotes and `export`.
        static ConfigResult<ConfigLayer> load_env_file(const std::string& path, std::string layer_name);

        /// Prefixed variables from an explicit environment block (NULL-terminated).
        static ConfigLayer from_environment(const char* const* envp,
                                            std::string_view prefix = constants::ENV_PREFIX);

        /// "key=value" pairs (CLI --set). A pair without '=' is InvalidValue.
        static ConfigResult<ConfigLayer> from_pairs(std::span<const std::string> pairs,
                                                    std::string layer_name = std::string(constants::LAYER_USER_OVERRIDE));

        /// The base "defaults" layer built from named constants.
        static ConfigLayer builtin_defaults();

        /// ENV-style name → dotted key ("CONVERGE_SERVICES__API__IMAGE" → "services.api.image").
        static std::string env_key(std::string_view name, std::string_view prefix);

        /// Services, externals and health checks. InvalidTopology on malformed input.
        static ConfigResult<model::Topology> build_topology(const ConfigSnapshot& snapshot);

        /// verify.*, runtime.*, log.*, reconcile.dry_run. InvalidValue on malformed input.
        static ConfigResult<RunSettings> load_run_settings(const ConfigSnapshot& snapshot);
    };

    /// Lowercase letters, digits, '-', '_' and '.'; starts alphanumeric; ≤ MAX_NAME_LEN.
    bool valid_name(std::string_view name) noexcept;

} // namespace converge::config
