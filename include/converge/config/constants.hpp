#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the reconcile engine.
 * @details These values eliminate magic numbers from the codebase. They seed the
 *          built-in "defaults" layer; override via YAML/env/--set layers.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace converge::config::constants {

// =====================
// Layer names (precedence low → high)
// =====================
inline constexpr std::string_view LAYER_DEFAULTS         = "defaults";
inline constexpr std::string_view LAYER_EXAMPLE_TEMPLATE = "example-template";
inline constexpr std::string_view LAYER_ENVIRONMENT      = "environment";
inline constexpr std::string_view LAYER_USER_OVERRIDE    = "user-override";

/// Prefix selecting process environment variables for the environment layer.
inline constexpr std::string_view ENV_PREFIX = "CONVERGE_";

// =====================
// Keys every run requires
// =====================
inline constexpr std::string_view KEY_PROJECT_NAME      = "project.name";
inline constexpr std::string_view KEY_TOPOLOGY_SERVICES = "topology.services";

// =====================
// Runtime object labels
// =====================
inline constexpr std::string_view LABEL_PROJECT     = "converge.project";
inline constexpr std::string_view LABEL_SERVICE     = "converge.service";
inline constexpr std::string_view LABEL_FINGERPRINT = "converge.fingerprint";

/// Suffix of the per-project bridge network ("<project>_default").
inline constexpr std::string_view NETWORK_SUFFIX = "_default";

// =====================
// Health verification defaults
// Units: milliseconds unless noted
// =====================
inline constexpr uint32_t VERIFY_TIMEOUT_MS         = 60000; ///< Overall Verify deadline
inline constexpr uint32_t VERIFY_POLL_INTERVAL_MS   = 1000;  ///< Wait between attempts
inline constexpr uint32_t VERIFY_MAX_ATTEMPTS       = 30;    ///< Attempt cap per target
inline constexpr uint32_t VERIFY_ATTEMPT_TIMEOUT_MS = 3000;  ///< Single probe budget
inline constexpr uint32_t VERIFY_CONCURRENCY        = 4;     ///< Worker pool size
inline constexpr bool     VERIFY_TLS_VERIFY         = true;  ///< Verify peer certificates
inline constexpr uint32_t PROBE_SLICE_MS            = 50;    ///< Cancellation check granularity

inline constexpr uint16_t HTTP_STATUS_MIN_OK = 200; ///< Default accepted range, inclusive
inline constexpr uint16_t HTTP_STATUS_MAX_OK = 399;

inline constexpr std::string_view HEALTH_DEFAULT_HOST = "127.0.0.1";
inline constexpr std::string_view HEALTH_DEFAULT_PATH = "/";

// =====================
// Runtime backend defaults
// =====================
inline constexpr std::string_view RUNTIME_KIND_DOCKER    = "docker";
inline constexpr std::string_view RUNTIME_KIND_SIMULATED = "simulated";
inline constexpr std::string_view DOCKER_BINARY          = "docker";
inline constexpr uint32_t         RUNTIME_COMMAND_TIMEOUT_MS = 30000;

// =====================
// Logging defaults
// =====================
inline constexpr std::string_view LOG_LEVEL             = "info";
inline constexpr std::string_view LOG_PATTERN           = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v";
inline constexpr uint32_t         LOG_FILE_MAX_SIZE_MB  = 20;
inline constexpr uint32_t         LOG_FILE_BACKUP_COUNT = 5;
inline constexpr std::string_view LOGGER_NAME           = "converge";

// =====================
// Fingerprint hashing (FNV-1a 64 + avalanche)
// =====================
inline constexpr uint64_t FINGERPRINT_SEED = 0xC0A7E1CEULL; ///< Deterministic hash salt
inline constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
inline constexpr uint64_t FNV_PRIME        = 0x100000001b3ULL;

// =====================
// Identifier limits
// =====================
inline constexpr std::size_t MAX_NAME_LEN = 63; ///< Service/project name length cap

} // namespace converge::config::constants
