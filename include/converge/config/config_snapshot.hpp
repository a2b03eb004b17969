#pragma once
/**
 * @file config_snapshot.hpp
 * @brief Layered key/value configuration: layers, merged snapshot, error codes.
 * @details Keys are flat dotted strings ("services.api.image"); list values are
 *          comma-separated. A snapshot is immutable once produced by the resolver.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace converge::config {

/// Error codes for configuration loading and resolution. All are fatal for a run.
enum class ConfigErrc : std::uint8_t {
    MissingBaseLayer,   ///< No "defaults" layer was supplied.
    MissingRequiredKey, ///< A required key is absent after merging all layers.
    Unreadable,         ///< A config file could not be opened.
    ParseFailure,       ///< A config file is not well-formed.
    InvalidValue,       ///< A value has the wrong shape (number, list, pair...).
    InvalidTopology     ///< Duplicate/dangling/malformed service definitions.
};

/// Human-readable code name ("MissingRequiredKey").
std::string_view to_string(ConfigErrc code) noexcept;

/** @struct ConfigError
 *  @brief Error code plus the offending key/path and a message.
 */
struct ConfigError {
    ConfigErrc  code{ConfigErrc::InvalidValue};
    std::string key;     ///< Key, file path or service involved (may be empty)
    std::string message; ///< Detail for logs/reports
};

using Values = std::map<std::string, std::string, std::less<>>;

/** @struct ConfigLayer
 *  @brief A named, ordered source of key/value overrides.
 */
struct ConfigLayer {
    std::string name;   ///< e.g. "defaults", "environment"
    Values      values; ///< Flat dotted keys
};

/** @class ConfigSnapshot
 *  @brief Fully merged, immutable configuration owned by one run.
 *
 * Value type: copy it into whatever needs it. Accessors never throw; typed getters
 * return std::nullopt when the key is absent or does not parse.
 */
class ConfigSnapshot {
public:
    ConfigSnapshot() = default;
    ConfigSnapshot(Values values, std::map<std::string, std::string, std::less<>> origins)
        : values_(std::move(values)), origins_(std::move(origins)) {}

    [[nodiscard]] bool contains(std::string_view key) const noexcept;
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key, std::string_view fallback) const;
    [[nodiscard]] std::optional<std::int64_t> get_int(std::string_view key) const;
    [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> get_ms(std::string_view key) const;

    /// Comma-separated list; entries trimmed, empties dropped. Absent key → empty.
    [[nodiscard]] std::vector<std::string> get_list(std::string_view key) const;

    /// Immediate child segment names under a prefix ("services" → {"api","db"}).
    [[nodiscard]] std::vector<std::string> children(std::string_view prefix) const;

    /// All keys under "prefix." with the prefix stripped.
    [[nodiscard]] Values subtree(std::string_view prefix) const;

    /// Name of the layer that supplied the key's final value.
    [[nodiscard]] std::optional<std::string> origin(std::string_view key) const;

    [[nodiscard]] const Values& values() const noexcept { return values_; }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
    Values values_;
    std::map<std::string, std::string, std::less<>> origins_;
};

/// Split "a, b,,c" → {"a","b","c"}.
std::vector<std::string> split_list(std::string_view raw);

} // namespace converge::config
