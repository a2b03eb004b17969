#pragma once
/**
 * @file config_resolver.hpp
 * @brief Merge ordered ConfigLayers into a ConfigSnapshot (last writer wins).
 */

#include <span>
#include <string>
#include <vector>

#include "converge/compat/expected.hpp"
#include "converge/config/config_snapshot.hpp"

namespace converge::config {

/** @class ConfigResolver
 *  @brief Pure function over already-loaded layers; no disk or network access.
 *
 * Required keys are the caller's list plus every key listed under
 * "services.<name>.requires" in the merged result. A missing "defaults" layer is
 * rejected before anything is merged.
 */
class ConfigResolver {
public:
    ConfigResolver() = default;
    explicit ConfigResolver(std::vector<std::string> required_keys)
        : required_(std::move(required_keys)) {}

    /**
     * @brief Merge layers in order (low → high precedence).
     * @param layers Ordered layers; must include one named "defaults".
     * @return Snapshot, or MissingBaseLayer / MissingRequiredKey.
     */
    [[nodiscard]] converge_detail::expected<ConfigSnapshot, ConfigError>
    resolve(std::span<const ConfigLayer> layers) const;

    /// Keys the caller requires regardless of service templates.
    [[nodiscard]] const std::vector<std::string>& required_keys() const noexcept { return required_; }

private:
    std::vector<std::string> required_;
};

} // namespace converge::config
