/**
 * @file config_resolver.cpp
 * @brief Layer merge + required-key validation.
 */
#include "converge/config/config_resolver.hpp"
#include "converge/config/constants.hpp"

#include <algorithm>
#include <set>

namespace converge::config {
using namespace converge::config::constants;

converge_detail::expected<ConfigSnapshot, ConfigError>
ConfigResolver::resolve(std::span<const ConfigLayer> layers) const {
    const bool has_base = std::any_of(layers.begin(), layers.end(),
                                      [](const ConfigLayer& l) { return l.name == LAYER_DEFAULTS; });
    if (!has_base) {
        return converge_detail::unexpected(ConfigError{
            ConfigErrc::MissingBaseLayer, std::string(LAYER_DEFAULTS),
            "base layer \"defaults\" was not supplied"});
    }

    Values merged;
    std::map<std::string, std::string, std::less<>> origins;
    for (const auto& layer : layers) {
        for (const auto& [key, value] : layer.values) {
            merged.insert_or_assign(key, value);
            origins.insert_or_assign(key, layer.name);
        }
    }
    ConfigSnapshot snap{std::move(merged), std::move(origins)};

    // Sorted so the reported key is deterministic.
    std::set<std::string> required(required_.begin(), required_.end());
    // Only templates of services that are part of the topology contribute.
    const auto members = snap.contains(KEY_TOPOLOGY_SERVICES) ? snap.get_list(KEY_TOPOLOGY_SERVICES)
                                                               : snap.children("services");
    for (const auto& svc : members) {
        if (snap.get_bool("services." + svc + ".enabled") == false) continue;
        for (auto& k : snap.get_list("services." + svc + ".requires")) required.insert(std::move(k));
    }
    for (const auto& key : required) {
        if (!snap.contains(key)) {
            return converge_detail::unexpected(ConfigError{
                ConfigErrc::MissingRequiredKey, key,
                "required key \"" + key + "\" is absent after merging all layers"});
        }
    }
    return snap;
}

} // namespace converge::config
