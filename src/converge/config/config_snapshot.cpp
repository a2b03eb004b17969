/**
 * @file config_snapshot.cpp
 * @brief Typed accessors over a merged configuration map.
 */
#include "converge/config/config_snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>

namespace converge::config {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string_view to_string(ConfigErrc code) noexcept {
    switch (code) {
        case ConfigErrc::MissingBaseLayer:   return "MissingBaseLayer";
        case ConfigErrc::MissingRequiredKey: return "MissingRequiredKey";
        case ConfigErrc::Unreadable:         return "Unreadable";
        case ConfigErrc::ParseFailure:       return "ParseFailure";
        case ConfigErrc::InvalidValue:       return "InvalidValue";
        case ConfigErrc::InvalidTopology:    return "InvalidTopology";
    }
    return "Unknown";
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> out;
    while (!raw.empty()) {
        const auto comma = raw.find(',');
        const auto item  = trim(raw.substr(0, comma));
        if (!item.empty()) out.emplace_back(item);
        if (comma == std::string_view::npos) break;
        raw.remove_prefix(comma + 1);
    }
    return out;
}

bool ConfigSnapshot::contains(std::string_view key) const noexcept {
    return values_.find(key) != values_.end();
}

std::optional<std::string> ConfigSnapshot::get(std::string_view key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigSnapshot::get_or(std::string_view key, std::string_view fallback) const {
    const auto it = values_.find(key);
    return it == values_.end() ? std::string(fallback) : it->second;
}

std::optional<std::int64_t> ConfigSnapshot::get_int(std::string_view key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    const auto s = trim(it->second);
    std::int64_t v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<bool> ConfigSnapshot::get_bool(std::string_view key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    const auto v = lower(trim(it->second));
    if (v == "true" || v == "1" || v == "yes" || v == "on")  return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> ConfigSnapshot::get_ms(std::string_view key) const {
    const auto v = get_int(key);
    if (!v || *v < 0) return std::nullopt;
    return std::chrono::milliseconds{*v};
}

std::vector<std::string> ConfigSnapshot::get_list(std::string_view key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return {};
    return split_list(it->second);
}

std::vector<std::string> ConfigSnapshot::children(std::string_view prefix) const {
    std::set<std::string, std::less<>> names;
    const std::string head = std::string(prefix) + ".";
    for (auto it = values_.lower_bound(head); it != values_.end(); ++it) {
        const std::string_view k = it->first;
        if (!k.starts_with(head)) break;
        const auto rest = k.substr(head.size());
        names.emplace(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
}

Values ConfigSnapshot::subtree(std::string_view prefix) const {
    Values out;
    const std::string head = std::string(prefix) + ".";
    for (auto it = values_.lower_bound(head); it != values_.end(); ++it) {
        const std::string_view k = it->first;
        if (!k.starts_with(head)) break;
        out.emplace(std::string(k.substr(head.size())), it->second);
    }
    return out;
}

std::optional<std::string> ConfigSnapshot::origin(std::string_view key) const {
    const auto it = origins_.find(key);
    if (it == origins_.end()) return std::nullopt;
    return it->second;
}

} // namespace converge::config
