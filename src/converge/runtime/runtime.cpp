/**
 * @file runtime.cpp
 * @brief Names for runtime enums (logs, reports, CLI output).
 */
#include "converge/runtime/runtime.hpp"

namespace converge::runtime {

    std::string_view to_string(ObjectKind k) noexcept {
        switch (k) {
            case ObjectKind::Container: return "container";
            case ObjectKind::Network:   return "network";
            case ObjectKind::Volume:    return "volume";
        }
        return "object";
    }

    std::string_view to_string(ObjectState s) noexcept {
        switch (s) {
            case ObjectState::Created: return "created";
            case ObjectState::Running: return "running";
            case ObjectState::Stopped: return "stopped";
        }
        return "unknown";
    }

    std::string_view to_string(RuntimeErrc e) noexcept {
        switch (e) {
            case RuntimeErrc::Unavailable: return "Unavailable";
            case RuntimeErrc::NotFound:    return "NotFound";
            case RuntimeErrc::Conflict:    return "Conflict";
            case RuntimeErrc::Failed:      return "Failed";
        }
        return "Unknown";
    }

} // namespace converge::runtime
