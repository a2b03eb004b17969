#pragma once
/**
 * @file action.hpp
 * @brief Planned operation and its execution result.
 */

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "converge/model/service_spec.hpp"
#include "converge/runtime/runtime.hpp"

namespace converge::plan {

/// Operation kind. Declaration order is the tie-break order within a rank.
enum class ActionKind : std::uint8_t { Stop = 0, Remove = 1, Create = 2, Start = 3 };

std::string_view to_string(ActionKind k) noexcept;

/** @struct ObjectRef
 *  @brief Kind-qualified runtime identity. A container and a volume may share a name.
 */
struct ObjectRef {
    runtime::ObjectKind kind{runtime::ObjectKind::Container};
    std::string         name;

    auto operator<=>(const ObjectRef&) const = default;
};

/** @struct Action
 *  @brief One planned operation, consumed exactly once by the executor.
 */
struct Action {
    ActionKind          kind{ActionKind::Create};
    runtime::ObjectKind object{runtime::ObjectKind::Container};
    std::string         target;     ///< Runtime identity acted upon
    std::string         service;    ///< Owning service (empty for project-level objects)
    std::uint32_t       rank{0};    ///< Ordering rank (lower first)
    std::vector<ObjectRef>   needs; ///< Identities that must not have failed earlier
    runtime::CreateRequest   create;///< Populated for Create
    std::vector<model::HealthCheckDescriptor> readiness; ///< Direct deps' checks (Start)

    /// "create container demo-api"
    [[nodiscard]] std::string label() const;

    bool operator==(const Action&) const = default;
};

using Plan = std::vector<Action>;

/// Outcome of one executed action.
enum class ActionOutcome : std::uint8_t { Succeeded, Failed, Skipped };

std::string_view to_string(ActionOutcome o) noexcept;

/** @struct ActionResult
 *  @brief Result of executing one Action.
 */
struct ActionResult {
    Action        action;
    ActionOutcome outcome{ActionOutcome::Skipped};
    std::string   error;   ///< Runtime error or skip reason
    std::chrono::milliseconds duration{0};
};

} // namespace converge::plan
