#pragma once
/**
 * @file planner.hpp
 * @brief ReconciliationPlanner: desired Topology × observed Inventory → ordered Plan.
 *
 * Rank scheme (lower runs first):
 *  - 0       stop/remove orphans
 *  - 1       create the project network and absent volumes
 *  - 2 + 2L  create a service at dependency level L
 *  - 3 + 2L  start a service at dependency level L
 * where L(s) = 0 without dependencies, else 1 + max L(dep).
 * Within a rank: owning service, then target, then kind (stop < remove < create < start).
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "converge/compat/expected.hpp"
#include "converge/model/service_spec.hpp"
#include "converge/plan/action.hpp"
#include "converge/runtime/inventory.hpp"

namespace converge::plan {

/// Planning error codes; the only one is fatal by construction.
enum class PlanErrc : std::uint8_t { CyclicDependency };

std::string_view to_string(PlanErrc e) noexcept;

/** @struct PlanError
 *  @brief Error code plus the services forming the cycle.
 */
struct PlanError {
    PlanErrc code{PlanErrc::CyclicDependency};
    std::vector<std::string> cycle; ///< "a", "b", "a": closed walk of service names
    std::string message;
};

/// Service name with its dependency level.
struct OrderedService {
    std::string   name;
    std::uint32_t level{0};
};

/** @class ReconciliationPlanner
 *  @brief Pure planner; holds no state between calls.
 */
class ReconciliationPlanner {
public:
    /// Ordered, idempotent plan; CyclicDependency with no partial plan on a cycle.
    [[nodiscard]] converge_detail::expected<Plan, PlanError>
    plan(const model::Topology& desired, const runtime::Inventory& current) const;

    /// Kahn's algorithm with a name-ordered ready set; levels per service.
    [[nodiscard]] static converge_detail::expected<std::vector<OrderedService>, PlanError>
    order(const model::Topology& topology);
};

} // namespace converge::plan
