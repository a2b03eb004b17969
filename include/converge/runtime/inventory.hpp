#pragma once
// converge: RuntimeInventory
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • refresh() builds a complete new inventory off to the side, then publishes it
//     with RELEASE semantics; snapshot() loads it with ACQUIRE semantics.
//   • Readers never block the refresher; a snapshot is consistent but becomes stale
//     as soon as the executor mutates the runtime (re-query with refresh()).
//   • Reclamation is handled by shared_ptr refcounts.


#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "converge/model/service_spec.hpp"
#include "converge/runtime/runtime.hpp"

namespace converge::runtime {

// -----------------------------------------------------------------------------
// Observed lifecycle of one object, relative to the desired Topology.
// -----------------------------------------------------------------------------
enum class LifecycleState : std::uint8_t {
    Absent,   ///< Desired but not present in the runtime.
    Created,  ///< Present, matches, never started.
    Running,  ///< Present, matches, running (networks/volumes: present).
    Stopped,  ///< Present, matches, exited.
    Orphaned  ///< Present but unmatched to any current Topology entry.
};

std::string_view to_string(LifecycleState s) noexcept;

/// Observed state of one runtime object.
struct InventoryRecord {
    ObjectKind     kind{ObjectKind::Container};
    std::string    name;          ///< Runtime identity
    std::string    service;       ///< Owning service when the name matches one
    LifecycleState state{LifecycleState::Absent};
    std::string    image;         ///< Observed image (containers)
    std::string    fingerprint;   ///< converge.fingerprint label, if any
    bool           running{false};///< Engine reports it running (orphans need a stop)
    std::string    reason;        ///< Why it is orphaned
    std::string    error;         ///< Last engine-reported error

    bool operator==(const InventoryRecord&) const = default;
};

using Inventory = std::vector<InventoryRecord>;

// -----------------------------------------------------------------------------
// RuntimeInventory class
// -----------------------------------------------------------------------------
///
/// Queries the runtime and classifies every in-scope object against the Topology.
/// An object is in scope when it carries this project's label or its name collides
/// with a desired name; anything else belongs to somebody else and is not reported.
///
/// Thread-safety:
///   - snapshot()/version() are lock-free and may run concurrently with refresh().
///   - refresh() calls are expected from the single coordinating flow.
//
class RuntimeInventory final {
public:
    RuntimeInventory(Runtime& runtime, model::Topology topology)
        : runtime_(runtime), topology_(std::move(topology)) {}

    /// Query the runtime, classify, publish. Unreachable runtime → Unavailable.
    [[nodiscard]] Result<Inventory> refresh();

    /// Latest published inventory (empty before the first refresh).
    [[nodiscard]] std::shared_ptr<const Inventory> snapshot() const noexcept;

    /// Monotonic version counter. Increments on every successful refresh.
    [[nodiscard]] std::uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    [[nodiscard]] const model::Topology& topology() const noexcept { return topology_; }

    /// Pure classification step (exposed for tests and dry runs).
    [[nodiscard]] static Inventory classify(const model::Topology& topology,
                                            const std::vector<RuntimeObject>& observed);

private:
    Runtime& runtime_;
    model::Topology topology_;
    std::shared_ptr<const Inventory> current_{std::make_shared<Inventory>()};
    std::atomic<std::uint64_t> version_{0};
};

/// Count of records in a given state.
std::size_t count_state(const Inventory& inv, LifecycleState s) noexcept;

} // namespace converge::runtime
