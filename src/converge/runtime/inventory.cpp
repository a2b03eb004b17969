// RuntimeInventory: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Refresh: classify into a fresh vector, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "converge/runtime/inventory.hpp"
#include "converge/config/constants.hpp"
#include "converge/obs/observability.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

namespace converge::runtime {
using namespace converge::config::constants;

namespace {

std::string label_of(const RuntimeObject& obj, std::string_view key) {
    const auto it = obj.labels.find(std::string(key));
    return it == obj.labels.end() ? std::string{} : it->second;
}

LifecycleState from_engine(ObjectState s) noexcept {
    switch (s) {
        case ObjectState::Created: return LifecycleState::Created;
        case ObjectState::Running: return LifecycleState::Running;
        case ObjectState::Stopped: return LifecycleState::Stopped;
    }
    return LifecycleState::Stopped;
}

} // namespace

std::string_view to_string(LifecycleState s) noexcept {
    switch (s) {
        case LifecycleState::Absent:   return "absent";
        case LifecycleState::Created:  return "created";
        case LifecycleState::Running:  return "running";
        case LifecycleState::Stopped:  return "stopped";
        case LifecycleState::Orphaned: return "orphaned";
    }
    return "unknown";
}

std::size_t count_state(const Inventory& inv, LifecycleState s) noexcept {
    return static_cast<std::size_t>(
        std::count_if(inv.begin(), inv.end(), [s](const InventoryRecord& r) { return r.state == s; }));
}

//------------------------------- Classification -------------------------------

Inventory RuntimeInventory::classify(const model::Topology& topology,
                                     const std::vector<RuntimeObject>& observed) {
    struct Desired { std::string service; std::string fingerprint; };

    std::map<std::string, Desired> containers;   // container name → owning service
    for (const auto& s : topology.services()) {
        containers.emplace(topology.container_name(s.name), Desired{s.name, model::fingerprint(s)});
    }
    const std::string network = topology.network_name();
    const auto vols = topology.volume_names();
    const std::set<std::string> volumes(vols.begin(), vols.end());

    Inventory out;
    std::set<std::pair<ObjectKind, std::string>> seen;

    for (const auto& obj : observed) {
        const auto cit     = containers.find(obj.name);
        const bool desired = (obj.kind == ObjectKind::Container && cit != containers.end()) ||
                             (obj.kind == ObjectKind::Network   && obj.name == network) ||
                             (obj.kind == ObjectKind::Volume    && volumes.contains(obj.name));
        const bool ours    = label_of(obj, LABEL_PROJECT) == topology.project();
        if (!desired && !ours) continue; // not ours, not in the way

        InventoryRecord rec;
        rec.kind        = obj.kind;
        rec.name        = obj.name;
        rec.image       = obj.image;
        rec.fingerprint = label_of(obj, LABEL_FINGERPRINT);
        rec.running     = obj.kind == ObjectKind::Container && obj.state == ObjectState::Running;
        rec.error       = obj.error;

        if (!desired) {
            rec.state  = LifecycleState::Orphaned;
            rec.reason = "not part of the desired topology";
        } else if (obj.kind != ObjectKind::Container) {
            rec.state = LifecycleState::Running;
        } else {
            rec.service = cit->second.service;
            if (rec.fingerprint == cit->second.fingerprint) {
                rec.state = from_engine(obj.state);
            } else {
                // Same name, different definition: it occupies the name and must go first.
                rec.state  = LifecycleState::Orphaned;
                rec.reason = rec.fingerprint.empty()
                    ? "name conflicts with service \"" + rec.service + "\" (not created by converge)"
                    : "stale definition of service \"" + rec.service + "\" (fingerprint " +
                      rec.fingerprint + " != " + cit->second.fingerprint + ")";
            }
        }
        seen.emplace(obj.kind, obj.name);
        out.push_back(std::move(rec));
    }

    // Desired objects the runtime does not have.
    auto add_absent = [&](ObjectKind kind, const std::string& name, const std::string& service) {
        if (seen.contains({kind, name})) return;
        InventoryRecord rec;
        rec.kind    = kind;
        rec.name    = name;
        rec.service = service;
        rec.state   = LifecycleState::Absent;
        out.push_back(std::move(rec));
    };
    add_absent(ObjectKind::Network, network, {});
    for (const auto& v : volumes) add_absent(ObjectKind::Volume, v, {});
    for (const auto& [name, d] : containers) add_absent(ObjectKind::Container, name, d.service);

    std::sort(out.begin(), out.end(), [](const InventoryRecord& a, const InventoryRecord& b) {
        return std::tie(a.kind, a.name) < std::tie(b.kind, b.name);
    });
    return out;
}

//------------------------------- Public API -----------------------------------

Result<Inventory> RuntimeInventory::refresh() {
    auto listed = runtime_.list();
    if (!listed) {
        // Without current state nothing can be planned safely; every list failure is fatal.
        obs::logger()->error("inventory: runtime unavailable: {}", listed.error().message);
        return converge_detail::unexpected(
            RuntimeError{RuntimeErrc::Unavailable, listed.error().message});
    }

    auto next = std::make_shared<Inventory>(classify(topology_, *listed));
    Inventory result = *next;

    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE.
    std::shared_ptr<const Inventory> cnext = std::move(next);
    std::atomic_store_explicit(&current_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);

    obs::logger()->debug("inventory: v{} {} records ({} orphaned, {} absent)",
                         version(), result.size(),
                         count_state(result, LifecycleState::Orphaned),
                         count_state(result, LifecycleState::Absent));
    return result;
}

std::shared_ptr<const Inventory> RuntimeInventory::snapshot() const noexcept {
    return std::atomic_load_explicit(&current_, std::memory_order_acquire);
}

} // namespace converge::runtime
