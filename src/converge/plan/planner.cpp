/**
 * @file planner.cpp
 * @brief Topological ordering and diff of desired vs observed state.
 */
#include "converge/plan/planner.hpp"
#include "converge/config/constants.hpp"
#include "converge/obs/observability.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace converge::plan {
    using namespace converge::config::constants;
    using runtime::InventoryRecord;
    using runtime::LifecycleState;
    using runtime::ObjectKind;

    std::string_view to_string(ActionKind k) noexcept {
        switch (k) {
            case ActionKind::Stop:   return "stop";
            case ActionKind::Remove: return "remove";
            case ActionKind::Create: return "create";
            case ActionKind::Start:  return "start";
        }
        return "unknown";
    }

    std::string_view to_string(ActionOutcome o) noexcept {
        switch (o) {
            case ActionOutcome::Succeeded: return "succeeded";
            case ActionOutcome::Failed:    return "failed";
            case ActionOutcome::Skipped:   return "skipped";
        }
        return "unknown";
    }

    std::string_view to_string(PlanErrc e) noexcept {
        switch (e) {
            case PlanErrc::CyclicDependency: return "CyclicDependency";
        }
        return "unknown";
    }

    std::string Action::label() const {
        return std::string(to_string(kind)) + " " + std::string(runtime::to_string(object)) + " " + target;
    }

    namespace {
        /// Walk dependency edges among `remaining` until a service repeats.
        std::vector<std::string> find_cycle(const model::Topology& topo, const std::set<std::string>& remaining) {
            std::map<std::string, std::size_t> seen_at;
            std::vector<std::string> path;
            std::string cur = *remaining.begin();
            while (!seen_at.contains(cur)) {
                seen_at.emplace(cur, path.size());
                path.push_back(cur);
                const auto* s = topo.find(cur);
                std::set<std::string> deps(s->depends_on.begin(), s->depends_on.end());
                // Every remaining service still has an unprocessed dependency.
                for (const auto& d : deps) {
                    if (remaining.contains(d)) { cur = d; break; }
                }
            }
            std::vector<std::string> cycle(path.begin() + static_cast<std::ptrdiff_t>(seen_at[cur]), path.end());
            cycle.push_back(cur);
            return cycle;
        }

        runtime::Labels project_labels(const model::Topology& topo) {
            return {{std::string(LABEL_PROJECT), topo.project()}};
        }

        /// Rank order inside rank 0: containers go before the networks/volumes they use.
        int object_order(ObjectKind k) noexcept {
            switch (k) {
                case ObjectKind::Container: return 0;
                case ObjectKind::Network:   return 1;
                case ObjectKind::Volume:    return 2;
            }
            return 3;
        }
    } // namespace

    //------------------------------- Ordering -----------------------------------

    converge_detail::expected<std::vector<OrderedService>, PlanError>
    ReconciliationPlanner::order(const model::Topology& topology) {
        std::map<std::string, std::size_t> indegree;
        std::map<std::string, std::vector<std::string>> dependents;
        for (const auto& s : topology.services()) {
            const std::set<std::string> deps(s.depends_on.begin(), s.depends_on.end());
            indegree[s.name] = 0;
            for (const auto& d : deps) {
                if (!topology.contains(d)) continue; // rejected at load time
                ++indegree[s.name];
                dependents[d].push_back(s.name);
            }
        }

        std::set<std::string> ready;
        for (const auto& [name, deg] : indegree) if (deg == 0) ready.insert(name);

        std::map<std::string, std::uint32_t> level;
        std::vector<OrderedService> out;
        out.reserve(indegree.size());
        while (!ready.empty()) {
            const std::string n = *ready.begin();
            ready.erase(ready.begin());
            out.push_back(OrderedService{n, level[n]});
            for (const auto& d : dependents[n]) {
                level[d] = std::max(level[d], level[n] + 1);
                if (--indegree[d] == 0) ready.insert(d);
            }
        }

        if (out.size() != indegree.size()) {
            std::set<std::string> remaining;
            for (const auto& [name, deg] : indegree) if (deg > 0) remaining.insert(name);
            PlanError err;
            err.cycle = find_cycle(topology, remaining);
            err.message = fmt::format("dependency cycle: {}", fmt::join(err.cycle, " -> "));
            return converge_detail::unexpected(std::move(err));
        }
        return out;
    }

    //------------------------------- Planning -----------------------------------

    converge_detail::expected<Plan, PlanError>
    ReconciliationPlanner::plan(const model::Topology& desired, const runtime::Inventory& current) const {
        auto ordered = order(desired);
        if (!ordered) {
            obs::logger()->error("plan: {}", ordered.error().message);
            return converge_detail::unexpected(ordered.error());
        }

        Plan out;

        // 1) Orphans first: they hold names/ports the replacements need.
        for (const auto& rec : current) {
            if (rec.state != LifecycleState::Orphaned) continue;
            if (rec.kind == ObjectKind::Container && rec.running) {
                out.push_back(Action{.kind = ActionKind::Stop, .object = rec.kind, .target = rec.name,
                                     .service = rec.service, .rank = 0});
            }
            out.push_back(Action{.kind = ActionKind::Remove, .object = rec.kind, .target = rec.name,
                                 .service = rec.service, .rank = 0});
        }

        // Desired object present and matching (anything but absent/orphaned).
        auto observed = [&](ObjectKind kind, const std::string& name) -> const InventoryRecord* {
            for (const auto& rec : current) {
                if (rec.kind == kind && rec.name == name && rec.state != LifecycleState::Orphaned) return &rec;
            }
            return nullptr;
        };
        auto present = [&](ObjectKind kind, const std::string& name) {
            const auto* rec = observed(kind, name);
            return rec != nullptr && rec->state != LifecycleState::Absent;
        };

        // 2) Project network and volumes.
        const std::string network = desired.network_name();
        if (!present(ObjectKind::Network, network)) {
            runtime::CreateRequest req{.kind = ObjectKind::Network, .name = network,
                                       .labels = project_labels(desired)};
            out.push_back(Action{.kind = ActionKind::Create, .object = ObjectKind::Network,
                                 .target = network, .rank = 1, .create = std::move(req)});
        }
        for (const auto& vol : desired.volume_names()) {
            if (present(ObjectKind::Volume, vol)) continue;
            runtime::CreateRequest req{.kind = ObjectKind::Volume, .name = vol,
                                       .labels = project_labels(desired)};
            out.push_back(Action{.kind = ActionKind::Create, .object = ObjectKind::Volume,
                                 .target = vol, .rank = 1, .create = std::move(req)});
        }

        // 3) Services in dependency order.
        for (const auto& o : *ordered) {
            const model::ServiceSpec& s = *desired.find(o.name);
            const std::string cname = desired.container_name(s.name);

            std::vector<std::string> dep_containers;
            std::vector<model::HealthCheckDescriptor> readiness;
            for (const auto& d : s.depends_on) {
                dep_containers.push_back(desired.container_name(d));
                if (const auto* dep = desired.find(d); dep != nullptr && dep->health) {
                    readiness.push_back(*dep->health);
                }
            }

            const auto* rec = observed(ObjectKind::Container, cname);
            const LifecycleState state = rec ? rec->state : LifecycleState::Absent;
            if (state == LifecycleState::Running) continue; // converged

            if (state == LifecycleState::Absent) {
                std::vector<ObjectRef> needs{ObjectRef{ObjectKind::Network, network}};
                for (const auto& v : s.volumes) needs.push_back({ObjectKind::Volume, v.volume});
                for (const auto& d : dep_containers) needs.push_back({ObjectKind::Container, d});

                runtime::CreateRequest req{
                    .kind    = ObjectKind::Container,
                    .name    = cname,
                    .image   = s.image,
                    .ports   = s.ports,
                    .volumes = s.volumes,
                    .env     = s.env,
                    .network = network,
                    .labels  = {{std::string(LABEL_PROJECT), desired.project()},
                                {std::string(LABEL_SERVICE), s.name},
                                {std::string(LABEL_FINGERPRINT), model::fingerprint(s)}}};
                out.push_back(Action{.kind = ActionKind::Create, .object = ObjectKind::Container,
                                     .target = cname, .service = s.name, .rank = 2 + 2 * o.level,
                                     .needs = std::move(needs), .create = std::move(req)});
            }

            std::vector<ObjectRef> needs{ObjectRef{ObjectKind::Container, cname}};
            for (const auto& d : dep_containers) needs.push_back({ObjectKind::Container, d});
            out.push_back(Action{.kind = ActionKind::Start, .object = ObjectKind::Container,
                                 .target = cname, .service = s.name, .rank = 3 + 2 * o.level,
                                 .needs = std::move(needs), .readiness = std::move(readiness)});
        }

        std::stable_sort(out.begin(), out.end(), [](const Action& a, const Action& b) {
            const int oa = object_order(a.object);
            const int ob = object_order(b.object);
            return std::tie(a.rank, oa, a.service, a.target, a.kind) <
                   std::tie(b.rank, ob, b.service, b.target, b.kind);
        });

        obs::logger()->info("plan: {} actions for project {}", out.size(), desired.project());
        return out;
    }

} // namespace converge::plan
