#pragma once
/**
 * @file simulated_runtime.hpp
 * @brief In-memory runtime with docker-like semantics and fault injection.
 * @details Backs the test-suite and `converge --simulate`.
 */

#include "converge/runtime/runtime.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace converge::runtime {

    /// Operation selector for fault injection.
    enum class SimOp : std::uint8_t { List, Inspect, Create, Start, Stop, Remove };

    /**
     * @class SimulatedRuntime
     * @brief Runtime backed by a map of objects keyed by (kind, name).
     *
     * Semantics follow the real engine closely enough to exercise the planner:
     * create on an existing name is a Conflict, removing a running container is a
     * Conflict, a container needs its network to exist, start/stop are idempotent.
     */
    class SimulatedRuntime final : public Runtime {
    public:
        /// Place an object directly (bypasses create checks).
        void seed(RuntimeObject obj);

        /// Toggle engine reachability; unreachable → every call is Unavailable.
        void set_available(bool available);

        /// Make `op` on `name` fail with `err`; `times` < 0 means forever.
        void inject_failure(SimOp op, std::string name, RuntimeError err, int times = -1);

        /// Drop all injected failures.
        void clear_failures();

        /// Copy of current objects (ordered by kind, name).
        [[nodiscard]] std::vector<RuntimeObject> objects() const;

        /// "create:container:demo-api"-style journal of successful mutations.
        [[nodiscard]] std::vector<std::string> journal() const;

        Result<std::vector<RuntimeObject>> list() override;
        Result<RuntimeObject> inspect(ObjectKind kind, const std::string& name) override;
        Result<void> create(const CreateRequest& req) override;
        Result<void> start(const std::string& container) override;
        Result<void> stop(const std::string& container) override;
        Result<void> remove(ObjectKind kind, const std::string& name) override;

    private:
        using Key = std::pair<ObjectKind, std::string>;

        struct Fault {
            SimOp       op;
            std::string name;
            RuntimeError error;
            int         remaining; ///< < 0: unlimited
        };

        /// Consumes one matching fault, if any. Caller holds mu_.
        std::optional<RuntimeError> take_fault(SimOp op, const std::string& name);
        void note(std::string_view verb, ObjectKind kind, const std::string& name);

        mutable std::mutex mu_;
        std::map<Key, RuntimeObject> objects_;
        std::vector<Fault> faults_;
        std::vector<std::string> journal_;
        bool available_{true};
    };

} // namespace converge::runtime
