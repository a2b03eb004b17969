/**
* @file simulated_runtime.cpp
 * @brief Implementation of the in-memory runtime.
 */
#include "converge/runtime/simulated_runtime.hpp"

#include <algorithm>

namespace converge::runtime {

    namespace {
        RuntimeError unavailable() {
            return RuntimeError{RuntimeErrc::Unavailable, "simulated engine is unreachable"};
        }
        RuntimeError not_found(ObjectKind kind, const std::string& name) {
            return RuntimeError{RuntimeErrc::NotFound,
                                "no such " + std::string(to_string(kind)) + ": " + name};
        }
    } // namespace

    void SimulatedRuntime::seed(RuntimeObject obj) {
        std::lock_guard<std::mutex> lk(mu_);
        Key key{obj.kind, obj.name};
        objects_.insert_or_assign(std::move(key), std::move(obj));
    }

    void SimulatedRuntime::set_available(bool available) {
        std::lock_guard<std::mutex> lk(mu_);
        available_ = available;
    }

    void SimulatedRuntime::inject_failure(SimOp op, std::string name, RuntimeError err, int times) {
        std::lock_guard<std::mutex> lk(mu_);
        faults_.push_back(Fault{op, std::move(name), std::move(err), times});
    }

    void SimulatedRuntime::clear_failures() {
        std::lock_guard<std::mutex> lk(mu_);
        faults_.clear();
    }

    std::vector<RuntimeObject> SimulatedRuntime::objects() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<RuntimeObject> out;
        out.reserve(objects_.size());
        for (const auto& kv : objects_) out.push_back(kv.second);
        return out;
    }

    std::vector<std::string> SimulatedRuntime::journal() const {
        std::lock_guard<std::mutex> lk(mu_);
        return journal_;
    }

    std::optional<RuntimeError> SimulatedRuntime::take_fault(SimOp op, const std::string& name) {
        for (auto it = faults_.begin(); it != faults_.end(); ++it) {
            if (it->op != op || it->name != name) continue;
            RuntimeError err = it->error;
            if (it->remaining > 0 && --it->remaining == 0) faults_.erase(it);
            return err;
        }
        return std::nullopt;
    }

    void SimulatedRuntime::note(std::string_view verb, ObjectKind kind, const std::string& name) {
        journal_.push_back(std::string(verb) + ":" + std::string(to_string(kind)) + ":" + name);
    }

    Result<std::vector<RuntimeObject>> SimulatedRuntime::list() {
        std::lock_guard<std::mutex> lk(mu_);
        if (!available_) return converge_detail::unexpected(unavailable());
        if (auto f = take_fault(SimOp::List, "")) return converge_detail::unexpected(*f);
        std::vector<RuntimeObject> out;
        out.reserve(objects_.size());
        for (const auto& kv : objects_) out.push_back(kv.second);
        return out;
    }

    Result<RuntimeObject> SimulatedRuntime::inspect(ObjectKind kind, const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!available_) return converge_detail::unexpected(unavailable());
        if (auto f = take_fault(SimOp::Inspect, name)) return converge_detail::unexpected(*f);
        const auto it = objects_.find(Key{kind, name});
        if (it == objects_.end()) return converge_detail::unexpected(not_found(kind, name));
        return it->second;
    }

    Result<void> SimulatedRuntime::create(const CreateRequest& req) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!available_) return converge_detail::unexpected(unavailable());
        if (auto f = take_fault(SimOp::Create, req.name)) return converge_detail::unexpected(*f);
        if (objects_.contains(Key{req.kind, req.name})) {
            return converge_detail::unexpected(RuntimeError{
                RuntimeErrc::Conflict, "name \"" + req.name + "\" is already in use"});
        }
        if (req.kind == ObjectKind::Container && !req.network.empty() &&
            !objects_.contains(Key{ObjectKind::Network, req.network})) {
            return converge_detail::unexpected(not_found(ObjectKind::Network, req.network));
        }

        RuntimeObject obj;
        obj.kind   = req.kind;
        obj.name   = req.name;
        obj.image  = req.image;
        obj.labels = req.labels;
        obj.state  = req.kind == ObjectKind::Container ? ObjectState::Created : ObjectState::Running;
        objects_.emplace(Key{req.kind, req.name}, std::move(obj));
        note("create", req.kind, req.name);
        return {};
    }

    Result<void> SimulatedRuntime::start(const std::string& container) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!available_) return converge_detail::unexpected(unavailable());
        if (auto f = take_fault(SimOp::Start, container)) return converge_detail::unexpected(*f);
        const auto it = objects_.find(Key{ObjectKind::Container, container});
        if (it == objects_.end()) {
            return converge_detail::unexpected(not_found(ObjectKind::Container, container));
        }
        if (it->second.state != ObjectState::Running) {
            it->second.state = ObjectState::Running;
            note("start", ObjectKind::Container, container);
        }
        return {};
    }

    Result<void> SimulatedRuntime::stop(const std::string& container) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!available_) return converge_detail::unexpected(unavailable());
        if (auto f = take_fault(SimOp::Stop, container)) return converge_detail::unexpected(*f);
        const auto it = objects_.find(Key{ObjectKind::Container, container});
        if (it == objects_.end()) {
            return converge_detail::unexpected(not_found(ObjectKind::Container, container));
        }
        if (it->second.state == ObjectState::Running) {
            it->second.state = ObjectState::Stopped;
            note("stop", ObjectKind::Container, container);
        }
        return {};
    }

    Result<void> SimulatedRuntime::remove(ObjectKind kind, const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!available_) return converge_detail::unexpected(unavailable());
        if (auto f = take_fault(SimOp::Remove, name)) return converge_detail::unexpected(*f);
        const auto it = objects_.find(Key{kind, name});
        if (it == objects_.end()) return converge_detail::unexpected(not_found(kind, name));

        if (kind == ObjectKind::Container && it->second.state == ObjectState::Running) {
            return converge_detail::unexpected(RuntimeError{
                RuntimeErrc::Conflict, "cannot remove running container " + name});
        }
        objects_.erase(it);
        note("remove", kind, name);
        return {};
    }

} // namespace converge::runtime
