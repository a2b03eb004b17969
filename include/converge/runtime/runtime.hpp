#pragma once
/**
 * @file runtime.hpp
 * @brief Pluggable container-runtime collaborator: list/inspect/create/start/stop/remove.
 * @details Implemented by DockerCliRuntime (real engine) and SimulatedRuntime (in-memory).
 *          Every mutation must be safe to retry.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "converge/compat/expected.hpp"
#include "converge/model/service_spec.hpp"

namespace converge::runtime {

/// Kind of runtime object.
enum class ObjectKind : std::uint8_t { Container, Network, Volume };

/// Raw lifecycle state as the engine reports it (containers only; others are Running).
enum class ObjectState : std::uint8_t { Created, Running, Stopped };

/// Runtime error codes.
enum class RuntimeErrc : std::uint8_t {
    Unavailable, ///< Engine cannot be reached at all
    NotFound,    ///< Named object does not exist
    Conflict,    ///< Name already taken / object in use
    Failed       ///< Any other engine-side failure
};

std::string_view to_string(ObjectKind k) noexcept;
std::string_view to_string(ObjectState s) noexcept;
std::string_view to_string(RuntimeErrc e) noexcept;

/** @struct RuntimeError
 *  @brief Error code plus the engine's message.
 */
struct RuntimeError {
    RuntimeErrc code{RuntimeErrc::Failed};
    std::string message;
};

using Labels = std::map<std::string, std::string>;

/** @struct RuntimeObject
 *  @brief One object as observed in the engine.
 */
struct RuntimeObject {
    ObjectKind  kind{ObjectKind::Container};
    std::string name;
    std::string image;                         ///< Containers only
    ObjectState state{ObjectState::Running};
    Labels      labels;
    std::string error;                         ///< Last engine-reported error, if any

    bool operator==(const RuntimeObject&) const = default;
};

/** @struct CreateRequest
 *  @brief Everything needed to create one object.
 */
struct CreateRequest {
    ObjectKind  kind{ObjectKind::Container};
    std::string name;
    std::string image;
    std::vector<model::PortMapping>    ports;
    std::vector<model::VolumeMount>    volumes;
    std::map<std::string, std::string> env;
    std::string network;                       ///< Network to attach (containers)
    Labels      labels;

    bool operator==(const CreateRequest&) const = default;
};

/** @struct RuntimeSettings
 *  @brief Backend selection and CLI plumbing.
 */
struct RuntimeSettings {
    std::string kind;                          ///< "docker" or "simulated"
    std::string docker_binary;                 ///< Executable name or path
    std::chrono::milliseconds command_timeout{0};
};

template <class T>
using Result = converge_detail::expected<T, RuntimeError>;

class Runtime {
public:
    virtual ~Runtime() = default;

    /// All objects the engine knows about. Empty is a valid answer.
    virtual Result<std::vector<RuntimeObject>> list() = 0;

    /// One object by kind+name; NotFound when absent.
    virtual Result<RuntimeObject> inspect(ObjectKind kind, const std::string& name) = 0;

    virtual Result<void> create(const CreateRequest& req) = 0;
    virtual Result<void> start(const std::string& container) = 0;
    virtual Result<void> stop(const std::string& container) = 0;
    virtual Result<void> remove(ObjectKind kind, const std::string& name) = 0;
};

} // namespace converge::runtime
