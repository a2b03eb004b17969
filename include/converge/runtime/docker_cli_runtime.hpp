#pragma once
/**
 * @file docker_cli_runtime.hpp
 * @brief Runtime backed by the `docker` command-line client.
 * @details Every call spawns one docker command via os::run_process (no shell) and
 *          maps its exit status and stderr onto RuntimeErrc.
 */

#include "converge/runtime/runtime.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace converge::runtime {

    /**
     * @class DockerCliRuntime
     * @brief Lists with `ps -a` / `network ls` / `volume ls`, mutates with
     *        `create|start|stop|rm` and `network|volume create|rm`.
     */
    class DockerCliRuntime final : public Runtime {
    public:
        explicit DockerCliRuntime(RuntimeSettings settings);

        Result<std::vector<RuntimeObject>> list() override;
        Result<RuntimeObject> inspect(ObjectKind kind, const std::string& name) override;
        Result<void> create(const CreateRequest& req) override;
        Result<void> start(const std::string& container) override;
        Result<void> stop(const std::string& container) override;
        Result<void> remove(ObjectKind kind, const std::string& name) override;

        // ---- Output parsing helpers (pure; exercised directly by tests) ----

        /// Lines of "name\timage\tstate\tk=v,k=v" from `docker ps --format`.
        static std::vector<RuntimeObject> parse_containers(std::string_view out);

        /// Lines of "name\tk=v,k=v" from `docker network|volume ls --format`.
        static std::vector<RuntimeObject> parse_named(ObjectKind kind, std::string_view out);

        /// docker "State" word → ObjectState (created / running / exited...).
        static ObjectState parse_state(std::string_view state) noexcept;

        /// "a=b,c=d" → {a:b, c:d}
        static Labels parse_labels(std::string_view raw);

        /// Map a failed command's stderr onto an error code.
        static RuntimeError classify_failure(int exit_code, std::string_view err_text);

        /// Arguments (without the binary) that create `req`.
        static std::vector<std::string> create_args(const CreateRequest& req);

    private:
        /// Run `docker <args...>`; stdout on success.
        Result<std::string> run(std::vector<std::string> args) const;

        RuntimeSettings settings_;
    };

} // namespace converge::runtime
