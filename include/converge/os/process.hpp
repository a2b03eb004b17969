#pragma once
/**
 * @file process.hpp
 * @brief Run an external command (no shell) with captured output and a timeout.
 * @note Linux/POSIX: fork + execvp, pipes polled with poll(2).
 */

#include <chrono>
#include <cstdint>
#include <span>
#include <string>

#include "converge/compat/expected.hpp"

namespace converge::os {

    /// @brief Why a command could not be run to completion.
    enum class ProcessErrc : std::uint8_t {
        NotFound = 0,   ///< Executable not found on PATH / not executable
        SpawnFailed,    ///< pipe/fork failed
        Timeout,        ///< Exceeded its budget; the child was killed
        IoError         ///< Reading the child's output failed
    };

    /// @brief Error code plus detail (errno text, command).
    struct ProcessError {
        ProcessErrc code{ProcessErrc::SpawnFailed};
        std::string message;
    };

    /// @brief Completed command: exit status and captured streams.
    struct ProcessResult {
        int exit_code{0};       ///< 128+signal when killed by a signal
        std::string out;        ///< Captured stdout
        std::string err;        ///< Captured stderr
    };

    /// @brief Run argv[0] with arguments argv[1..] and wait up to `timeout`.
    /// @return ProcessResult for any exit status; ProcessError when it could not run.
    converge_detail::expected<ProcessResult, ProcessError>
    run_process(std::span<const std::string> argv, std::chrono::milliseconds timeout);

} // namespace converge::os
