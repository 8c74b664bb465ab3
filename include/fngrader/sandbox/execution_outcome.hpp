#pragma once

#include <fngrader/common/formatters/enum.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>

namespace fngrader {

/// Raw result of running an instrumented program. Never an exception: every failure is a status.
struct ExecutionOutcome
{
    enum class Status {
        Exited,       ///< Ran to completion; `code` is the exit code
        Signaled,     ///< Killed by a signal that was not the watchdog's; `code` is the signal
        TimedOut,     ///< Exceeded the wall-clock budget
        LaunchFailure ///< Could not be copied, isolated, launched or torn down
    };

    Status status = Status::LaunchFailure;
    int code = 0;

    std::string stdout_text;
    std::string stderr_text;

    /// Human-readable account of any failure; empty on success
    std::string diagnostic;

    bool success() const { return status == Status::Exited && code == 0; }

    static ExecutionOutcome launch_failure(std::string diagnostic) {
        return ExecutionOutcome{.status = Status::LaunchFailure,
                                .code = 0,
                                .stdout_text = {},
                                .stderr_text = {},
                                .diagnostic = std::move(diagnostic)};
    }
};

} // namespace fngrader

FMT_SERIALIZE_ENUM(::fngrader::ExecutionOutcome::Status, Exited, Signaled, TimedOut, LaunchFailure);
