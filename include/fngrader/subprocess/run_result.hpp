#pragma once

#include <fngrader/common/formatters/enum.hpp>

#include <fmt/format.h>

#include <chrono>

namespace fngrader {

/// How a child process ended
class RunResult
{
public:
    enum class Kind { Exited, Signaled, TimedOut };

    static RunResult make_exited(int code, std::chrono::milliseconds elapsed);
    static RunResult make_signaled(int signal, std::chrono::milliseconds elapsed);
    static RunResult make_timed_out(std::chrono::milliseconds elapsed);

    Kind get_kind() const;

    /// Exit code for Exited, signal number for Signaled, 0 for TimedOut
    int get_code() const;

    /// Wall-clock time from launch to exit
    std::chrono::milliseconds get_elapsed() const;

private:
    RunResult(Kind kind, int code, std::chrono::milliseconds elapsed);

    Kind kind_;
    int code_;
    std::chrono::milliseconds elapsed_;
};

} // namespace fngrader

FMT_SERIALIZE_ENUM(::fngrader::RunResult::Kind, Exited, Signaled, TimedOut);

template <>
struct fmt::formatter<::fngrader::RunResult> : ::fngrader::DebugFormatter
{
    auto format(const ::fngrader::RunResult& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "RunResult{{kind={}, code={}, elapsed={}ms}}", from.get_kind(),
                              from.get_code(), from.get_elapsed().count());
    }
};
