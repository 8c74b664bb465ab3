#include "sandbox/outcome.hpp"

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/linux.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/subprocess/run_result.hpp>

#include "subprocess/subprocess.hpp"

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/resource.h>

namespace fngrader {

namespace {

constexpr std::size_t MEBIBYTE = 1024 * 1024;

/// Supervisors that report a child's fatal signal as an exit code use 128 + signal
constexpr int SIGNAL_EXIT_CODE_BASE = 128;

/// How much of stderr is quoted in a diagnostic
constexpr std::size_t STDERR_TAIL_SIZE = 2000;

std::string_view stderr_tail(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }

    if (text.size() <= STDERR_TAIL_SIZE) {
        return text;
    }

    text.remove_prefix(text.size() - STDERR_TAIL_SIZE);

    // Start on a whole line where possible
    if (auto newline = text.find('\n'); newline != std::string_view::npos) {
        text.remove_prefix(newline + 1);
    }

    return text;
}

std::string timeout_diagnostic(const SandboxLimits& limits) {
    return fmt::format("exceeded the time limit of {}ms", limits.timeout.count());
}

} // namespace

std::vector<std::string> program_environment() {
    return {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8", "LC_ALL=C.UTF-8"};
}

std::vector<std::string> interpreter_arguments(const Interpreter& interpreter, const std::string& program) {
    auto args = interpreter.flags;
    args.push_back(program);
    return args;
}

ChildResourceLimits to_child_limits(const SandboxLimits& limits) {
    return ChildResourceLimits{.cpu_seconds = static_cast<rlim_t>(limits.cpu_seconds()),
                               .address_space_bytes = static_cast<rlim_t>(limits.memory_mb * MEBIBYTE),
                               .file_size_bytes = static_cast<rlim_t>(limits.max_file_size_mb * MEBIBYTE),
                               .disable_core_dumps = true};
}

ExecutionOutcome make_outcome(const RunResult& result, std::string stdout_text, std::string stderr_text,
                              const SandboxLimits& limits) {
    ExecutionOutcome outcome{.status = ExecutionOutcome::Status::Exited,
                             .code = result.get_code(),
                             .stdout_text = std::move(stdout_text),
                             .stderr_text = std::move(stderr_text),
                             .diagnostic = {}};

    switch (result.get_kind()) {
    case RunResult::Kind::Exited:
        if (outcome.code != 0) {
            outcome.diagnostic = fmt::format("exited with code {}", outcome.code);

            if (auto tail = stderr_tail(outcome.stderr_text); !tail.empty()) {
                outcome.diagnostic += fmt::format(":\n{}", tail);
            }
        }
        break;

    case RunResult::Kind::Signaled: {
        const int signal = outcome.code;
        const bool budget_spent = result.get_elapsed() >= limits.timeout;

        if (budget_spent && (signal == SIGXCPU || signal == SIGKILL)) {
            outcome.status = ExecutionOutcome::Status::TimedOut;
            outcome.diagnostic = timeout_diagnostic(limits);
            break;
        }

        outcome.status = ExecutionOutcome::Status::Signaled;
        outcome.diagnostic = fmt::format("killed by signal {} ({})", signal, linux::Signal{signal});
        break;
    }

    case RunResult::Kind::TimedOut:
        outcome.status = ExecutionOutcome::Status::TimedOut;
        outcome.code = 0;
        outcome.diagnostic = timeout_diagnostic(limits);
        break;

    default:
        UNREACHABLE(result.get_kind());
    }

    return outcome;
}

ExecutionOutcome run_to_completion(Subprocess& proc, const SandboxLimits& limits, std::chrono::milliseconds watchdog,
                                   SignalReporting reporting) {
    if (auto res = proc.start(); !res) {
        if (res.error() == ErrorKind::LaunchFailure) {
            return ExecutionOutcome::launch_failure(proc.get_launch_diagnostic());
        }
        return ExecutionOutcome::launch_failure(fmt::format("could not start the program ({})", res.error()));
    }

    auto result = proc.wait_for_exit(watchdog);

    if (!result) {
        // The process group is killed by the Subprocess destructor
        return ExecutionOutcome::launch_failure(fmt::format("lost track of the program ({})", result.error()));
    }

    if (proc.was_output_truncated()) {
        LOG_WARN("Output of the program was truncated to {} bytes per stream", Subprocess::DEFAULT_CAPTURE_LIMIT);
    }

    RunResult run_result = result.value();

    if (reporting == SignalReporting::ExitCodeAbove128 && run_result.get_kind() == RunResult::Kind::Exited &&
        run_result.get_code() > SIGNAL_EXIT_CODE_BASE) {
        run_result = RunResult::make_signaled(run_result.get_code() - SIGNAL_EXIT_CODE_BASE, run_result.get_elapsed());
    }

    return make_outcome(run_result, proc.get_stdout(), proc.get_stderr(), limits);
}

} // namespace fngrader
