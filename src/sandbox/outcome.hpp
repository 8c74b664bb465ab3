#pragma once

#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/subprocess/run_result.hpp>

#include "subprocess/subprocess.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace fngrader {

/// Environment given to every program; nothing of the grader's own environment leaks through
std::vector<std::string> program_environment();

/// Interpreter flags followed by the program path
std::vector<std::string> interpreter_arguments(const Interpreter& interpreter, const std::string& program);

/// rlimits corresponding to `limits`
ChildResourceLimits to_child_limits(const SandboxLimits& limits);

/// Classifies how the program ended and writes a diagnostic for anything but a clean exit.
/// A fatal signal delivered after the wall-clock budget elapsed (e.g. SIGXCPU from the CPU limit) counts as a
/// timeout.
ExecutionOutcome make_outcome(const RunResult& result, std::string stdout_text, std::string stderr_text,
                              const SandboxLimits& limits);

/// How the launched process reports that the program died of a signal
enum class SignalReporting {
    Native,          ///< The program is the launched process
    ExitCodeAbove128 ///< The launched process is a supervisor exiting with 128 + signal
};

/// Starts `proc` and waits at most `watchdog` for it to finish
ExecutionOutcome run_to_completion(Subprocess& proc, const SandboxLimits& limits, std::chrono::milliseconds watchdog,
                                   SignalReporting reporting = SignalReporting::Native);

} // namespace fngrader
