#pragma once

#include <fngrader/common/formatters/enum.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fngrader {

/// How instrumented programs are interpreted
struct Interpreter
{
    std::string path = "/usr/bin/python3";

    /// Isolated mode: ignore PYTHON* environment variables and user site-packages; no .pyc writes
    std::vector<std::string> flags = {"-I", "-B"};
};

/// Runs an instrumented program under resource limits.
///
/// `run` never throws: every failure, including failure to launch or to clean up, is reported as an
/// ExecutionOutcome. Executors hold only configuration, so `run` may be called from several threads at once.
class Executor
{
public:
    explicit Executor(Interpreter interpreter = {})
        : interpreter_{std::move(interpreter)} {}

    virtual ~Executor() = default;

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor(Executor&&) = default;
    Executor& operator=(Executor&&) = default;

    virtual ExecutionOutcome run(const std::filesystem::path& program, const SandboxLimits& limits) const = 0;

    /// Short name used in logs and option values
    virtual std::string name() const = 0;

    const Interpreter& get_interpreter() const { return interpreter_; }

private:
    Interpreter interpreter_;
};

/// An executor that runs each program inside its own private scratch area.
///
/// The program is copied into a fresh ScratchArea, executed there with nothing else of the host visible
/// for writing, and the scratch area is removed afterwards. Failure to remove it is itself a LaunchFailure.
class IsolatedExecutor : public Executor
{
public:
    /// Extra wall-clock allowance on top of the timeout for setting up and tearing down isolation
    static constexpr std::chrono::milliseconds GRACE_PERIOD{2000};

    /// Host paths the interpreter needs, made visible read-only to the program when they exist
    static constexpr std::array<std::string_view, 6> READ_ONLY_SYSTEM_PATHS = {"/usr", "/lib",  "/lib64",
                                                                              "/bin", "/etc", "/dev/null"};

    explicit IsolatedExecutor(Interpreter interpreter = {}, std::filesystem::path scratch_parent = {});

    ExecutionOutcome run(const std::filesystem::path& program, const SandboxLimits& limits) const final;

protected:
    /// Execute `scratch.program_path()`, whose working directory is to be `scratch.app_dir()`
    virtual ExecutionOutcome run_isolated(const ScratchArea& scratch, const SandboxLimits& limits) const = 0;

private:
    std::filesystem::path scratch_parent_;
};

/// Runs the program as an ordinary child process with rlimits and a watchdog, without isolation.
/// Only for trusted programs, such as reference solutions.
class DirectExecutor : public Executor
{
public:
    using Executor::Executor;

    ExecutionOutcome run(const std::filesystem::path& program, const SandboxLimits& limits) const override;

    std::string name() const override { return "direct"; }
};

/// Names accepted by `make_executor`
enum class ExecutorKind { Auto, Nsjail, Namespace, Direct };

/// Builds the requested executor. `Auto` prefers nsjail if it is installed, then user namespaces.
/// Returns nullptr if no isolating backend is available for `Auto`, or if the requested one is unavailable.
std::unique_ptr<Executor> make_executor(ExecutorKind kind, const Interpreter& interpreter = {},
                                        const std::filesystem::path& scratch_parent = {});

} // namespace fngrader

FMT_SERIALIZE_ENUM(::fngrader::ExecutorKind, Auto, Nsjail, Namespace, Direct);
