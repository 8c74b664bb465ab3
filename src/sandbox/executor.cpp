#include <fngrader/sandbox/executor.hpp>

#include <fngrader/logging.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/namespace_executor.hpp>
#include <fngrader/sandbox/nsjail_executor.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include "sandbox/outcome.hpp"
#include "subprocess/subprocess.hpp"

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fngrader {

namespace fs = std::filesystem;

namespace {

fs::path default_scratch_parent() {
    std::error_code err;
    auto tmp = fs::temp_directory_path(err);

    if (err) {
        LOG_WARN("No usable temporary directory ({}); falling back to /tmp", err.message());
        return "/tmp";
    }

    return tmp;
}

} // namespace

IsolatedExecutor::IsolatedExecutor(Interpreter interpreter, fs::path scratch_parent)
    : Executor{std::move(interpreter)}
    , scratch_parent_{scratch_parent.empty() ? default_scratch_parent() : std::move(scratch_parent)} {}

ExecutionOutcome IsolatedExecutor::run(const fs::path& program, const SandboxLimits& limits) const {
    if (auto valid = limits.validate(); !valid) {
        return ExecutionOutcome::launch_failure(fmt::format("invalid limits: {}", valid.error()));
    }

    auto scratch = ScratchArea::create(scratch_parent_);

    if (!scratch) {
        return ExecutionOutcome::launch_failure(scratch.error());
    }

    if (auto res = scratch->copy_in(program); !res) {
        return ExecutionOutcome::launch_failure(res.error());
    }

    LOG_DEBUG("Running {:?} with the {} executor under {}", program.string(), name(), limits);

    ExecutionOutcome outcome = run_isolated(scratch.value(), limits);

    LOG_DEBUG("{:?} finished: {} (code {})", program.string(), outcome.status, outcome.code);

    if (auto res = scratch->remove(); !res) {
        outcome.status = ExecutionOutcome::Status::LaunchFailure;
        outcome.diagnostic = res.error();
    }

    return outcome;
}

ExecutionOutcome DirectExecutor::run(const fs::path& program, const SandboxLimits& limits) const {
    if (auto valid = limits.validate(); !valid) {
        return ExecutionOutcome::launch_failure(fmt::format("invalid limits: {}", valid.error()));
    }

    LOG_DEBUG("Running {:?} directly under {}", program.string(), limits);

    Subprocess proc{get_interpreter().path, interpreter_arguments(get_interpreter(), program.string()),
                    program_environment()};
    proc.set_resource_limits(to_child_limits(limits));

    return run_to_completion(proc, limits, limits.timeout);
}

std::unique_ptr<Executor> make_executor(ExecutorKind kind, const Interpreter& interpreter,
                                        const fs::path& scratch_parent) {
    switch (kind) {
    case ExecutorKind::Auto:
        if (NsjailExecutor::find_nsjail()) {
            return make_executor(ExecutorKind::Nsjail, interpreter, scratch_parent);
        }
        if (NamespaceExecutor::is_available()) {
            return make_executor(ExecutorKind::Namespace, interpreter, scratch_parent);
        }
        LOG_WARN("Neither nsjail nor unprivileged user namespaces are available; no isolating executor");
        return nullptr;

    case ExecutorKind::Nsjail:
        if (auto nsjail = NsjailExecutor::find_nsjail()) {
            return std::make_unique<NsjailExecutor>(std::move(nsjail).value(), interpreter, scratch_parent);
        }
        LOG_WARN("nsjail was not found on PATH");
        return nullptr;

    case ExecutorKind::Namespace:
        if (!NamespaceExecutor::is_available()) {
            LOG_WARN("Unprivileged user namespaces are unavailable");
            return nullptr;
        }
        return std::make_unique<NamespaceExecutor>(interpreter, scratch_parent);

    case ExecutorKind::Direct:
        return std::make_unique<DirectExecutor>(interpreter);

    default:
        UNREACHABLE(kind);
    }
}

} // namespace fngrader
