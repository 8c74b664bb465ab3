#pragma once

#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include <filesystem>
#include <string>

namespace fngrader {

/// Native isolation built from unprivileged Linux user namespaces; no external tool required.
///
/// The child enters new user, mount, pid, IPC and UTS namespaces (and a network namespace with no interfaces
/// unless networking is allowed). Pid 1 of the new pid namespace builds a private root inside the scratch area
/// out of read-only bind mounts of the system directories plus a writable /app, pivots into it and detaches
/// the host's mounts. The program runs as its child in a session of its own, pinned to `max_cpus` CPUs, under
/// rlimits, with no capabilities and no way to gain any. Whatever the program leaves behind dies with pid 1.
class NamespaceExecutor : public IsolatedExecutor
{
public:
    using IsolatedExecutor::IsolatedExecutor;

    /// Whether this kernel lets an unprivileged process create every namespace the jail needs.
    /// Checked once per process.
    static bool is_available();

    std::string name() const override { return "namespace"; }

protected:
    ExecutionOutcome run_isolated(const ScratchArea& scratch, const SandboxLimits& limits) const override;
};

} // namespace fngrader
