#pragma once

#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fngrader {

/// Runs programs under the nsjail(1) process isolation tool.
///
/// The program sees a read-only view of the system directories the interpreter needs, its own copy of
/// itself at /app/harness.py (writable, and the working directory), no network unless allowed,
/// and is confined by nsjail's time, address-space, CPU-time, file-size and CPU-count limits.
class NsjailExecutor : public IsolatedExecutor
{
public:
    NsjailExecutor(std::filesystem::path nsjail, Interpreter interpreter = {},
                   std::filesystem::path scratch_parent = {});

    /// The first nsjail executable on PATH, if any
    static std::optional<std::filesystem::path> find_nsjail();

    std::string name() const override { return "nsjail"; }

    /// Complete nsjail argument list (excluding argv[0]) for running the program in `scratch`
    std::vector<std::string> build_arguments(const ScratchArea& scratch, const SandboxLimits& limits) const;

protected:
    ExecutionOutcome run_isolated(const ScratchArea& scratch, const SandboxLimits& limits) const override;

private:
    std::filesystem::path nsjail_;
};

} // namespace fngrader
