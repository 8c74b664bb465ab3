#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace fngrader {

/// Resource limits for one execution. Every field has a documented default.
struct SandboxLimits
{
    static constexpr std::chrono::milliseconds GRADING_TIMEOUT{2000};
    static constexpr std::chrono::milliseconds ANSWER_KEY_TIMEOUT{5000};

    /// Wall-clock budget
    std::chrono::milliseconds timeout = GRADING_TIMEOUT;

    /// Address-space ceiling
    std::size_t memory_mb = 512; // NOLINT(readability-magic-numbers)

    std::size_t max_cpus = 1;

    bool allow_network = false;

    /// Largest file the program may create
    std::size_t max_file_size_mb = 1;

    /// Whole seconds of CPU time; the wall-clock timeout rounded up
    std::size_t cpu_seconds() const {
        using namespace std::chrono;
        return static_cast<std::size_t>(ceil<seconds>(timeout).count());
    }

    Expected<void, std::string> validate() const {
        if (timeout <= std::chrono::milliseconds::zero()) {
            return fmt::format("timeout must be positive (got {}ms)", timeout.count());
        }
        if (memory_mb == 0) {
            return std::string{"memory limit must be positive"};
        }
        if (max_cpus == 0) {
            return std::string{"at least one CPU is required"};
        }
        if (max_file_size_mb == 0) {
            return std::string{"file size limit must be positive"};
        }
        return {};
    }
};

} // namespace fngrader

template <>
struct fmt::formatter<::fngrader::SandboxLimits> : ::fngrader::DebugFormatter
{
    auto format(const ::fngrader::SandboxLimits& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{timeout={}ms, memory={}MB, cpus={}, network={}, file_size={}MB}}",
                              from.timeout.count(), from.memory_mb, from.max_cpus,
                              from.allow_network ? "allowed" : "denied", from.max_file_size_mb);
    }
};
