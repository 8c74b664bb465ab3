#include <fngrader/sandbox/nsjail_executor.hpp>

#include <fngrader/logging.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include "sandbox/outcome.hpp"
#include "subprocess/subprocess.hpp"

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace fngrader {

namespace fs = std::filesystem;

namespace {

/// Where the program and its working directory appear inside the jail
constexpr std::string_view JAIL_APP_DIR = "/app";

constexpr std::string_view FALLBACK_SEARCH_PATH = "/usr/local/bin:/usr/bin:/bin:/usr/sbin";

} // namespace

NsjailExecutor::NsjailExecutor(fs::path nsjail, Interpreter interpreter, fs::path scratch_parent)
    : IsolatedExecutor{std::move(interpreter), std::move(scratch_parent)}
    , nsjail_{std::move(nsjail)} {}

std::optional<fs::path> NsjailExecutor::find_nsjail() {
    const char* env_path = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    const std::string_view search_path = env_path != nullptr ? env_path : FALLBACK_SEARCH_PATH;

    auto dirs = search_path | ranges::views::split(':') |
                ranges::views::transform([](auto&& dir) { return dir | ranges::to<std::string>(); });

    for (const std::string& dir : dirs | ranges::to<std::vector>()) {
        if (dir.empty()) {
            continue;
        }

        fs::path candidate = fs::path{dir} / "nsjail";
        std::error_code err;

        if (fs::is_regular_file(candidate, err) && ::access(candidate.c_str(), X_OK) == 0) {
            LOG_DEBUG("Found nsjail at {:?}", candidate.string());
            return candidate;
        }
    }

    return std::nullopt;
}

std::vector<std::string> NsjailExecutor::build_arguments(const ScratchArea& scratch,
                                                         const SandboxLimits& limits) const {
    const std::string app_dir{JAIL_APP_DIR};

    std::vector<std::string> args{"-Mo", "--quiet", "-t", std::to_string(limits.cpu_seconds())};

    for (std::string_view mount : READ_ONLY_SYSTEM_PATHS) {
        std::error_code err;
        if (fs::exists(mount, err)) {
            args.insert(args.end(), {"-R", std::string{mount}});
        }
    }

    args.insert(args.end(), {
                                "-B",
                                fmt::format("{}:{}", scratch.app_dir().string(), app_dir),
                                "--cwd",
                                app_dir,
                                "--disable_proc",
                                "--rlimit_as",
                                std::to_string(limits.memory_mb),
                                "--rlimit_cpu",
                                std::to_string(limits.cpu_seconds()),
                                "--rlimit_fsize",
                                std::to_string(limits.max_file_size_mb),
                                "--rlimit_core",
                                "0",
                                "--max_cpus",
                                std::to_string(limits.max_cpus),
                            });

    if (limits.allow_network) {
        args.emplace_back("--disable_clone_newnet");
    }

    for (const auto& var : program_environment()) {
        args.insert(args.end(), {"-E", var});
    }

    args.emplace_back("--");
    args.push_back(get_interpreter().path);
    for (const auto& arg :
         interpreter_arguments(get_interpreter(), fmt::format("{}/{}", app_dir, ScratchArea::PROGRAM_NAME))) {
        args.push_back(arg);
    }

    return args;
}

ExecutionOutcome NsjailExecutor::run_isolated(const ScratchArea& scratch, const SandboxLimits& limits) const {
    auto args = build_arguments(scratch, limits);

    LOG_TRACE("nsjail arguments: {}", fmt::join(args, " "));

    Subprocess proc{nsjail_.string(), std::move(args), program_environment()};

    return run_to_completion(proc, limits, limits.timeout + GRACE_PERIOD, SignalReporting::ExitCodeAbove128);
}

} // namespace fngrader
