#include <fngrader/sandbox/namespace_executor.hpp>

#include <fngrader/common/linux.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include "sandbox/namespaced_subprocess.hpp"
#include "sandbox/outcome.hpp"

#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fngrader {

namespace fs = std::filesystem;

namespace {

/// The program's working directory, relative to its root
constexpr std::string_view JAIL_APP_DIR = "/app";

/// Namespaces every jail gets; the network namespace is added unless network access is allowed
constexpr int JAIL_NAMESPACES = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;

// NOLINTBEGIN(google-runtime-int)

/// Mount flags that an unprivileged read-only remount must carry over from the original mount
unsigned long locked_mount_flags(const struct statvfs& info) {
    constexpr std::array<std::pair<unsigned long, unsigned long>, 6> FLAG_MAP{{
        {ST_NOSUID, MS_NOSUID},
        {ST_NODEV, MS_NODEV},
        {ST_NOEXEC, MS_NOEXEC},
        {ST_NOATIME, MS_NOATIME},
        {ST_NODIRATIME, MS_NODIRATIME},
        {ST_RELATIME, MS_RELATIME},
    }};

    unsigned long flags = 0;
    for (auto [st_flag, ms_flag] : FLAG_MAP) {
        if ((info.f_flag & st_flag) != 0) {
            flags |= ms_flag;
        }
    }

    return flags;
}

Expected<unsigned long, std::string> read_only_remount_flags(const fs::path& path) {
    auto info = linux::statvfs(path.string());

    if (!info) {
        return fmt::format("Failed to inspect the mount holding {:?}: {}", path.string(), info.error().message());
    }

    return MS_BIND | MS_REMOUNT | MS_RDONLY | locked_mount_flags(info.value());
}

// NOLINTEND(google-runtime-int)

/// Creates an empty file or directory at `target` for `source` to be mounted over
Expected<void, std::string> make_mount_point(const fs::path& source, const fs::path& target) {
    std::error_code err;

    if (fs::is_directory(source, err)) {
        fs::create_directories(target, err);
    } else {
        fs::create_directories(target.parent_path(), err);

        if (!err) {
            auto fd = linux::open(target.string(), O_WRONLY | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
            if (!fd) {
                err = fd.error();
            } else {
                std::ignore = linux::close(fd.value());
            }
        }
    }

    if (err) {
        return fmt::format("Failed to create mount point {:?}: {}", target.string(), err.message());
    }

    return {};
}

Expected<cpu_set_t, std::string> first_cpus(std::size_t count) {
    auto available = linux::sched_getaffinity();

    if (!available) {
        return fmt::format("Failed to read the CPU affinity mask: {}", available.error().message());
    }

    cpu_set_t chosen;
    CPU_ZERO(&chosen);

    std::size_t taken = 0;
    for (int cpu = 0; cpu < CPU_SETSIZE && taken < count; ++cpu) {
        if (CPU_ISSET(cpu, &available.value())) {
            CPU_SET(cpu, &chosen);
            ++taken;
        }
    }

    return chosen;
}

/// Lays out `<scratch>/root` and computes everything the child needs to jail itself there
Expected<JailPlan, std::string> prepare_jail(const ScratchArea& scratch, const SandboxLimits& limits) {
    const fs::path root = scratch.root() / "root";
    const fs::path app_target = root / JAIL_APP_DIR.substr(1);

    int namespaces = JAIL_NAMESPACES;
    if (!limits.allow_network) {
        // A fresh network namespace has nothing but a downed loopback interface
        namespaces |= CLONE_NEWNET;
    }

    JailPlan plan{
        .namespaces = namespaces,
        .uid_map = fmt::format("{0} {0} 1\n", linux::getuid()),
        .gid_map = fmt::format("{0} {0} 1\n", linux::getgid()),
        .root = root.string(),
        .root_remount_flags = 0,
        .mounts = {},
        .cwd = std::string{JAIL_APP_DIR},
        .cpus = {},
    };

    if (auto res = make_mount_point(scratch.app_dir(), app_target); !res) {
        return res.error();
    }

    for (std::string_view path : IsolatedExecutor::READ_ONLY_SYSTEM_PATHS) {
        const fs::path source{path};
        std::error_code err;

        if (!fs::exists(source, err)) {
            continue;
        }

        const fs::path target = root / source.relative_path();

        if (auto res = make_mount_point(source, target); !res) {
            return res.error();
        }

        auto flags = read_only_remount_flags(source);
        if (!flags) {
            return flags.error();
        }

        plan.mounts.push_back(JailPlan::BindMount{
            .source = source.string(), .target = target.string(), .remount_flags = flags.value(), .writable = false});
    }

    plan.mounts.push_back(JailPlan::BindMount{
        .source = scratch.app_dir().string(), .target = app_target.string(), .remount_flags = 0, .writable = true});

    auto root_flags = read_only_remount_flags(root);
    if (!root_flags) {
        return root_flags.error();
    }
    plan.root_remount_flags = root_flags.value();

    auto cpus = first_cpus(limits.max_cpus);
    if (!cpus) {
        return cpus.error();
    }
    plan.cpus = cpus.value();

    return plan;
}

bool user_namespaces_work() {
    auto fork_res = linux::fork();

    if (!fork_res) {
        return false;
    }

    if (fork_res.value().which == linux::Fork::Child) {
        ::_exit(linux::unshare(JAIL_NAMESPACES | CLONE_NEWNET) ? 0 : 1);
    }

    auto info = linux::waitid(P_PID, static_cast<id_t>(fork_res.value().pid));

    return info && info.value().si_code == CLD_EXITED && info.value().si_status == 0;
}

} // namespace

bool NamespaceExecutor::is_available() {
    static const bool available = [] {
        bool res = user_namespaces_work();
        LOG_DEBUG("Unprivileged user namespaces are {}", res ? "available" : "unavailable");
        return res;
    }();

    return available;
}

ExecutionOutcome NamespaceExecutor::run_isolated(const ScratchArea& scratch, const SandboxLimits& limits) const {
    auto plan = prepare_jail(scratch, limits);

    if (!plan) {
        return ExecutionOutcome::launch_failure(plan.error());
    }

    const Interpreter& interpreter = get_interpreter();

    NamespacedSubprocess proc{interpreter.path,
                              interpreter_arguments(interpreter,
                                                    fmt::format("{}/{}", JAIL_APP_DIR, ScratchArea::PROGRAM_NAME)),
                              program_environment(), std::move(plan).value()};
    proc.set_resource_limits(to_child_limits(limits));

    return run_to_completion(proc, limits, limits.timeout);
}

} // namespace fngrader
