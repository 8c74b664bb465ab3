#include "sandbox/namespaced_subprocess.hpp"

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/linux.hpp>

#include "subprocess/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <linux/securebits.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fngrader {

namespace {

/// Exit code of the forked child or pid 1 when they cannot tell how the program ended
constexpr int RELAY_FAILURE_EXIT_CODE = 125;

/// Exit code used if re-raising the program's fatal signal somehow returns
constexpr int SIGNAL_EXIT_CODE_BASE = 128;

/// Uid 0 inside the namespace gets no capabilities from exec, and nothing can undo that
constexpr unsigned long LOCKED_SECUREBITS = // NOLINT(google-runtime-int)
    SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_SETUID_FIXUP | SECBIT_NO_SETUID_FIXUP_LOCKED |
    SECBIT_KEEP_CAPS_LOCKED | SECBIT_NO_CAP_AMBIENT_RAISE | SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED;

/// Takes a C string so that nothing is allocated in the child
Expected<> write_proc_file(const char* path, std::string_view contents) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC); // NOLINT(*vararg)

    if (fd == -1) {
        return linux::make_error_code(errno);
    }

    auto res = linux::write(fd, contents);
    std::ignore = linux::close(fd);

    if (!res) {
        return res.error();
    }

    return {};
}

Expected<siginfo_t> wait_for(pid_t pid) {
    while (true) {
        auto info = linux::waitid(P_PID, static_cast<id_t>(pid));

        if (info || info.error() != std::errc::interrupted) {
            return info;
        }
    }
}

/// Only the program may hold the output pipes, so that they close when it is gone
void close_stdio() {
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        std::ignore = linux::close(fd);
    }
}

/// Pid 1 ignores signals sent from inside its namespace only while their disposition is the default.
/// The program inherits both the dispositions and the mask.
void reset_signal_handling() {
    for (int sig = 1; sig < NSIG; ++sig) {
        std::ignore = ::signal(sig, SIG_DFL);
    }

    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
}

/// Exits, or dies of a signal, the way waitid(2) reported another process did
[[noreturn]] void exit_like(int si_code, int si_status) {
    if (si_code == CLD_EXITED) {
        ::_exit(si_status);
    }

    std::ignore = linux::setrlimit(RLIMIT_CORE, 0);

    sigset_t unblocked;
    ::sigemptyset(&unblocked);
    ::sigaddset(&unblocked, si_status);
    ::sigprocmask(SIG_UNBLOCK, &unblocked, nullptr);
    std::ignore = ::signal(si_status, SIG_DFL);

    std::ignore = linux::kill(::getpid(), si_status);

    ::_exit(SIGNAL_EXIT_CODE_BASE + si_status);
}

} // namespace

NamespacedSubprocess::NamespacedSubprocess(std::string exec, std::vector<std::string> args,
                                           std::vector<std::string> env, JailPlan plan)
    : Subprocess{std::move(exec), std::move(args), std::move(env)}
    , plan_{std::move(plan)} {}

Expected<> NamespacedSubprocess::init_child() {
    TRY(linux::unshare(plan_.namespaces));
    TRY(write_id_maps());

    linux::Pipe status_pipe = TRY(linux::pipe2(O_CLOEXEC));

    // The first process forked after unsharing the pid namespace is its pid 1
    linux::Fork init_fork = TRY(linux::fork());

    if (init_fork.which == linux::Fork::Parent) {
        std::ignore = linux::close(status_pipe.write_fd);
        relay_exit(init_fork.pid, status_pipe.read_fd);
    }

    std::ignore = linux::close(status_pipe.read_fd);

    reset_signal_handling();
    TRY(linux::prctl(PR_SET_PDEATHSIG, SIGKILL));
    TRY(build_root());
    TRY(enter_root());

    linux::Fork program_fork = TRY(linux::fork());

    if (program_fork.which == linux::Fork::Parent) {
        supervise(program_fork.pid, status_pipe.write_fd);
    }

    std::ignore = linux::close(status_pipe.write_fd);

    // Leave the process group shared with pid 1 and the forked child
    TRY(linux::setsid());
    TRY(linux::sched_setaffinity(plan_.cpus));
    TRY(Subprocess::init_child());
    TRY(drop_privileges());

    return {};
}

Expected<> NamespacedSubprocess::write_id_maps() const {
    // setgroups must be denied before an unprivileged process may write its gid_map
    TRY(write_proc_file("/proc/self/setgroups", "deny"));
    TRY(write_proc_file("/proc/self/uid_map", plan_.uid_map));
    TRY(write_proc_file("/proc/self/gid_map", plan_.gid_map));

    return {};
}

Expected<> NamespacedSubprocess::build_root() const {
    // Keep every mount below from propagating back to the host
    TRY(linux::mount(nullptr, "/", MS_REC | MS_PRIVATE));

    TRY(linux::mount(plan_.root.c_str(), plan_.root, MS_BIND | MS_REC));

    for (const auto& mount : plan_.mounts) {
        TRY(linux::mount(mount.source.c_str(), mount.target, MS_BIND | MS_REC));

        if (!mount.writable) {
            TRY(linux::mount(nullptr, mount.target, mount.remount_flags));
        }
    }

    TRY(linux::mount(nullptr, plan_.root, plan_.root_remount_flags));

    return {};
}

Expected<> NamespacedSubprocess::enter_root() const {
    TRY(linux::chdir(plan_.root));

    // Stacks the old root on top of the new one; detaching it leaves no path back to the host's mounts
    TRY(linux::pivot_root(".", "."));
    TRY(linux::umount2(".", MNT_DETACH));

    TRY(linux::chdir(plan_.cwd));

    return {};
}

Expected<> NamespacedSubprocess::drop_privileges() {
    TRY(linux::prctl(PR_SET_SECUREBITS, LOCKED_SECUREBITS));
    TRY(linux::prctl(PR_SET_NO_NEW_PRIVS, 1));
    TRY(linux::capset(linux::CapabilitySets{}));

    return {};
}

void NamespacedSubprocess::relay_exit(pid_t init_pid, int status_fd) {
    release_launch_report_pipe();
    close_stdio();

    auto init_info = wait_for(init_pid);

    // Every writer is gone once pid 1 is, so this cannot block
    ProgramStatus status{};
    if (::read(status_fd, &status, sizeof(status)) == static_cast<ssize_t>(sizeof(status))) {
        exit_like(status.si_code, status.si_status);
    }

    // pid 1 died before the program did: it failed to launch, or was killed with the forked child
    if (init_info) {
        exit_like(init_info.value().si_code, init_info.value().si_status);
    }

    ::_exit(RELAY_FAILURE_EXIT_CODE);
}

void NamespacedSubprocess::supervise(pid_t program_pid, int status_fd) {
    release_launch_report_pipe();
    close_stdio();

    auto info = wait_for(program_pid);

    if (!info) {
        ::_exit(RELAY_FAILURE_EXIT_CODE);
    }

    const ProgramStatus status{.si_code = info.value().si_code, .si_status = info.value().si_status};

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    std::ignore = linux::write(status_fd, {reinterpret_cast<const char*>(&status), sizeof(status)});

    ::_exit(0);
}

} // namespace fngrader
