#include "subprocess/subprocess.hpp"

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/linux.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fngrader {

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{10};
constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Exit code of a child whose launch failed; never observed by callers, as `start` reports the failure
constexpr int LAUNCH_FAILURE_EXIT_CODE = 127;

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start_time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
}

void close_fd(int& fd) {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, std::vector<std::string> env)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , env_{std::move(env)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started, or the object was moved from
    if (is_alive()) {
        std::ignore = kill();
    }

    close_fds();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , env_{std::move(other.env_)}
    , limits_{other.limits_}
    , capture_limit_{other.capture_limit_}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , exited_{other.exited_}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {})}
    , error_pipe_{std::exchange(other.error_pipe_, {})}
    , devnull_fd_{std::exchange(other.devnull_fd_, -1)}
    , stdout_buffer_{std::move(other.stdout_buffer_)}
    , stderr_buffer_{std::move(other.stderr_buffer_)}
    , output_truncated_{other.output_truncated_}
    , start_time_{other.start_time_}
    , launch_diagnostic_{std::move(other.launch_diagnostic_)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (is_alive()) {
        std::ignore = kill();
    }
    close_fds();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    env_ = std::move(rhs.env_);
    limits_ = rhs.limits_;
    capture_limit_ = rhs.capture_limit_;
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    exited_ = rhs.exited_;
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {});
    error_pipe_ = std::exchange(rhs.error_pipe_, {});
    devnull_fd_ = std::exchange(rhs.devnull_fd_, -1);
    stdout_buffer_ = std::move(rhs.stdout_buffer_);
    stderr_buffer_ = std::move(rhs.stderr_buffer_);
    output_truncated_ = rhs.output_truncated_;
    start_time_ = rhs.start_time_;
    launch_diagnostic_ = std::move(rhs.launch_diagnostic_);

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "a Subprocess can only be started once");

    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    error_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    devnull_fd_ = TRYE(linux::open("/dev/null", O_RDONLY | O_CLOEXEC), SyscallFailure);

    start_time_ = std::chrono::steady_clock::now();

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        if (auto res = init_child_stdio(); !res) {
            report_launch_failure(LaunchStage::Setup, res.error());
        }

        if (auto res = init_child(); !res) {
            report_launch_failure(LaunchStage::Setup, res.error());
        }

        auto execve_res = linux::execve(exec_, args_, env_);
        report_launch_failure(LaunchStage::Exec, execve_res.error());
    }

    // Parent process
    child_pid_ = fork_res.pid;

    LOG_DEBUG("Started {:?} as pid {}", exec_, child_pid_);

    // Close the ends used by the child
    close_fd(stdout_pipe_.write_fd);
    close_fd(stderr_pipe_.write_fd);
    close_fd(error_pipe_.write_fd);
    close_fd(devnull_fd_);

    for (int read_fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(read_fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(read_fd, F_SETFL, pre_flags | O_NONBLOCK), SyscallFailure); // NOLINT
    }

    return read_launch_report();
}

Expected<> Subprocess::init_child_stdio() {
    // Lead a new process group so the whole tree can be killed at once
    TRY(linux::setpgid(0, 0));

    // Never outlive the grader
    TRY(linux::prctl(PR_SET_PDEATHSIG, SIGKILL));

    TRY(linux::dup2(devnull_fd_, STDIN_FILENO));
    TRY(linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO));
    TRY(linux::dup2(stderr_pipe_.write_fd, STDERR_FILENO));

    return {};
}

Expected<> Subprocess::init_child() {
    return apply_resource_limits();
}

Expected<> Subprocess::apply_resource_limits() const {
    if (limits_.cpu_seconds) {
        // The soft limit delivers SIGXCPU; the hard limit one second later guarantees SIGKILL
        TRY(linux::setrlimit(RLIMIT_CPU, *limits_.cpu_seconds, *limits_.cpu_seconds + 1));
    }
    if (limits_.address_space_bytes) {
        TRY(linux::setrlimit(RLIMIT_AS, *limits_.address_space_bytes));
    }
    if (limits_.file_size_bytes) {
        TRY(linux::setrlimit(RLIMIT_FSIZE, *limits_.file_size_bytes));
    }
    if (limits_.disable_core_dumps) {
        TRY(linux::setrlimit(RLIMIT_CORE, 0));
    }

    return {};
}

void Subprocess::release_launch_report_pipe() {
    close_fd(error_pipe_.write_fd);
}

void Subprocess::report_launch_failure(LaunchStage stage, const std::error_code& err) const {
    const LaunchReport report{.stage = stage, .err = err.value()};

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    std::ignore = linux::write(error_pipe_.write_fd, {reinterpret_cast<const char*>(&report), sizeof(report)});

    ::_exit(LAUNCH_FAILURE_EXIT_CODE);
}

Result<void> Subprocess::read_launch_report() {
    std::string received;

    // Blocks until the child execs (closing the pipe) or reports a failure
    while (received.size() < sizeof(LaunchReport)) {
        auto res = linux::read(error_pipe_.read_fd, sizeof(LaunchReport) - received.size());

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        if (res.value().empty()) {
            break;
        }

        received += res.value();
    }

    close_fd(error_pipe_.read_fd);

    if (received.empty()) {
        return {};
    }

    LaunchReport report{};
    if (received.size() == sizeof(report)) {
        std::memcpy(&report, received.data(), sizeof(report));
    }

    const std::string err_msg = get_err_msg(report.err);
    launch_diagnostic_ = report.stage == LaunchStage::Exec ? fmt::format("exec of {:?} failed: {}", exec_, err_msg)
                                                           : fmt::format("child setup failed: {}", err_msg);

    LOG_WARN("Failed to launch {:?}: {}", exec_, launch_diagnostic_);

    // Reap the child, which has already exited
    std::ignore = linux::waitid(P_PID, static_cast<id_t>(child_pid_));
    exited_ = true;

    return ErrorKind::LaunchFailure;
}

Result<RunResult> Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    ASSERT(child_pid_ != 0, "wait_for_exit called before start");

    const auto deadline = start_time_ + timeout;

    while (!exited_) {
        auto info = TRYE(linux::waitid(P_PID, static_cast<id_t>(child_pid_), WEXITED | WNOHANG), SyscallFailure);

        // si_pid stays 0 while the child is still running
        if (info.si_pid != 0) {
            exited_ = true;

            // Stragglers in the process group would otherwise hold the pipes open
            std::ignore = linux::kill(-child_pid_, SIGKILL);
            drain_output();

            const auto elapsed = elapsed_since(start_time_);

            if (info.si_code == CLD_EXITED) {
                LOG_DEBUG("pid {} exited with code {} after {}ms", child_pid_, info.si_status, elapsed.count());
                return RunResult::make_exited(info.si_status, elapsed);
            }

            LOG_DEBUG("pid {} was killed by {} after {}ms", child_pid_, linux::Signal{info.si_status},
                      elapsed.count());
            return RunResult::make_signaled(info.si_status, elapsed);
        }

        const auto now = std::chrono::steady_clock::now();

        if (now >= deadline) {
            LOG_DEBUG("pid {} exceeded its {}ms timeout; killing its process group", child_pid_, timeout.count());

            TRY(kill());
            drain_output();

            return RunResult::make_timed_out(elapsed_since(start_time_));
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        std::vector<pollfd> fds;
        for (int read_fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
            if (read_fd != -1) {
                fds.push_back(pollfd{.fd = read_fd, .events = POLLIN, .revents = 0});
            }
        }

        const auto poll_timeout = std::max(std::min(remaining, POLL_INTERVAL), std::chrono::milliseconds{1});

        if (auto res = linux::poll(fds, static_cast<int>(poll_timeout.count())); !res) {
            if (res.error() != std::errc::interrupted) {
                return ErrorKind::SyscallFailure;
            }
        }

        drain_output();
    }

    UNREACHABLE("wait_for_exit called on a process that was already reaped");
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    // The group may already be empty apart from the zombie leader
    if (auto res = linux::kill(-child_pid_, SIGKILL); !res && res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    TRYE(linux::waitid(P_PID, static_cast<id_t>(child_pid_)), SyscallFailure);
    exited_ = true;

    return {};
}

void Subprocess::drain_output() {
    drain_stream(stdout_pipe_.read_fd, stdout_buffer_);
    drain_stream(stderr_pipe_.read_fd, stderr_buffer_);
}

void Subprocess::drain_stream(int& read_fd, std::string& buffer) {
    while (read_fd != -1) {
        auto res = linux::read(read_fd, READ_CHUNK_SIZE);

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            if (res.error() != std::errc::resource_unavailable_try_again) {
                LOG_WARN("Error reading output of pid {}: '{}'", child_pid_, res.error().message());
                close_fd(read_fd);
            }
            return;
        }

        // EOF
        if (res.value().empty()) {
            close_fd(read_fd);
            return;
        }

        const std::size_t room = capture_limit_ - std::min(capture_limit_, buffer.size());
        if (res.value().size() > room) {
            output_truncated_ = true;
        }
        buffer.append(res.value(), 0, std::min(room, res.value().size()));
    }
}

void Subprocess::close_fds() {
    close_fd(stdout_pipe_.read_fd);
    close_fd(stdout_pipe_.write_fd);
    close_fd(stderr_pipe_.read_fd);
    close_fd(stderr_pipe_.write_fd);
    close_fd(error_pipe_.read_fd);
    close_fd(error_pipe_.write_fd);
    close_fd(devnull_fd_);
}

} // namespace fngrader
