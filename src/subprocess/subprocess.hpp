#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/linux.hpp>
#include <fngrader/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>

namespace fngrader {

/// setrlimit(2) values applied in the child just before exec
struct ChildResourceLimits
{
    std::optional<rlim_t> cpu_seconds;
    std::optional<rlim_t> address_space_bytes;
    std::optional<rlim_t> file_size_bytes;
    bool disable_core_dumps = true;
};

/// A child process with captured stdout and stderr, and stdin connected to /dev/null.
///
/// The child leads its own process group, so killing it also kills anything it spawned.
/// Launch failures in the child (setup or exec) are reported back through a close-on-exec pipe,
/// so `start` fails instead of yielding a process that exits with a mysterious code.
class Subprocess : NonCopyable
{
public:
    static constexpr std::size_t DEFAULT_CAPTURE_LIMIT = 16 * 1024 * 1024;

    /// ``args`` excludes argv[0], which is always ``exec``
    Subprocess(std::string exec, std::vector<std::string> args, std::vector<std::string> env = {});
    virtual ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    void set_resource_limits(const ChildResourceLimits& limits) { limits_ = limits; }

    /// Output beyond this many bytes per stream is read and discarded
    void set_capture_limit(std::size_t bytes) { capture_limit_ = bytes; }

    /// Forks and execs. On LaunchFailure, `get_launch_diagnostic` describes what went wrong.
    Result<void> start();

    /// Blocks until the child exits or ``timeout`` elapses, capturing output all the while.
    /// On timeout the whole process group is killed and reaped.
    Result<RunResult> wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGKILL to the process group, then reap
    Result<void> kill();

    bool is_alive() const { return child_pid_ != 0 && !exited_; }

    pid_t get_pid() const { return child_pid_; }

    const std::string& get_stdout() const { return stdout_buffer_; }
    const std::string& get_stderr() const { return stderr_buffer_; }

    /// Whether either stream exceeded the capture limit
    bool was_output_truncated() const { return output_truncated_; }

    const std::string& get_launch_diagnostic() const { return launch_diagnostic_; }

protected:
    /// Runs in the child between fork and exec, after stdio is redirected.
    /// Only async-signal-safe work is permitted: prepare everything in the parent beforehand.
    virtual Expected<> init_child();

    const std::string& get_exec() const { return exec_; }

    /// For an `init_child` that forks again and waits on its own child instead of exec'ing.
    /// Closes this process's copy of the launch report pipe, so `start` returns once the descendant execs.
    void release_launch_report_pipe();

private:
    /// Which step of the child's launch failed, as reported through the error pipe
    enum class LaunchStage : int { Setup, Exec };

    struct LaunchReport
    {
        LaunchStage stage;
        int err;
    };

    Expected<> init_child_stdio();
    Expected<> apply_resource_limits() const;
    [[noreturn]] void report_launch_failure(LaunchStage stage, const std::error_code& err) const;

    Result<void> read_launch_report();

    /// Reads whatever is available without blocking. Closes a stream's fd at EOF.
    void drain_output();
    void drain_stream(int& read_fd, std::string& buffer);

    void close_fds();

    std::string exec_;
    std::vector<std::string> args_;
    std::vector<std::string> env_;

    ChildResourceLimits limits_;
    std::size_t capture_limit_ = DEFAULT_CAPTURE_LIMIT;

    pid_t child_pid_{};
    bool exited_ = false;

    linux::Pipe stdout_pipe_{};
    linux::Pipe stderr_pipe_{};
    linux::Pipe error_pipe_{};
    int devnull_fd_ = -1;

    std::string stdout_buffer_;
    std::string stderr_buffer_;
    bool output_truncated_ = false;

    std::chrono::steady_clock::time_point start_time_;

    std::string launch_diagnostic_;
};

} // namespace fngrader
