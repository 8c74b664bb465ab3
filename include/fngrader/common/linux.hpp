#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/transform.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <linux/capability.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fngrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// args and envp do NOT need to have an extra NULL element; this is added for you.
/// see execve(2)
/// only ever returns on failure
inline Expected<> execve(const std::string& exec, const std::vector<std::string>& args,
                         const std::vector<std::string>& envp) {
    // Reason: execve requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);
    std::vector<char*> cstr_envp_list(envp.size() + 1, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(exec.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);
    ranges::transform(envp, cstr_envp_list.begin(), to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execve(exec.c_str(), cstr_arg_list.data(), cstr_envp_list.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns success/failure; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// see dup2(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        LOG_DEBUG("dup2 failed: '{}'", err.message());

        return err;
    }

    return {};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return Expected<int>{std::in_place, res};
}

/// see waitid(2)
/// with WNOHANG, a still-running child yields an info with si_pid == 0
/// returns success/failure; logs failure at debug level
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WEXITED) {
    siginfo_t info{};
    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    return info;
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    std::array<int, 2> fds{-1, -1};

    int res = ::pipe2(fds.data(), flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return Pipe{.read_fd = fds[0], .write_fd = fds[1]};
}

/// see poll(2)
/// returns the number of ready descriptors; logs failure at debug level
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return Expected<int>{std::in_place, res};
}

/// see setrlimit(2). Sets both the soft and hard limit unless `hard` is given
inline Expected<> setrlimit(int resource, rlim_t soft, std::optional<rlim_t> hard = std::nullopt) {
    const rlimit lim{.rlim_cur = soft, .rlim_max = hard.value_or(soft)};

    // glibc declares the resource parameter as an enum in C++
    if (::setrlimit(static_cast<__rlimit_resource_t>(resource), &lim) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setrlimit({}) failed: '{}'", resource, err.message());

        return err;
    }

    return {};
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    if (::setpgid(pid, pgid) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid failed: '{}'", err.message());

        return err;
    }

    return {};
}

/// see unshare(2)
inline Expected<> unshare(int flags) {
    if (::unshare(flags) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("unshare({:#x}) failed: '{}'", flags, err.message());

        return err;
    }

    return {};
}

/// see mount(2)
// NOLINTNEXTLINE(google-runtime-int)
inline Expected<> mount(const char* source, const std::string& target, unsigned long flags) {
    if (::mount(source, target.c_str(), nullptr, flags, nullptr) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mount({}, {:?}) failed: '{}'", source != nullptr ? source : "<none>", target, err.message());

        return err;
    }

    return {};
}

/// see pivot_root(2); glibc provides no wrapper
inline Expected<> pivot_root(const std::string& new_root, const std::string& put_old) {
    if (::syscall(SYS_pivot_root, new_root.c_str(), put_old.c_str()) == -1) { // NOLINT(*vararg)
        auto err = make_error_code(errno);

        LOG_DEBUG("pivot_root({:?}, {:?}) failed: '{}'", new_root, put_old, err.message());

        return err;
    }

    return {};
}

/// see umount2(2)
inline Expected<> umount2(const std::string& target, int flags) {
    if (::umount2(target.c_str(), flags) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("umount2({:?}) failed: '{}'", target, err.message());

        return err;
    }

    return {};
}

/// see setsid(2)
inline Expected<pid_t> setsid() {
    pid_t sid = ::setsid();

    if (sid == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setsid failed: '{}'", err.message());

        return err;
    }

    return sid;
}

/// Permitted, effective and inheritable sets of every capability word
using CapabilitySets = std::array<__user_cap_data_struct, _LINUX_CAPABILITY_U32S_3>;

/// see capset(2); applies to the calling thread
inline Expected<> capset(const CapabilitySets& sets) {
    __user_cap_header_struct header{.version = _LINUX_CAPABILITY_VERSION_3, .pid = 0};

    // NOLINTNEXTLINE(*vararg)
    if (::syscall(SYS_capset, &header, sets.data()) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("capset failed: '{}'", err.message());

        return err;
    }

    return {};
}

/// see chdir(2)
inline Expected<> chdir(const std::string& path) {
    if (::chdir(path.c_str()) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("chdir({:?}) failed: '{}'", path, err.message());

        return err;
    }

    return {};
}

/// see prctl(2); only the single-argument options are needed here
inline Expected<> prctl(int option, unsigned long arg2) { // NOLINT(google-runtime-int)
    // NOLINTNEXTLINE(*vararg)
    if (::prctl(option, arg2, 0, 0, 0) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("prctl({}) failed: '{}'", option, err.message());

        return err;
    }

    return {};
}

/// see sched_getaffinity(2)
inline Expected<cpu_set_t> sched_getaffinity(pid_t pid = 0) {
    cpu_set_t set;
    CPU_ZERO(&set);

    if (::sched_getaffinity(pid, sizeof(set), &set) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("sched_getaffinity failed: '{}'", err.message());

        return err;
    }

    return set;
}

/// see sched_setaffinity(2)
inline Expected<> sched_setaffinity(const cpu_set_t& set, pid_t pid = 0) {
    if (::sched_setaffinity(pid, sizeof(set), &set) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("sched_setaffinity failed: '{}'", err.message());

        return err;
    }

    return {};
}

/// see statvfs(3)
inline Expected<struct statvfs> statvfs(const std::string& path) {
    struct statvfs info{};

    if (::statvfs(path.c_str(), &info) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("statvfs({:?}) failed: '{}'", path, err.message());

        return err;
    }

    return info;
}

/// see mkdtemp(3). `templ` must end in "XXXXXX"
inline Expected<std::string> mkdtemp(std::string templ) {
    if (::mkdtemp(templ.data()) == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp({:?}) failed: '{}'", templ, err.message());

        return err;
    }

    return templ;
}

/// see mkstemps(3). `templ` must contain "XXXXXX" immediately before a suffix of `suffix_len` chars
/// Returns the open descriptor and the generated name
inline Expected<std::pair<int, std::string>> mkstemps(std::string templ, int suffix_len) {
    int fd = ::mkstemps(templ.data(), suffix_len);

    if (fd == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkstemps({:?}) failed: '{}'", templ, err.message());

        return err;
    }

    return std::pair{fd, std::move(templ)};
}

/// see getuid(2) and getgid(2)
/// these functions "cannot fail" according to the manpage. These wrappers are provided
/// just for consistency.
inline uid_t getuid() {
    return ::getuid();
}

inline gid_t getgid() {
    return ::getgid();
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const {
        const char* descr = ::sigdescr_np(signal_num_);
        return descr != nullptr ? descr : fmt::format("signal {}", signal_num_);
    }

    friend std::string format_as(const Signal& from) { return from.to_string(); }

private:
    int signal_num_;
};

} // namespace fngrader::linux
