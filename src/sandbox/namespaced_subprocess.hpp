#pragma once

#include <fngrader/common/expected.hpp>

#include "subprocess/subprocess.hpp"

#include <string>
#include <vector>

#include <sched.h>
#include <sys/types.h>

namespace fngrader {

/// Everything the child needs to confine itself, computed in the parent.
/// The child only issues syscalls on this data.
struct JailPlan
{
    struct BindMount
    {
        std::string source;
        std::string target;

        /// Flags for the read-only remount, including those inherited from the source that an unprivileged
        /// remount may not clear; unused for writable mounts
        unsigned long remount_flags; // NOLINT(google-runtime-int)

        bool writable;
    };

    /// CLONE_* flags for unshare(2); always includes CLONE_NEWUSER and CLONE_NEWPID
    int namespaces;

    /// Contents written to /proc/self/{uid,gid}_map
    std::string uid_map;
    std::string gid_map;

    /// Directory that becomes the program's root; it is made read-only after the mounts below are in place
    std::string root;
    unsigned long root_remount_flags; // NOLINT(google-runtime-int)

    std::vector<BindMount> mounts;

    /// Working directory, relative to the new root
    std::string cwd;

    cpu_set_t cpus;
};

/// A Subprocess that runs its program inside fresh namespaces, in a private root built from bind mounts.
///
/// Three processes are involved:
///   - the forked child stays in the grader's pid namespace and exits the way the program did;
///   - its child is pid 1 of a new pid namespace. It pivots into the root and waits for the program.
///     When it dies, the kernel kills everything left in the namespace.
///   - the program leads its own session, has no capabilities and cannot gain any.
///
/// Killing the forked child (as `kill` does) takes down pid 1 through its parent-death signal.
class NamespacedSubprocess : public Subprocess
{
public:
    NamespacedSubprocess(std::string exec, std::vector<std::string> args, std::vector<std::string> env,
                         JailPlan plan);

protected:
    Expected<> init_child() override;

private:
    /// How the program ended, as passed from pid 1 to the forked child
    struct ProgramStatus
    {
        int si_code;
        int si_status;
    };

    Expected<> write_id_maps() const;
    Expected<> build_root() const;
    Expected<> enter_root() const;
    static Expected<> drop_privileges();

    /// Runs in the forked child once pid 1 exists; exits with the program's status
    [[noreturn]] void relay_exit(pid_t init_pid, int status_fd);

    /// Runs in pid 1 once the program is forked; reports its status and exits, ending the namespace
    [[noreturn]] void supervise(pid_t program_pid, int status_fd);

    JailPlan plan_;
};

} // namespace fngrader
