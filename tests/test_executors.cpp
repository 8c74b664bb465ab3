#include "catch2_custom.hpp"

#include <fngrader/common/text_file.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/sandbox/namespace_executor.hpp>
#include <fngrader/sandbox/nsjail_executor.hpp>
#include <fngrader/sandbox/scratch_area.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <range/v3/algorithm/find.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace fngrader;
using namespace std::chrono_literals;

using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

const Interpreter PYTHON{};

bool have_python() {
    std::error_code err;
    return fs::is_regular_file(PYTHON.path, err);
}

ScratchArea make_workspace() {
    auto res = ScratchArea::create(fs::temp_directory_path());

    if (!res) {
        FAIL(res.error());
    }

    return std::move(res).value();
}

/// Writes `source` beside the workspace's app dir and returns its path
fs::path write_program(const ScratchArea& workspace, std::string_view source) {
    fs::path path = workspace.root() / "program.py";

    if (auto res = write_text_file(path, source); !res) {
        FAIL(res.error());
    }

    return path;
}

SandboxLimits short_limits() {
    SandboxLimits limits;
    limits.timeout = 3s;
    return limits;
}

std::size_t count_entries(const fs::path& dir) {
    return static_cast<std::size_t>(std::distance(fs::directory_iterator{dir}, fs::directory_iterator{}));
}

/// Whether `needle` appears in `args` immediately followed by `value`
bool has_option(const std::vector<std::string>& args, std::string_view needle, std::string_view value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == needle && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

/// Whether some process on the host has an argument containing `marker`
bool process_running(std::string_view marker) {
    std::error_code err;

    for (const auto& entry : fs::directory_iterator{"/proc", err}) {
        auto cmdline = read_text_file(entry.path() / "cmdline");

        if (cmdline && cmdline.value().find(marker) != std::string::npos) {
            return true;
        }
    }

    return false;
}

/// Processes killed along with a namespace are reaped asynchronously
bool process_exits_soon(std::string_view marker) {
    for (int attempt = 0; attempt < 200; ++attempt) {
        if (!process_running(marker)) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }

    return false;
}

} // namespace

TEST_CASE("Sandbox limits validate") {
    SandboxLimits limits;
    CHECK(limits.validate());
    CHECK(limits.cpu_seconds() == 2);

    limits.timeout = 2500ms;
    CHECK(limits.cpu_seconds() == 3);

    SECTION("Zero timeout") {
        limits.timeout = 0ms;
        CHECK_THAT(limits.validate().error(), ContainsSubstring("timeout must be positive"));
    }

    SECTION("Zero memory") {
        limits.memory_mb = 0;
        CHECK(limits.validate().has_error());
    }

    SECTION("Zero CPUs") {
        limits.max_cpus = 0;
        CHECK(limits.validate().has_error());
    }
}

TEST_CASE("Direct execution reports how the program ended") {
    if (!have_python()) {
        SKIP("no python3 interpreter");
    }

    ScratchArea workspace = make_workspace();
    DirectExecutor executor{PYTHON};

    SECTION("Clean exit") {
        auto outcome = executor.run(write_program(workspace, "print('hi')\n"), short_limits());

        CHECK(outcome.success());
        CHECK(outcome.stdout_text == "hi\n");
        CHECK(outcome.diagnostic.empty());
    }

    SECTION("Nonzero exit quotes stderr") {
        auto outcome = executor.run(
            write_program(workspace, "import sys\nprint('boom', file=sys.stderr)\nsys.exit(4)\n"), short_limits());

        CHECK(outcome.status == ExecutionOutcome::Status::Exited);
        CHECK(outcome.code == 4);
        CHECK_FALSE(outcome.success());
        CHECK_THAT(outcome.diagnostic, ContainsSubstring("exited with code 4"));
        CHECK_THAT(outcome.diagnostic, ContainsSubstring("boom"));
    }

    SECTION("Uncaught exception") {
        auto outcome = executor.run(write_program(workspace, "raise ValueError('bad input')\n"), short_limits());

        CHECK(outcome.status == ExecutionOutcome::Status::Exited);
        CHECK(outcome.code == 1);
        CHECK_THAT(outcome.stderr_text, ContainsSubstring("ValueError: bad input"));
    }

    SECTION("Crash") {
        auto outcome =
            executor.run(write_program(workspace, "import os\nos.kill(os.getpid(), 11)\n"), short_limits());

        CHECK(outcome.status == ExecutionOutcome::Status::Signaled);
        CHECK(outcome.code == SIGSEGV);
        CHECK_THAT(outcome.diagnostic, ContainsSubstring("killed by signal 11"));
    }

    SECTION("Infinite loop") {
        SandboxLimits limits;
        limits.timeout = 300ms;

        const auto started = std::chrono::steady_clock::now();
        auto outcome = executor.run(write_program(workspace, "while True:\n    pass\n"), limits);

        CHECK(outcome.status == ExecutionOutcome::Status::TimedOut);
        CHECK(outcome.diagnostic == "exceeded the time limit of 300ms");
        CHECK(std::chrono::steady_clock::now() - started < 5s);
    }

    SECTION("Memory ceiling") {
        SandboxLimits limits = short_limits();
        limits.memory_mb = 256;

        auto outcome = executor.run(write_program(workspace, "block = bytearray(2 * 1024 ** 3)\n"), limits);

        CHECK_FALSE(outcome.success());
        CHECK_THAT(outcome.stderr_text, ContainsSubstring("MemoryError"));
    }

    SECTION("Environment is replaced") {
        auto outcome =
            executor.run(write_program(workspace, "import os\nprint(os.environ.get('HOME', 'unset'))\n"),
                         short_limits());

        CHECK(outcome.stdout_text == "unset\n");
    }
}

TEST_CASE("Launch failures are outcomes, not exceptions") {
    ScratchArea workspace = make_workspace();
    fs::path program = write_program(workspace, "print('unreachable')\n");

    SECTION("Missing interpreter") {
        DirectExecutor executor{Interpreter{.path = "/nonexistent/python3", .flags = {}}};

        auto outcome = executor.run(program, short_limits());

        CHECK(outcome.status == ExecutionOutcome::Status::LaunchFailure);
        CHECK_THAT(outcome.diagnostic, ContainsSubstring("exec of \"/nonexistent/python3\" failed"));
    }

    SECTION("Invalid limits") {
        SandboxLimits limits;
        limits.memory_mb = 0;

        auto outcome = DirectExecutor{PYTHON}.run(program, limits);

        CHECK(outcome.status == ExecutionOutcome::Status::LaunchFailure);
        CHECK_THAT(outcome.diagnostic, ContainsSubstring("invalid limits"));
    }

    SECTION("Missing program in an isolated executor") {
        NsjailExecutor executor{"/nonexistent/nsjail", PYTHON, workspace.root()};

        auto outcome = executor.run(workspace.root() / "missing.py", short_limits());

        CHECK(outcome.status == ExecutionOutcome::Status::LaunchFailure);
        CHECK_THAT(outcome.diagnostic, ContainsSubstring("into the scratch area"));
    }
}

TEST_CASE("Scratch areas are private and removed") {
    ScratchArea workspace = make_workspace();

    auto scratch = ScratchArea::create(workspace.root());
    REQUIRE(scratch);

    const fs::path root = scratch->root();
    CHECK(fs::is_directory(scratch->app_dir()));
    CHECK(scratch->program_path() == root / "app" / "harness.py");
    CHECK((fs::status(root).permissions() & fs::perms::all) == fs::perms::owner_all);

    fs::path program = write_program(workspace, "pass\n");
    REQUIRE(scratch->copy_in(program));
    CHECK(fs::is_regular_file(scratch->program_path()));

    SECTION("Explicitly") {
        // Restored before removal
        fs::permissions(scratch->app_dir(), fs::perms::none);

        REQUIRE(scratch->remove());
        CHECK_FALSE(fs::exists(root));
        CHECK(scratch->remove());
    }

    SECTION("On destruction") {
        { auto moved = std::move(scratch).value(); }
        CHECK_FALSE(fs::exists(root));
    }
}

TEST_CASE("nsjail arguments confine the program") {
    ScratchArea workspace = make_workspace();
    ScratchArea scratch = std::move(ScratchArea::create(workspace.root())).value();

    NsjailExecutor executor{"/usr/bin/nsjail", PYTHON, workspace.root()};

    SandboxLimits limits;
    limits.timeout = 1500ms;
    limits.memory_mb = 128;
    limits.max_cpus = 2;
    limits.max_file_size_mb = 3;

    std::vector<std::string> args = executor.build_arguments(scratch, limits);

    CHECK(args.front() == "-Mo");
    CHECK(has_option(args, "-t", "2"));
    CHECK(has_option(args, "-R", "/usr"));
    CHECK(has_option(args, "-B", scratch.app_dir().string() + ":/app"));
    CHECK(has_option(args, "--cwd", "/app"));
    CHECK(has_option(args, "--rlimit_as", "128"));
    CHECK(has_option(args, "--rlimit_cpu", "2"));
    CHECK(has_option(args, "--rlimit_fsize", "3"));
    CHECK(has_option(args, "--max_cpus", "2"));
    CHECK(has_option(args, "-E", "LANG=C.UTF-8"));
    CHECK(ranges::find(args, std::string{"--disable_proc"}) != args.end());
    CHECK(ranges::find(args, std::string{"--disable_clone_newnet"}) == args.end());

    // The interpreter command follows the separator
    auto separator = ranges::find(args, std::string{"--"});
    REQUIRE(separator != args.end());
    CHECK(std::vector<std::string>(separator + 1, args.end()) ==
          std::vector<std::string>{"/usr/bin/python3", "-I", "-B", "/app/harness.py"});

    SECTION("Network access can be allowed") {
        limits.allow_network = true;
        args = executor.build_arguments(scratch, limits);

        CHECK(ranges::find(args, std::string{"--disable_clone_newnet"}) != args.end());
    }
}

TEST_CASE("Executors are built by kind") {
    auto direct = make_executor(ExecutorKind::Direct, PYTHON);
    REQUIRE(direct != nullptr);
    CHECK(direct->name() == "direct");
    CHECK(direct->get_interpreter().path == PYTHON.path);

    auto namespaced = make_executor(ExecutorKind::Namespace, PYTHON);
    CHECK((namespaced != nullptr) == NamespaceExecutor::is_available());

    auto nsjail = make_executor(ExecutorKind::Nsjail, PYTHON);
    CHECK((nsjail != nullptr) == NsjailExecutor::find_nsjail().has_value());

    auto automatic = make_executor(ExecutorKind::Auto, PYTHON);
    if (automatic) {
        CHECK(automatic->name() != "direct");
    } else {
        CHECK_FALSE(NamespaceExecutor::is_available());
    }
}

TEST_CASE("Namespaced programs only see their own directory") {
    if (!have_python() || !NamespaceExecutor::is_available()) {
        SKIP("unprivileged user namespaces are unavailable");
    }

    ScratchArea workspace = make_workspace();
    NamespaceExecutor executor{PYTHON, workspace.root()};

    SECTION("The working directory is writable") {
        auto outcome = executor.run(write_program(workspace, "import os\n"
                                                             "open('note.txt', 'w').write('kept')\n"
                                                             "print(os.getcwd(), open('note.txt').read())\n"),
                                    short_limits());

        CHECK(outcome.success());
        CHECK(outcome.stdout_text == "/app kept\n");
    }

    SECTION("System directories are read-only") {
        auto outcome = executor.run(write_program(workspace, "open('/usr/fngrader-escape', 'w')\n"), short_limits());

        CHECK(outcome.status == ExecutionOutcome::Status::Exited);
        CHECK(outcome.code != 0);
    }

    SECTION("The host's files are hidden") {
        auto outcome = executor.run(write_program(workspace, "import os\nprint(os.path.exists('/root'))\n"),
                                    short_limits());

        CHECK(outcome.stdout_text == "False\n");
    }

    SECTION("Timeouts still apply") {
        SandboxLimits limits;
        limits.timeout = 300ms;

        auto outcome = executor.run(write_program(workspace, "while True:\n    pass\n"), limits);

        CHECK(outcome.status == ExecutionOutcome::Status::TimedOut);
    }

    SECTION("The program cannot signal the grader") {
        auto outcome = executor.run(write_program(workspace, "import os, signal\n"
                                                             "os.kill(os.getppid(), signal.SIGTERM)\n"
                                                             "try:\n"
                                                             "    os.kill(-1, signal.SIGTERM)\n"
                                                             "except ProcessLookupError:\n"
                                                             "    pass\n"
                                                             "print('parent', os.getppid())\n"),
                                    short_limits());

        // Its parent is the namespace's pid 1, which ignores the signal
        CHECK(outcome.success());
        CHECK(outcome.stdout_text == "parent 1\n");
    }

    SECTION("Detached descendants die with the program") {
        SandboxLimits limits;
        limits.timeout = 1s;

        auto outcome = executor.run(
            write_program(workspace, "import os, sys\n"
                                     "r, w = os.pipe()\n"
                                     "if os.fork() == 0:\n"
                                     "    os.close(r)\n"
                                     "    os.setsid()\n"
                                     "    os.execv(sys.executable, [sys.executable, '-c', 'import time; "
                                     "time.sleep(3600)', 'fngrader-detached-sleeper'])\n"
                                     "os.close(w)\n"
                                     "os.read(r, 1)\n"
                                     "print('detached', flush=True)\n"
                                     "while True:\n"
                                     "    pass\n"),
            limits);

        CHECK(outcome.status == ExecutionOutcome::Status::TimedOut);
        CHECK(outcome.stdout_text == "detached\n");
        CHECK(process_exits_soon("fngrader-detached-sleeper"));
    }

    SECTION("Leaving the root through a nested chroot is impossible") {
        const std::string host_dir = workspace.root().string();

        auto outcome = executor.run(write_program(workspace, "import os\n"
                                                             "try:\n"
                                                             "    os.mkdir('nested')\n"
                                                             "    os.chroot('nested')\n"
                                                             "    for _ in range(64):\n"
                                                             "        os.chdir('..')\n"
                                                             "    os.chroot('.')\n"
                                                             "except OSError:\n"
                                                             "    print('refused')\n"
                                                             "print(os.path.exists('" +
                                                                 host_dir + "'))\n"),
                                    short_limits());

        CHECK(outcome.success());
        CHECK(outcome.stdout_text == "refused\nFalse\n");
    }

    // Only the program written by the test remains beside the app dir
    CHECK(count_entries(workspace.root()) == 2);
}
