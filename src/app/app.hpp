#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/sandbox/executor.hpp>

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace fngrader {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(-1);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;

    Interpreter get_interpreter() const { return Interpreter{.path = OPTS.interpreter}; }

    /// Writes an artifact to the configured output path, or stdout
    int write_artifact(std::string_view contents) const;

    /// Prints `what` to stderr in red and yields the exit code for a failed command
    static int fail(std::string_view what);
};

/// The app implementing `opts.command`
std::unique_ptr<App> make_app(ProgramOptions opts);

} // namespace fngrader
