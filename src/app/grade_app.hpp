#pragma once

#include <fngrader/sandbox/executor.hpp>

#include "app/app.hpp" // IWYU pragma: export

#include <memory>

namespace fngrader {

class GradeApp final : public App
{
public:
    using App::App;

    /// Exit code of a run whose submission could not be graded
    static constexpr int UNGRADED_EXIT_CODE = 2;

private:
    int run_impl() override;

    /// The configured isolation backend, or nullptr if it is unavailable on this host
    std::unique_ptr<Executor> make_isolated_executor() const;
};

} // namespace fngrader
