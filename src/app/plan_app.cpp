#include "app/plan_app.hpp"

#include <fngrader/engine.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/spec/spec_reader.hpp>

#include <fmt/format.h>

#include <string>

namespace fngrader {

int PlanApp::run_impl() {
    auto suite = SpecReader{OPTS.spec_path}.read();

    if (!suite) {
        return fail(fmt::format("Invalid spec file {:?}: {}", OPTS.spec_path.string(), suite.error()));
    }

    auto calls = GradingEngine::plan_calls(suite.value(), OPTS.seed);

    if (!calls) {
        return fail(fmt::format("Cannot plan calls for {:?}: {}", OPTS.spec_path.string(), calls.error()));
    }

    LOG_INFO("Planned {} calls from {} specs", calls->size(), suite->size());

    return write_artifact(serialize_call_plan(calls.value()) + "\n");
}

} // namespace fngrader
