#include "app/build_key_app.hpp"

#include <fngrader/common/text_file.hpp>
#include <fngrader/engine.hpp>
#include <fngrader/grading/answer_key.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/sandbox/executor.hpp>

#include <fmt/format.h>

#include <memory>
#include <string>

namespace fngrader {

int BuildKeyApp::run_impl() {
    auto calls = read_call_plan(OPTS.calls_path);

    if (!calls) {
        return fail(fmt::format("Invalid call plan {:?}: {}", OPTS.calls_path.string(), calls.error()));
    }

    auto solution = read_text_file(OPTS.solution_path);

    if (!solution) {
        return fail(solution.error());
    }

    EngineOptions options{.answer_key_limits = OPTS.limits};

    GradingEngine engine{options, /*isolated_executor=*/nullptr, std::make_unique<DirectExecutor>(get_interpreter())};

    try {
        AnswerKey key = engine.build_answer_key(calls.value(), solution.value());

        return write_artifact(key.text());
    } catch (const AnswerKeyError& err) {
        return fail(fmt::format("Configuration error: the trusted solution {:?} cannot produce an answer key: {}",
                                OPTS.solution_path.string(), err.what()));
    }
}

} // namespace fngrader
