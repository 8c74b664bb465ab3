#include "app/grade_app.hpp"

#include <fngrader/common/text_file.hpp>
#include <fngrader/engine.hpp>
#include <fngrader/grading/answer_key.hpp>
#include <fngrader/grading/grade_report.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/nsjail_executor.hpp>

#include "output/literal_serializer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace fngrader {

std::unique_ptr<Executor> GradeApp::make_isolated_executor() const {
    if (OPTS.backend == ExecutorKind::Nsjail && OPTS.nsjail_path) {
        return std::make_unique<NsjailExecutor>(*OPTS.nsjail_path, get_interpreter());
    }

    return make_executor(OPTS.backend, get_interpreter());
}

int GradeApp::run_impl() {
    auto calls = read_call_plan(OPTS.calls_path);

    if (!calls) {
        return fail(fmt::format("Invalid call plan {:?}: {}", OPTS.calls_path.string(), calls.error()));
    }

    auto key = AnswerKey::read(OPTS.key_path);

    if (!key) {
        return fail(fmt::format("Invalid answer key {:?}: {}", OPTS.key_path.string(), key.error()));
    }

    auto submission = read_text_file(OPTS.submission_path);

    if (!submission) {
        return fail(submission.error());
    }

    if (key->size() != calls->size()) {
        LOG_WARN("The answer key has {} results for {} calls; only the common prefix is graded", key->size(),
                 calls->size());
    }

    EngineOptions options{.grading_limits = OPTS.limits};

    GradingEngine engine{options, make_isolated_executor()};

    GradeReport report = engine.grade_submission(calls.value(), key.value(), submission.value());

    StdoutSink output_sink;
    std::unique_ptr<Serializer> serializer;

    if (OPTS.output_format == ProgramOptions::OutputFormat::Literal) {
        serializer = std::make_unique<LiteralSerializer>(output_sink, OPTS.verbosity);
    } else {
        serializer = std::make_unique<PlainTextSerializer>(output_sink, OPTS.colorize_option, OPTS.verbosity);
    }

    serializer->on_grade_report(report);
    serializer->finalize();

    return report.is_graded() ? EXIT_SUCCESS : UNGRADED_EXIT_CODE;
}

} // namespace fngrader
