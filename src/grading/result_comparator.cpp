#include <fngrader/grading/result_comparator.hpp>

#include <fngrader/common/expected.hpp>
#include <fngrader/grading/answer_key.hpp>
#include <fngrader/grading/grade_report.hpp>
#include <fngrader/grading/result_record.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/planner/test_call.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace fngrader {

Expected<AnswerKey, std::string> make_answer_key(const ExecutionOutcome& trusted_run) {
    if (!trusted_run.success()) {
        return fmt::format("the trusted solution did not run successfully ({}): {}", trusted_run.status,
                           trusted_run.diagnostic);
    }

    return AnswerKey::parse(trusted_run.stdout_text);
}

GradeReport grade_run(const ExecutionOutcome& candidate_run, const AnswerKey& key, const CallPlan& calls) {
    if (!candidate_run.success()) {
        LOG_WARN("Submission is ungraded: {} ({})", candidate_run.status, candidate_run.diagnostic);
        return GradeReport::ungraded(candidate_run.diagnostic);
    }

    auto results = parse_result_records(candidate_run.stdout_text);

    if (!results) {
        LOG_WARN("Submission is ungraded: {}", results.error());
        return GradeReport::ungraded(fmt::format("could not read the submission's results: {}", results.error()));
    }

    return compare_results(results.value(), key.records(), calls);
}

GradeReport compare_results(const ResultRecords& actual, const ResultRecords& expected, const CallPlan& calls) {
    const std::size_t compared = std::min(actual.size(), expected.size());

    if (actual.size() != expected.size()) {
        LOG_DEBUG("Comparing only the first {} results ({} expected, {} produced)", compared, expected.size(),
                  actual.size());
    }

    GradeReport report;
    report.total = compared;
    report.diagnostics.reserve(compared);

    for (std::size_t i = 0; i < compared; ++i) {
        TestDiagnostic diag{.index = i,
                            .call = i < calls.size() ? call_expression(calls[i]) : std::string{},
                            .passed = false,
                            .expected = expected[i],
                            .actual = actual[i]};
        diag.passed = diag.return_value_matches() && diag.heap_param_values_match();

        if (diag.passed) {
            ++report.passed;
        }

        report.diagnostics.push_back(std::move(diag));
    }

    LOG_DEBUG("{}/{} results match the answer key", report.passed, report.total);

    return report;
}

} // namespace fngrader
