#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/grading/answer_key.hpp>
#include <fngrader/grading/grade_report.hpp>
#include <fngrader/grading/result_record.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>

#include <string>

namespace fngrader {

/// Turns a trusted run into an AnswerKey. Any failure means no key can exist.
Expected<AnswerKey, std::string> make_answer_key(const ExecutionOutcome& trusted_run);

/// Grades a candidate run against `key`.
///
/// A failed run, or output that is not a sequence of results, yields an ungraded report carrying the diagnostic.
/// Otherwise results are paired with the key by position, up to the shorter of the two; a pair passes when both
/// the return values and the tracked parameter states are structurally equal.
///
/// `calls`, when given, labels each diagnostic with its call expression.
GradeReport grade_run(const ExecutionOutcome& candidate_run, const AnswerKey& key, const CallPlan& calls = {});

/// Positional comparison of parsed results, as done by `grade_run`
GradeReport compare_results(const ResultRecords& actual, const ResultRecords& expected, const CallPlan& calls = {});

} // namespace fngrader
