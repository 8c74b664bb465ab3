#pragma once

#include <fngrader/grading/result_record.hpp>
#include <fngrader/value/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fngrader {

/// Expected and actual results of one compared call. Emitted for every call, passed or not.
struct TestDiagnostic
{
    std::size_t index;

    /// The call as written in the harness, e.g. `add(1, 10)`; empty if unknown
    std::string call;

    bool passed;

    ResultRecord expected;
    ResultRecord actual;

    bool return_value_matches() const { return expected.return_value == actual.return_value; }

    bool heap_param_values_match() const { return expected.heap_param_values == actual.heap_param_values; }
};

/// Outcome of grading one submission.
///
/// A report either is *graded* (`error` empty; `total` calls were compared) or *ungraded* (`error` holds why the
/// submission could not be graded; `passed` and `total` are 0). An ungraded submission is not one whose tests
/// all failed.
struct GradeReport
{
    std::size_t passed = 0;
    std::size_t total = 0;

    std::vector<TestDiagnostic> diagnostics;

    std::optional<std::string> error;

    bool is_graded() const { return !error.has_value(); }

    bool all_passed() const { return is_graded() && passed == total; }

    static GradeReport ungraded(std::string error);
};

/// `{"passed": n, "total": n, "error": null | "...", "tests": [...]}`
Value grade_report_to_value(const GradeReport& report);

std::string serialize_grade_report(const GradeReport& report);

} // namespace fngrader
