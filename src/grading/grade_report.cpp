#include <fngrader/grading/grade_report.hpp>

#include <fngrader/grading/result_record.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <string>
#include <utility>

namespace fngrader {

GradeReport GradeReport::ungraded(std::string error) {
    return GradeReport{.passed = 0, .total = 0, .diagnostics = {}, .error = std::move(error)};
}

Value grade_report_to_value(const GradeReport& report) {
    Value::Sequence tests;
    tests.reserve(report.diagnostics.size());

    for (const TestDiagnostic& diag : report.diagnostics) {
        tests.push_back(Value::make_mapping({
            {.key = "index", .value = Value{static_cast<long long>(diag.index)}},
            {.key = "call", .value = diag.call},
            {.key = "passed", .value = diag.passed},
            {.key = "expected", .value = result_record_to_value(diag.expected)},
            {.key = "actual", .value = result_record_to_value(diag.actual)},
        }));
    }

    return Value::make_mapping({
        {.key = "passed", .value = Value{static_cast<long long>(report.passed)}},
        {.key = "total", .value = Value{static_cast<long long>(report.total)}},
        {.key = "error", .value = report.error ? Value{*report.error} : Value{Value::Null{}}},
        {.key = "tests", .value = Value{std::move(tests)}},
    });
}

std::string serialize_grade_report(const GradeReport& report) {
    return to_literal(grade_report_to_value(report));
}

} // namespace fngrader
