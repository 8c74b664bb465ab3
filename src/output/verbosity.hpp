#pragma once

namespace fngrader {

/// How much of a grade report is printed.
/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing; only the exit code tells the outcome
    Quiet,   ///< The score, or why the submission is ungraded
    Summary, ///< The score and every failed test with its expected and actual results
    All,     ///< Every test, passed or failed
    Extra,   ///< Every test with its expected and actual results
    Max
};

constexpr bool should_output_test(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !passed));
}

constexpr bool should_output_test_details(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= Extra || (level >= Summary && !passed));
}

constexpr bool should_output_score(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Quiet);
}

} // namespace fngrader
