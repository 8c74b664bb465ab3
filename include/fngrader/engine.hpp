/// \file
/// The grading engine: the three operations a lab service builds on
#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/grading/answer_key.hpp>
#include <fngrader/grading/grade_report.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/spec/test_spec.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fngrader {

/// The trusted solution could not produce an answer key; the lab cannot be created
class AnswerKeyError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct EngineOptions
{
    /// Seed for planning calls from specs
    std::uint32_t seed = 0;

    SandboxLimits grading_limits{};
    SandboxLimits answer_key_limits{.timeout = SandboxLimits::ANSWER_KEY_TIMEOUT};

    /// Where harness programs are written; the system temporary directory if empty
    std::filesystem::path work_dir;
};

/// Plans calls, builds answer keys from trusted solutions and grades submissions.
///
/// Trusted solutions run through `trusted_executor` (a DirectExecutor by default); submissions only ever run
/// through `isolated_executor`. Grading only reads the engine, the plan and the key, so one engine may grade
/// many submissions concurrently.
class GradingEngine : NonCopyable
{
public:
    GradingEngine(EngineOptions options, std::unique_ptr<Executor> isolated_executor,
                  std::unique_ptr<Executor> trusted_executor = std::make_unique<DirectExecutor>());

    /// Deterministic in `suite` and `seed`
    static Expected<CallPlan, std::string> plan_calls(const TestSuite& suite, std::uint32_t seed);

    /// Runs `trusted_source` over `calls`.
    /// Throws AnswerKeyError if the solution fails, its output is malformed, or it yields a result count
    /// different from the number of calls.
    AnswerKey build_answer_key(const CallPlan& calls, std::string_view trusted_source) const;

    /// Plans `suite` with the configured seed, then builds the key as above
    AnswerKey build_answer_key(const TestSuite& suite, std::string_view trusted_source) const;

    /// Runs `candidate_source` over `calls` in isolation and grades it against `key`.
    /// Never throws because of the submission: every failure becomes an ungraded report.
    GradeReport grade_submission(const CallPlan& calls, const AnswerKey& key, std::string_view candidate_source) const;

    /// Plans `suite` with the configured seed, then grades as above
    GradeReport grade_submission(const TestSuite& suite, const AnswerKey& key,
                                 std::string_view candidate_source) const;

    const EngineOptions& get_options() const { return options_; }

private:
    /// Writes the harness for `source` to a uniquely named file and runs it
    Expected<ExecutionOutcome, std::string> run_harness(const Executor& executor, const CallPlan& calls,
                                                        std::string_view source, const SandboxLimits& limits) const;

    EngineOptions options_;
    std::unique_ptr<Executor> isolated_executor_;
    std::unique_ptr<Executor> trusted_executor_;
};

} // namespace fngrader
