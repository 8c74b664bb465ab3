#include <fngrader/engine.hpp>

#include <fngrader/common/class_traits.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/linux.hpp>
#include <fngrader/grading/answer_key.hpp>
#include <fngrader/grading/grade_report.hpp>
#include <fngrader/grading/result_comparator.hpp>
#include <fngrader/harness/harness_synthesizer.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/sandbox/execution_outcome.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>
#include <fngrader/spec/test_spec.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

namespace fngrader {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view HARNESS_SUFFIX = ".py";

/// A uniquely named harness program, removed when this goes out of scope
class HarnessFile : NonCopyable
{
public:
    static Expected<HarnessFile, std::string> create(const fs::path& dir, std::string_view contents) {
        auto created = linux::mkstemps((dir / fmt::format("fngrader-harness-XXXXXX{}", HARNESS_SUFFIX)).string(),
                                       static_cast<int>(HARNESS_SUFFIX.size()));

        if (!created) {
            return fmt::format("Failed to create a harness file in {:?}: {}", dir.string(),
                               created.error().message());
        }

        auto [fd, name] = std::move(created).value();
        HarnessFile res{fs::path{std::move(name)}};

        auto written = write_all(fd, contents);
        std::ignore = linux::close(fd);

        if (!written) {
            return fmt::format("Failed to write harness {:?}: {}", res.path_.string(), written.error().message());
        }

        return res;
    }

    ~HarnessFile() {
        if (path_.empty()) {
            return;
        }

        std::error_code err;
        fs::remove(path_, err);

        if (err) {
            LOG_WARN("Failed to remove harness {:?}: {}", path_.string(), err.message());
        }
    }

    HarnessFile(HarnessFile&& other) noexcept
        : path_{std::exchange(other.path_, {})} {}

    HarnessFile& operator=(HarnessFile&&) = delete;

    const fs::path& path() const { return path_; }

private:
    explicit HarnessFile(fs::path path)
        : path_{std::move(path)} {}

    static Expected<> write_all(int fd, std::string_view contents) {
        while (!contents.empty()) {
            auto res = linux::write(fd, contents);

            if (!res) {
                if (res.error() == std::errc::interrupted) {
                    continue;
                }
                return res.error();
            }

            contents.remove_prefix(static_cast<std::size_t>(res.value()));
        }

        return {};
    }

    fs::path path_;
};

fs::path resolve_work_dir(const fs::path& configured) {
    if (!configured.empty()) {
        return configured;
    }

    std::error_code err;
    auto tmp = fs::temp_directory_path(err);

    return err ? fs::path{"/tmp"} : tmp;
}

} // namespace

GradingEngine::GradingEngine(EngineOptions options, std::unique_ptr<Executor> isolated_executor,
                             std::unique_ptr<Executor> trusted_executor)
    : options_{std::move(options)}
    , isolated_executor_{std::move(isolated_executor)}
    , trusted_executor_{std::move(trusted_executor)} {}

Expected<CallPlan, std::string> GradingEngine::plan_calls(const TestSuite& suite, std::uint32_t seed) {
    CallPlanner planner{seed};

    auto res = planner.plan(suite);

    if (res) {
        LOG_DEBUG("Planned {} calls with seed {}", res->size(), seed);
    }

    return res;
}

Expected<ExecutionOutcome, std::string> GradingEngine::run_harness(const Executor& executor, const CallPlan& calls,
                                                                   std::string_view source,
                                                                   const SandboxLimits& limits) const {
    std::string harness = synthesize_harness(source, calls);

    auto file = HarnessFile::create(resolve_work_dir(options_.work_dir), harness);

    if (!file) {
        return file.error();
    }

    LOG_DEBUG("Running {} calls from {:?} with the {} executor", calls.size(), file->path().string(),
              executor.name());

    return executor.run(file->path(), limits);
}

AnswerKey GradingEngine::build_answer_key(const CallPlan& calls, std::string_view trusted_source) const {
    if (!trusted_executor_) {
        throw AnswerKeyError("no executor is configured for trusted solutions");
    }

    auto outcome = run_harness(*trusted_executor_, calls, trusted_source, options_.answer_key_limits);

    if (!outcome) {
        LOG_ERROR("Could not run the trusted solution: {}", outcome.error());
        throw AnswerKeyError(fmt::format("could not run the trusted solution: {}", outcome.error()));
    }

    auto key = make_answer_key(outcome.value());

    if (!key) {
        LOG_ERROR("No answer key: {}", key.error());
        throw AnswerKeyError(key.error());
    }

    if (key->size() != calls.size()) {
        LOG_ERROR("The trusted solution produced {} results for {} calls", key->size(), calls.size());
        throw AnswerKeyError(
            fmt::format("the trusted solution produced {} results for {} calls", key->size(), calls.size()));
    }

    LOG_DEBUG("Built an answer key of {} results", key->size());

    return std::move(key).value();
}

AnswerKey GradingEngine::build_answer_key(const TestSuite& suite, std::string_view trusted_source) const {
    auto calls = plan_calls(suite, options_.seed);

    if (!calls) {
        LOG_ERROR("Cannot plan calls: {}", calls.error());
        throw AnswerKeyError(calls.error());
    }

    return build_answer_key(calls.value(), trusted_source);
}

GradeReport GradingEngine::grade_submission(const CallPlan& calls, const AnswerKey& key,
                                            std::string_view candidate_source) const {
    if (!isolated_executor_) {
        return GradeReport::ungraded("no isolating executor is available on this host");
    }

    auto outcome = run_harness(*isolated_executor_, calls, candidate_source, options_.grading_limits);

    if (!outcome) {
        LOG_WARN("Submission is ungraded: {}", outcome.error());
        return GradeReport::ungraded(outcome.error());
    }

    return grade_run(outcome.value(), key, calls);
}

GradeReport GradingEngine::grade_submission(const TestSuite& suite, const AnswerKey& key,
                                            std::string_view candidate_source) const {
    auto calls = plan_calls(suite, options_.seed);

    if (!calls) {
        return GradeReport::ungraded(fmt::format("cannot plan calls: {}", calls.error()));
    }

    return grade_submission(calls.value(), key, candidate_source);
}

} // namespace fngrader
