#pragma once

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/formatters/debug.hpp>
#include <fngrader/common/formatters/enum.hpp>
#include <fngrader/sandbox/executor.hpp>
#include <fngrader/sandbox/limits.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fngrader {

struct ProgramOptions
{
    enum class Command { Plan, BuildKey, Grade };

    enum class ColorizeOpt { Auto, Always, Never };

    enum class OutputFormat { Text, Literal };

    // ###### Argument fields

    Command command = Command::Grade;

    /// Level of verbosity for grade reports
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;
    ColorizeOpt colorize_option = ColorizeOpt::Auto;
    OutputFormat output_format = OutputFormat::Text;

    std::string interpreter = std::string{DEFAULT_INTERPRETER};

    // plan
    std::filesystem::path spec_path;
    std::uint32_t seed = 0;

    // build-key and grade
    std::filesystem::path calls_path;

    // build-key
    std::filesystem::path solution_path;

    // grade
    std::filesystem::path key_path;
    std::filesystem::path submission_path;
    ExecutorKind backend = ExecutorKind::Auto;
    std::optional<std::filesystem::path> nsjail_path;

    /// Where plan and build-key write their artifact; stdout if empty
    std::optional<std::filesystem::path> output_path;

    /// Seconds; the default depends on the command
    std::optional<double> timeout_seconds;
    SandboxLimits limits{};

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_INTERPRETER = "/usr/bin/python3";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    /// The wall-clock timeout: the one given, or the command's default
    std::chrono::milliseconds effective_timeout() const {
        if (timeout_seconds) {
            return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(*timeout_seconds * 1000)};
        }

        return command == Command::BuildKey ? SandboxLimits::ANSWER_KEY_TIMEOUT : SandboxLimits::GRADING_TIMEOUT;
    }

    /// Verify that all fields are valid, and settle the limits
    Expected<void, std::string> validate() {
        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        TRY(ensure_is_regular_file(interpreter, "Interpreter {:?}"));

        limits.timeout = effective_timeout();

        if (auto valid = limits.validate(); !valid) {
            return fmt::format("Invalid limits: {}", valid.error());
        }

        switch (command) {
        case Command::Plan:
            TRY(ensure_is_regular_file(spec_path, "Spec file {:?}"));
            break;

        case Command::BuildKey:
            TRY(ensure_is_regular_file(calls_path, "Call plan {:?}"));
            TRY(ensure_is_regular_file(solution_path, "Solution {:?}"));
            break;

        case Command::Grade:
            TRY(ensure_is_regular_file(calls_path, "Call plan {:?}"));
            TRY(ensure_is_regular_file(key_path, "Answer key {:?}"));
            TRY(ensure_is_regular_file(submission_path, "Submission {:?}"));

            if (nsjail_path) {
                if (backend != ExecutorKind::Nsjail) {
                    return std::string{"--nsjail may only be given with --backend nsjail"};
                }
                TRY(ensure_is_regular_file(*nsjail_path, "nsjail executable {:?}"));
            }
            break;
        }

        return {};
    }
};

} // namespace fngrader

FMT_SERIALIZE_ENUM(::fngrader::ProgramOptions::Command, Plan, BuildKey, Grade);
FMT_SERIALIZE_ENUM(::fngrader::ProgramOptions::ColorizeOpt, Auto, Always, Never);
FMT_SERIALIZE_ENUM(::fngrader::ProgramOptions::OutputFormat, Text, Literal);

template <>
struct fmt::formatter<::fngrader::ProgramOptions> : ::fngrader::DebugFormatter
{
    auto format(const ::fngrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{command={}, verbosity={}, color_opt={}, format={}, interpreter={:?}, spec={:?}, "
                              "seed={}, calls={:?}, solution={:?}, key={:?}, submission={:?}, backend={}, "
                              "output={:?}, limits={}}}",
                              from.command, fmt::underlying(from.verbosity), from.colorize_option, from.output_format,
                              from.interpreter, from.spec_path.string(), from.seed, from.calls_path.string(),
                              from.solution_path.string(), from.key_path.string(), from.submission_path.string(),
                              from.backend, from.output_path.value_or("").string(), from.limits);
    }
};
