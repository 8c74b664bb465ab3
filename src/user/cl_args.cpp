#include "user/cl_args.hpp"

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/sandbox/executor.hpp>

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace fngrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ FNGRADER_VERSION_STRING, argparse::default_arguments::help}
    , plan_parser_{"plan", FNGRADER_VERSION_STRING, argparse::default_arguments::help}
    , build_key_parser_{"build-key", FNGRADER_VERSION_STRING, argparse::default_arguments::help}
    , grade_parser_{"grade", FNGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

template <typename T>
T parse_number(const std::string& opt, std::string_view what) {
    T res{};

    const char* end = opt.data() + opt.size();
    auto [ptr, err] = std::from_chars(opt.data(), end, res);

    if (err != std::errc{} || ptr != end) {
        throw std::invalid_argument(fmt::format("{} must be a number (got {:?})", what, opt));
    }

    return res;
}

} // namespace

void CommandLineArgs::setup_parser() {
    std::size_t max_width = 80; // NOLINT(readability-magic-numbers)

    if (auto term_sz = terminal_size(stdout)) {
        max_width = std::size_t{term_sz->ws_col} * 3 / 4;
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        LOG_DEBUG("Failed to get terminal size. Setting max width to {}", max_width);
    }

    for (auto* parser : {&arg_parser_, &plan_parser_, &build_key_parser_, &grade_parser_}) {
        parser->set_usage_max_line_width(max_width);
    }

    arg_parser_.add_description(fmt::format("fngrader v{}\nGrades Python functions against a trusted solution's "
                                            "results over generated inputs.",
                                            FNGRADER_VERSION_STRING));

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", FNGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("--interpreter")
        .default_value(std::string{ProgramOptions::DEFAULT_INTERPRETER})
        .nargs(1)
        .metavar("PATH")
        .action([this] (const std::string& opt) {
                opts_buffer_.interpreter = opt;
        })
        .help("The Python interpreter that runs harnesses.");
    // clang-format on

    setup_plan_parser();
    setup_build_key_parser();
    setup_grade_parser();

    arg_parser_.add_subparser(plan_parser_);
    arg_parser_.add_subparser(build_key_parser_);
    arg_parser_.add_subparser(grade_parser_);
}

void CommandLineArgs::setup_plan_parser() {
    plan_parser_.add_description("Expands a lab spec file into a call plan.");

    // clang-format off
    plan_parser_.add_argument("-s", "--spec")
        .required()
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.spec_path = opt;
        })
        .help("Lab spec file: one test spec, or a sequence of them.");

    plan_parser_.add_argument("--seed")
        .default_value(std::string{"0"})
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) {
                opts_buffer_.seed = parse_number<std::uint32_t>(opt, "Seed");
        })
        .help("Seed for generated values. The same spec and seed always yield the same plan.");

    plan_parser_.add_argument("-o", "--output")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.output_path = opt;
        })
        .help("Where to write the call plan. Defaults to stdout.");
    // clang-format on
}

void CommandLineArgs::setup_build_key_parser() {
    build_key_parser_.add_description(
        "Runs a trusted solution over a call plan and records its results as the answer key.\n"
        "The solution runs without isolation.");

    // clang-format off
    build_key_parser_.add_argument("--calls")
        .required()
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.calls_path = opt;
        })
        .help("Call plan, as written by 'plan'.");

    build_key_parser_.add_argument("--solution")
        .required()
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.solution_path = opt;
        })
        .help("The trusted solution's source.");

    build_key_parser_.add_argument("-o", "--output")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.output_path = opt;
        })
        .help("Where to write the answer key. Defaults to stdout.");
    // clang-format on

    add_limit_arguments(build_key_parser_);
}

void CommandLineArgs::setup_grade_parser() {
    grade_parser_.add_description("Runs a submission in isolation over a call plan and grades it against an "
                                  "answer key.\nExits with 0 once graded, whatever the score, and 2 when the "
                                  "submission could not be graded.");

    // clang-format off
    grade_parser_.add_argument("--calls")
        .required()
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.calls_path = opt;
        })
        .help("Call plan, as written by 'plan'.");

    grade_parser_.add_argument("--key")
        .required()
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.key_path = opt;
        })
        .help("Answer key, as written by 'build-key'.");

    grade_parser_.add_argument("--submission")
        .required()
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.submission_path = opt;
        })
        .help("The submission's source.");

    grade_parser_.add_argument("--backend")
        .choices("auto", "nsjail", "namespace")
        .default_value(std::string{"auto"})
        .nargs(1)
        .metavar("NAME")
        .action([this] (const std::string& opt) {
                using enum ExecutorKind;

                if (opt == "auto") {
                    opts_buffer_.backend = Auto;
                } else if (opt == "nsjail") {
                    opts_buffer_.backend = Nsjail;
                } else if (opt == "namespace") {
                    opts_buffer_.backend = Namespace;
                }
        })
        .help("Isolation backend: auto, nsjail or namespace. 'auto' prefers nsjail when it is on PATH.");

    grade_parser_.add_argument("--nsjail")
        .nargs(1)
        .metavar("PATH")
        .action([this] (const std::string& opt) {
                opts_buffer_.nsjail_path = opt;
        })
        .help("The nsjail executable, for '--backend nsjail'. Defaults to searching PATH.");

    grade_parser_.add_argument("--cpus")
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.max_cpus = parse_number<std::size_t>(opt, "CPU count");
        })
        .help(fmt::format("CPUs the submission may use. Defaults to {}.", SandboxLimits{}.max_cpus));

    grade_parser_.add_argument("--allow-network")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.limits.allow_network = true;
        })
        .help("Give the submission network access. Denied by default.");

    grade_parser_.add_argument("--format")
        .choices("text", "literal")
        .default_value(std::string{"text"})
        .nargs(1)
        .metavar("FORMAT")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::OutputFormat;

                if (opt == "text") {
                    opts_buffer_.output_format = Text;
                } else if (opt == "literal") {
                    opts_buffer_.output_format = Literal;
                }
        })
        .help("Report format: 'text' for people, 'literal' for programs.");

    grade_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on

    add_limit_arguments(grade_parser_);
    add_verbosity_arguments(grade_parser_);
}

void CommandLineArgs::add_limit_arguments(argparse::ArgumentParser& parser) {
    const SandboxLimits defaults{};

    // clang-format off
    parser.add_argument("-t", "--timeout")
        .nargs(1)
        .metavar("SECONDS")
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout_seconds = parse_number<double>(opt, "Timeout");
        })
        .help(fmt::format("Wall-clock limit. Defaults to {}s for grading and {}s for building answer keys.",
                          std::chrono::duration<double>{SandboxLimits::GRADING_TIMEOUT}.count(),
                          std::chrono::duration<double>{SandboxLimits::ANSWER_KEY_TIMEOUT}.count()));

    parser.add_argument("--memory")
        .nargs(1)
        .metavar("MB")
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.memory_mb = parse_number<std::size_t>(opt, "Memory limit");
        })
        .help(fmt::format("Address-space limit. Defaults to {} MB.", defaults.memory_mb));

    parser.add_argument("--file-size")
        .nargs(1)
        .metavar("MB")
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.max_file_size_mb = parse_number<std::size_t>(opt, "File size limit");
        })
        .help(fmt::format("Largest file the program may write. Defaults to {} MB.", defaults.max_file_size_mb));
    // clang-format on
}

void CommandLineArgs::add_verbosity_arguments(argparse::ArgumentParser& parser) {
    using enum VerbosityLevel;

    constexpr auto DEFAULT_VERBOSITY_VALUE =
        static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
    constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

    constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
    constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

    // clang-format off
    parser.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                if (level > MAX_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification exceeds maximum level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
            })
        .append()
        .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

    parser.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                if (level < MIN_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification is lower than minimum level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
            })
        .append()
        .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

    parser.add_argument("--silent")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.verbosity = Silent;
            })
        .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. "
              "Useful for scripting.");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    using enum ProgramOptions::Command;

    if (arg_parser_.is_subcommand_used(plan_parser_)) {
        opts_buffer_.command = Plan;
    } else if (arg_parser_.is_subcommand_used(build_key_parser_)) {
        opts_buffer_.command = BuildKey;
    } else if (arg_parser_.is_subcommand_used(grade_parser_)) {
        opts_buffer_.command = Grade;
    } else {
        return std::string{"A command is required: plan, build-key or grade"};
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    TRY(opts_buffer_.validate());

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    if (arg_parser_.is_subcommand_used(plan_parser_)) {
        return plan_parser_.help().str();
    }
    if (arg_parser_.is_subcommand_used(build_key_parser_)) {
        return build_key_parser_.help().str();
    }
    if (arg_parser_.is_subcommand_used(grade_parser_)) {
        return grade_parser_.help().str();
    }

    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace fngrader
