#pragma once

#include <fngrader/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace fngrader {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    CommandLineArgs(const CommandLineArgs&) = delete;
    CommandLineArgs& operator=(const CommandLineArgs&) = delete;

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options structure
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;

    /// Help for the subcommand that was used, if parsing got that far
    std::string help_message() const;

private:
    /// Set up the ArgumentParsers for fields of ProgramOptions
    void setup_parser();
    void setup_plan_parser();
    void setup_build_key_parser();
    void setup_grade_parser();

    /// --timeout, --memory and --file-size, shared by the commands that run code
    void add_limit_arguments(argparse::ArgumentParser& parser);

    void add_verbosity_arguments(argparse::ArgumentParser& parser);

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    argparse::ArgumentParser plan_parser_;
    argparse::ArgumentParser build_key_parser_;
    argparse::ArgumentParser grade_parser_;

    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

} // namespace fngrader
