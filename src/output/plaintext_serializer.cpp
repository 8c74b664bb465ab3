#include "output/plaintext_serializer.hpp"

#include <fngrader/grading/grade_report.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/value/value.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace fngrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_grade_report(const GradeReport& report) {
    if (!report.is_graded()) {
        if (should_output_score(verbosity_)) {
            on_error(fmt::format("Submission could not be graded: {}", *report.error));
        }
        return;
    }

    for (const TestDiagnostic& diagnostic : report.diagnostics) {
        output_test(diagnostic);
    }

    output_summary(report);
}

void PlainTextSerializer::output_test(const TestDiagnostic& diagnostic) {
    if (!should_output_test(verbosity_, diagnostic.passed)) {
        return;
    }

    std::string result_str;

    if (diagnostic.passed) {
        result_str = style_str("PASSED", SUCCESS_STYLE);
    } else {
        result_str = style_str("FAILED", ERROR_STYLE);
    }

    std::string call_text = diagnostic.call.empty() ? fmt::format("result {}", diagnostic.index) : diagnostic.call;

    std::string out =
        fmt::format("Test #{} {} : {}\n", diagnostic.index + 1, result_str, style(call_text, VALUE_STYLE));

    if (should_output_test_details(verbosity_, diagnostic.passed)) {
        out += comparison_line("return value", diagnostic.expected.return_value, diagnostic.actual.return_value);

        const auto& expected_heap = diagnostic.expected.heap_param_values;
        const auto& actual_heap = diagnostic.actual.heap_param_values;

        for (const auto& [name, expected] : expected_heap) {
            auto actual = actual_heap.find(name);
            out += comparison_line(fmt::format("{} after the call", name), expected,
                                   actual == actual_heap.end() ? std::nullopt : std::optional{actual->second});
        }

        for (const auto& [name, actual] : actual_heap) {
            if (!expected_heap.contains(name)) {
                out += comparison_line(fmt::format("{} after the call", name), std::nullopt, actual);
            }
        }
    }

    sink_.write(out);
}

std::string PlainTextSerializer::comparison_line(std::string_view label, const std::optional<Value>& expected,
                                                 const std::optional<Value>& actual) const {
    auto value_text = [this](const std::optional<Value>& value) {
        if (!value) {
            return style_str("<missing>", WARNING_STYLE);
        }
        return style_str(*value, VALUE_STYLE);
    };

    bool matches = expected && actual && *expected == *actual;

    return fmt::format("    {:<24} expected {} | actual {}{}\n", fmt::format("{}:", label), value_text(expected),
                       value_text(actual), matches ? "" : style_str("  <- differs", ERROR_STYLE));
}

void PlainTextSerializer::output_summary(const GradeReport& report) {
    if (!should_output_score(verbosity_)) {
        return;
    }

    std::string out;

    if (should_output_test(verbosity_, /*passed=*/false) && !report.diagnostics.empty()) {
        out += LINE_DIVIDER(terminal_width_) + "\n";
    }

    // Mostly copying Catch2's result summary format for now, so credit to them for the following

    if (report.total == 0) {
        out += style_str("No tests were run", WARNING_STYLE) + "\n";
    } else if (report.all_passed()) {
        out += fmt::format("{} ({} {})\n", style_str("All tests passed", SUCCESS_STYLE), report.total,
                           pluralize("test", report.total));
    } else {
        // We would need >99999 tests for this to look off
        static constexpr std::size_t field_width = 12;

        std::size_t num_failed = report.total - report.passed;

        std::string total_msg = fmt::format("{} total", report.total);
        std::string passed_msg = fmt::format("{} passed", report.passed);
        std::string failed_msg = fmt::format("{} failed", num_failed);

        out += fmt::format("{0:<{4}}: {1:>{4}} | {2:>{4}} | {3:>{4}}\n", "Tests", total_msg,
                           style(passed_msg, SUCCESS_STYLE), style(failed_msg, ERROR_STYLE), field_width);
    }

    double percentage =
        report.total == 0 ? 0.0 : 100.0 * static_cast<double>(report.passed) / static_cast<double>(report.total);

    out += fmt::format("Score {}\n", style_str(fmt::format("{:.2f}% ({}/{} {})", percentage, report.passed,
                                                           report.total, pluralize("test", report.total)),
                                               POP_OUT_STYLE));

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    std::string out = style_str(what, WARNING_STYLE) + "\n";
    sink_.write(out);
}

void PlainTextSerializer::on_error(std::string_view what) {
    std::string out = style_str(what, ERROR_STYLE) + "\n";
    sink_.write(out);
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix,
                                           std::size_t replace_last_chars) {
    if (count == 1) {
        return std::string{root};
    }

    root.remove_suffix(replace_last_chars);

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    std::size_t res = width.value_or(DEFAULT_WIDTH);

    return res == 0 ? DEFAULT_WIDTH : res;
}

} // namespace fngrader
