#include "catch2_custom.hpp"

#include <fngrader/grading/grade_report.hpp>
#include <fngrader/grading/result_record.hpp>
#include <fngrader/value/value.hpp>

#include "output/literal_serializer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <string_view>

using namespace fngrader;

using Catch::Matchers::ContainsSubstring;

namespace {

class StringSink : public Sink
{
public:
    void write(std::string_view str) override { contents += str; }

    void flush() override { ++flushes; }

    std::string contents;
    int flushes = 0;
};

GradeReport mixed_report() {
    GradeReport report;
    report.total = 2;
    report.passed = 1;

    report.diagnostics.push_back(TestDiagnostic{.index = 0,
                                                .call = "add(1, 2)",
                                                .passed = true,
                                                .expected = ResultRecord{.return_value = 3, .heap_param_values = {}},
                                                .actual = ResultRecord{.return_value = 3, .heap_param_values = {}}});

    report.diagnostics.push_back(
        TestDiagnostic{.index = 1,
                       .call = "push([1], 2)",
                       .passed = false,
                       .expected = ResultRecord{.return_value = {}, .heap_param_values = {{"xs", lit("[1, 2]")}}},
                       .actual = ResultRecord{.return_value = 7, .heap_param_values = {{"xs", lit("[1]")}}}});

    return report;
}

std::string render(const GradeReport& report, VerbosityLevel verbosity) {
    StringSink sink;
    PlainTextSerializer serializer{sink, ProgramOptions::ColorizeOpt::Never, verbosity};

    serializer.on_grade_report(report);
    serializer.finalize();

    CHECK(sink.flushes == 1);

    return sink.contents;
}

} // namespace

TEST_CASE("Verbosity levels select what is shown") {
    using enum VerbosityLevel;

    CHECK_FALSE(should_output_score(Silent));
    CHECK(should_output_score(Quiet));

    CHECK_FALSE(should_output_test(Quiet, false));
    CHECK(should_output_test(Summary, false));
    CHECK_FALSE(should_output_test(Summary, true));
    CHECK(should_output_test(All, true));

    CHECK(should_output_test_details(Summary, false));
    CHECK_FALSE(should_output_test_details(All, true));
    CHECK(should_output_test_details(Extra, true));
}

TEST_CASE("Plain text reports list failures with their details") {
    std::string out = render(mixed_report(), VerbosityLevel::Summary);

    CHECK_THAT(out, !ContainsSubstring("Test #1"));
    CHECK_THAT(out, ContainsSubstring("Test #2 FAILED : push([1], 2)\n"));
    CHECK_THAT(out, ContainsSubstring("return value:"));
    CHECK_THAT(out, ContainsSubstring("expected null | actual 7  <- differs\n"));
    CHECK_THAT(out, ContainsSubstring("xs after the call:"));
    CHECK_THAT(out, ContainsSubstring("expected [1, 2] | actual [1]  <- differs\n"));
    CHECK_THAT(out, ContainsSubstring("1 passed"));
    CHECK_THAT(out, ContainsSubstring("1 failed"));
    CHECK_THAT(out, ContainsSubstring("Score 50.00% (1/2 tests)\n"));

    // Never colored when told not to
    CHECK(out.find('\x1b') == std::string::npos);
}

TEST_CASE("Higher verbosity shows passing tests too") {
    SECTION("All") {
        std::string out = render(mixed_report(), VerbosityLevel::All);

        CHECK_THAT(out, ContainsSubstring("Test #1 PASSED : add(1, 2)\n"));
        CHECK_THAT(out, !ContainsSubstring("expected 3 | actual 3"));
    }

    SECTION("Extra") {
        std::string out = render(mixed_report(), VerbosityLevel::Extra);

        CHECK_THAT(out, ContainsSubstring("expected 3 | actual 3\n"));
    }
}

TEST_CASE("Quiet output omits individual tests") {
    std::string quiet = render(mixed_report(), VerbosityLevel::Quiet);

    CHECK_THAT(quiet, !ContainsSubstring("Test #"));
    CHECK_THAT(quiet, ContainsSubstring("Score 50.00% (1/2 tests)\n"));
    CHECK(render(mixed_report(), VerbosityLevel::Silent).empty());
}

TEST_CASE("Summaries name the outcome") {
    SECTION("All passed") {
        GradeReport report = mixed_report();
        report.diagnostics.pop_back();
        report.total = 1;

        std::string out = render(report, VerbosityLevel::Summary);
        CHECK_THAT(out, ContainsSubstring("All tests passed (1 test)\n"));
        CHECK_THAT(out, ContainsSubstring("Score 100.00% (1/1 test)\n"));
    }

    SECTION("Nothing compared") {
        std::string out = render(GradeReport{}, VerbosityLevel::Summary);
        CHECK_THAT(out, ContainsSubstring("No tests were run\n"));
        CHECK_THAT(out, ContainsSubstring("Score 0.00% (0/0 tests)\n"));
    }

    SECTION("Ungraded") {
        std::string out = render(GradeReport::ungraded("exceeded the time limit of 2000ms"), VerbosityLevel::Summary);
        CHECK(out == "Submission could not be graded: exceeded the time limit of 2000ms\n");
    }

    SECTION("Results without calls are numbered") {
        GradeReport report = mixed_report();
        report.diagnostics[1].call.clear();

        CHECK_THAT(render(report, VerbosityLevel::Summary), ContainsSubstring("Test #2 FAILED : result 1\n"));
    }
}

TEST_CASE("Literal output is one parseable line per report") {
    StringSink sink;
    LiteralSerializer serializer{sink, VerbosityLevel::Summary};

    serializer.on_grade_report(mixed_report());
    serializer.on_grade_report(GradeReport::ungraded("no sandbox"));
    serializer.on_warning("not written to the sink");
    serializer.finalize();

    auto newline = sink.contents.find('\n');
    REQUIRE(newline != std::string::npos);
    REQUIRE(sink.contents.back() == '\n');

    Value first = lit(std::string_view{sink.contents}.substr(0, newline));
    Value second = lit(std::string_view{sink.contents}.substr(newline + 1, sink.contents.size() - newline - 2));

    CHECK(*first.find("passed") == Value{1});
    CHECK(*first.find("total") == Value{2});
    CHECK(first.find("error")->is_null());
    REQUIRE(first.find("tests")->as_sequence().size() == 2);
    CHECK(*first.find("tests")->as_sequence()[1].find("call") == Value{"push([1], 2)"});

    CHECK(*second.find("error") == Value{"no sandbox"});
    CHECK(second.find("tests")->as_sequence().empty());

    CHECK(sink.flushes == 1);

    SECTION("Silent writes nothing") {
        StringSink silent_sink;
        LiteralSerializer silent{silent_sink, VerbosityLevel::Silent};

        silent.on_grade_report(mixed_report());
        CHECK(silent_sink.contents.empty());
    }
}
