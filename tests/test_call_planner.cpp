#include "catch2_custom.hpp"

#include <fngrader/common/expected.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/planner/test_call.hpp>
#include <fngrader/spec/spec_reader.hpp>
#include <fngrader/spec/test_spec.hpp>
#include <fngrader/value/value.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <string>
#include <string_view>

using namespace fngrader;
using namespace std::string_view_literals;

using Catch::Matchers::ContainsSubstring;

namespace {

TestSuite suite_of(std::string_view text) {
    auto res = parse_test_suite(text);

    if (!res) {
        FAIL(res.error());
    }

    return res.value();
}

CallPlan plan_of(std::string_view text, std::uint32_t seed = 0) {
    CallPlanner planner{seed};

    auto res = planner.plan(suite_of(text));

    if (!res) {
        FAIL(res.error());
    }

    return res.value();
}

} // namespace

TEST_CASE("Shorter value lists cycle through the longest") {
    CallPlan plan = plan_of(R"({"method": "add", "params": {"a": [1, 2, 3, 4, 5], "b": [10, 20]}})"sv);

    REQUIRE(plan.size() == 5);

    CHECK(plan[0].arguments == Value::Sequence{1, 10});
    CHECK(plan[1].arguments == Value::Sequence{2, 20});
    CHECK(plan[2].arguments == Value::Sequence{3, 10});
    CHECK(plan[3].arguments == Value::Sequence{4, 20});
    CHECK(plan[4].arguments == Value::Sequence{5, 10});

    for (const TestCall& call : plan) {
        CHECK(call.method == "add");
        CHECK(call.tracked.empty());
    }
}

TEST_CASE("A function without parameters is called once") {
    CallPlan plan = plan_of(R"({"method": "answer"})"sv);

    REQUIRE(plan.size() == 1);
    CHECK(plan.front().arguments.empty());
    CHECK(call_expression(plan.front()) == "answer()");
}

TEST_CASE("Literals come before generated values in declaration order") {
    CallPlan plan =
        plan_of(R"({"method": "f", "params": {"x": [-1, {"type": "num", "lower": 5, "upper": 5}, -2]}})"sv);

    REQUIRE(plan.size() == 3);
    CHECK(plan[0].arguments.front() == Value{-1});
    CHECK(plan[1].arguments.front() == Value{5});
    CHECK(plan[2].arguments.front() == Value{-2});
}

TEST_CASE("Tracked arguments mirror the call's arguments") {
    CallPlan plan = plan_of(R"({"method": "push", "params": {"xs": [[1], [2, 3]], "x": [9]}, "track": ["xs"]})"sv);

    REQUIRE(plan.size() == 2);

    for (const TestCall& call : plan) {
        REQUIRE(call.tracked.size() == 1);
        CHECK(call.tracked.front().name == "xs");
        CHECK(call.tracked.front().value == call.arguments.front());
    }
}

TEST_CASE("Suites concatenate their specs' calls") {
    CallPlan plan = plan_of(R"([{"method": "f", "params": {"x": [1, 2]}}, {"method": "g"}])"sv);

    REQUIRE(plan.size() == 3);
    CHECK(plan[0].method == "f");
    CHECK(plan[1].method == "f");
    CHECK(plan[2].method == "g");
}

TEST_CASE("A parameter without values cannot be planned") {
    CallPlanner planner{0};

    SECTION("Empty list") {
        auto res = planner.plan(suite_of(R"({"method": "f", "params": {"x": []}})"sv));
        REQUIRE(res.has_error());
        CHECK(res.error() == R"(Cannot plan calls to f: parameter "x" has no values)");
    }

    SECTION("Generator yields nothing") {
        auto res = planner.plan(
            suite_of(R"({"method": "f", "params": {"x": [{"type": "bool_or_none", "include_true": false,
                         "include_false": false, "include_none": false}]}})"sv));
        REQUIRE(res.has_error());
        CHECK_THAT(res.error(), ContainsSubstring("has no values"));
    }
}

TEST_CASE("Planning is deterministic for a seed") {
    constexpr auto spec = R"([{"method": "f", "params": {"s": [{"type": "string"}], "n": [{"type": "num"}]}},
                              {"method": "g", "params": {"d": [{"type": "dict", "keys": [{"type": "num"}],
                                                                "values": [{"type": "bool_or_none"}]}]}}])"sv;

    CallPlan first = plan_of(spec, 1234);
    CallPlan second = plan_of(spec, 1234);
    CallPlan other = plan_of(spec, 4321);

    CHECK(first == second);
    CHECK_FALSE(first == other);
}

TEST_CASE("Call plans survive serialization") {
    CallPlan plan =
        plan_of(R"({"method": "f", "params": {"xs": [[1, "a"], {"k": null}], "y": [2.5]}, "track": ["xs"]})"sv);

    std::string text = serialize_call_plan(plan);
    CHECK(text == R"([{"method": "f", "arguments": [[1, "a"], 2.5], "tracked": {"xs": [1, "a"]}}, )"
                  R"({"method": "f", "arguments": [{"k": null}, 2.5], "tracked": {"xs": {"k": null}}}])");

    auto parsed = parse_call_plan(text);
    REQUIRE(parsed);
    CHECK(parsed.value() == plan);
}

TEST_CASE("Malformed call plans are rejected") {
    CHECK_THAT(parse_call_plan("[").error(), ContainsSubstring("Malformed call plan"));
    CHECK(parse_call_plan("{}").error() == "call plan must be a sequence of calls");
    CHECK(parse_call_plan(R"([{"method": "f", "arguments": []}])").error() ==
          R"(call 0 is not a {"method", "arguments", "tracked"} mapping)");
    CHECK(parse_call_plan(R"([{"method": "os.system", "arguments": [], "tracked": {}}])").error() ==
          R"(call 0 names an invalid function "os.system")");
    CHECK(parse_call_plan(R"([{"method": "f", "arguments": [], "tracked": {"a b": 1}}])").error() ==
          "call 0 tracks a parameter with an invalid name");
}

TEST_CASE("Identifiers are plain ASCII names") {
    CHECK(is_identifier("snake_case"));
    CHECK(is_identifier("_private1"));
    CHECK_FALSE(is_identifier(""));
    CHECK_FALSE(is_identifier("1st"));
    CHECK_FALSE(is_identifier("a-b"));
    CHECK_FALSE(is_identifier("f()"));
}
