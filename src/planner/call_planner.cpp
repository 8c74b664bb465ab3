#include <fngrader/planner/call_planner.hpp>

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/overloaded.hpp>
#include <fngrader/common/text_file.hpp>
#include <fngrader/generator/value_generator.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/test_call.hpp>
#include <fngrader/spec/test_spec.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fngrader {

CallPlanner::CallPlanner(std::uint32_t seed)
    : generator_{seed} {}

Expected<std::vector<Value>, std::string> CallPlanner::expand_parameter(const Parameter& param) {
    std::vector<Value> values;

    for (const ParameterEntry& entry : param.entries) {
        std::visit(Overloaded{
                       [&values](const Value& literal) { values.push_back(literal); },
                       [&values, this](const ValueConfig& config) {
                           std::vector<Value> generated = generator_.generate(config);
                           values.insert(values.end(), std::make_move_iterator(generated.begin()),
                                         std::make_move_iterator(generated.end()));
                       },
                   },
                   entry);
    }

    if (values.empty()) {
        return {unexpected, fmt::format("parameter {:?} has no values", param.name)};
    }

    return values;
}

Expected<CallPlan, std::string> CallPlanner::plan(const TestSpec& spec) {
    std::vector<std::vector<Value>> value_lists;

    for (const Parameter& param : spec.params) {
        auto values = expand_parameter(param);

        if (!values) {
            return {unexpected, fmt::format("Cannot plan calls to {}: {}", spec.method, values.error())};
        }

        value_lists.push_back(std::move(values).value());
    }

    std::size_t iterations = 1;
    if (!value_lists.empty()) {
        auto lengths =
            value_lists | ranges::views::transform([](const std::vector<Value>& values) { return values.size(); });
        iterations = ranges::max(lengths);
    }

    CallPlan res;
    res.reserve(iterations);

    for (std::size_t i = 0; i < iterations; ++i) {
        TestCall call{.method = spec.method, .arguments = {}, .tracked = {}};

        for (std::size_t param_idx = 0; param_idx < spec.params.size(); ++param_idx) {
            const std::vector<Value>& values = value_lists[param_idx];
            const Value& chosen = values[i % values.size()];

            call.arguments.push_back(chosen);

            if (spec.is_tracked(spec.params[param_idx].name)) {
                call.tracked.push_back(TrackedArgument{.name = spec.params[param_idx].name, .value = chosen});
            }
        }

        LOG_TRACE("Planned {}", call_expression(call));

        res.push_back(std::move(call));
    }

    LOG_DEBUG("Planned {} calls to {}", res.size(), spec.method);

    return res;
}

Expected<CallPlan, std::string> CallPlanner::plan(const TestSuite& suite) {
    CallPlan res;

    for (const TestSpec& spec : suite) {
        CallPlan calls = TRY(plan(spec));
        res.insert(res.end(), std::make_move_iterator(calls.begin()), std::make_move_iterator(calls.end()));
    }

    return res;
}

Value call_plan_to_value(const CallPlan& plan) {
    Value::Sequence calls;

    for (const TestCall& call : plan) {
        Value tracked = Value::make_mapping();
        for (const TrackedArgument& arg : call.tracked) {
            tracked.insert_or_assign(Value{arg.name}, arg.value);
        }

        calls.push_back(Value::make_mapping({
            {.key = "method", .value = call.method},
            {.key = "arguments", .value = Value{call.arguments}},
            {.key = "tracked", .value = std::move(tracked)},
        }));
    }

    return Value{std::move(calls)};
}

std::string serialize_call_plan(const CallPlan& plan) {
    return to_literal(call_plan_to_value(plan));
}

Expected<CallPlan, std::string> call_plan_from_value(const Value& value) {
    if (!value.is_sequence()) {
        return {unexpected, std::string{"call plan must be a sequence of calls"}};
    }

    CallPlan res;
    const Value::Sequence& calls = value.as_sequence();

    for (std::size_t i = 0; i < calls.size(); ++i) {
        const Value& entry = calls[i];

        const Value* method = entry.find(Value{"method"});
        const Value* arguments = entry.find(Value{"arguments"});
        const Value* tracked = entry.find(Value{"tracked"});

        if (method == nullptr || !method->is_text() || arguments == nullptr || !arguments->is_sequence() ||
            tracked == nullptr || !tracked->is_mapping() || entry.as_mapping().size() != 3) {
            return {unexpected, fmt::format("call {} is not a {{\"method\", \"arguments\", \"tracked\"}} mapping", i)};
        }

        if (!is_identifier(method->as_text())) {
            return {unexpected, fmt::format("call {} names an invalid function {:?}", i, method->as_text())};
        }

        TestCall call{.method = method->as_text(), .arguments = arguments->as_sequence(), .tracked = {}};

        for (const MappingEntry& tracked_entry : tracked->as_mapping()) {
            if (!tracked_entry.key.is_text() || !is_identifier(tracked_entry.key.as_text())) {
                return {unexpected, fmt::format("call {} tracks a parameter with an invalid name", i)};
            }
            call.tracked.push_back(TrackedArgument{.name = tracked_entry.key.as_text(), .value = tracked_entry.value});
        }

        res.push_back(std::move(call));
    }

    return res;
}

Expected<CallPlan, std::string> parse_call_plan(std::string_view text) {
    auto parsed = parse_literal(text);

    if (!parsed) {
        return {unexpected, fmt::format("Malformed call plan: {}", parsed.error())};
    }

    return call_plan_from_value(parsed.value());
}

Expected<CallPlan, std::string> read_call_plan(const std::filesystem::path& path) {
    std::string text = TRY(read_text_file(path));

    auto res = parse_call_plan(text);

    if (!res) {
        return {unexpected, fmt::format("{}: {}", path.string(), res.error())};
    }

    return res;
}

} // namespace fngrader
