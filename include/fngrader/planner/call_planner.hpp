#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/generator/value_generator.hpp>
#include <fngrader/planner/test_call.hpp>
#include <fngrader/spec/test_spec.hpp>
#include <fngrader/value/value.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fngrader {

using CallPlan = std::vector<TestCall>;

/// Expands specs into concrete calls.
///
/// Each parameter's value list is its literal entries and generated values, concatenated in declaration
/// order. A spec plans max(list lengths) calls (exactly one without parameters); call `i` takes each
/// parameter's value at `i mod (its list length)`.
///
/// Planning draws from a single generator, so planning the same specs in the same order with the
/// same seed always yields the same calls.
class CallPlanner : NonCopyable
{
public:
    explicit CallPlanner(std::uint32_t seed);

    Expected<CallPlan, std::string> plan(const TestSpec& spec);

    /// Specs are planned in order; their calls are concatenated
    Expected<CallPlan, std::string> plan(const TestSuite& suite);

private:
    Expected<std::vector<Value>, std::string> expand_parameter(const Parameter& param);

    ValueGenerator generator_;
};

/// Call plan artifact: `[{"method": ..., "arguments": [...], "tracked": {...}}, ...]`
Value call_plan_to_value(const CallPlan& plan);
std::string serialize_call_plan(const CallPlan& plan);

Expected<CallPlan, std::string> call_plan_from_value(const Value& value);
Expected<CallPlan, std::string> parse_call_plan(std::string_view text);
Expected<CallPlan, std::string> read_call_plan(const std::filesystem::path& path);

} // namespace fngrader
