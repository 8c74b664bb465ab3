#include <fngrader/planner/test_call.hpp>

#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <string_view>

namespace fngrader {

std::string call_expression(const TestCall& call) {
    auto args = call.arguments | ranges::views::transform([](const Value& arg) { return to_literal(arg); });

    return fmt::format("{}({})", call.method, fmt::join(args, ", "));
}

bool is_identifier(std::string_view name) {
    auto is_alpha = [](char chr) { return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || chr == '_'; };
    auto is_alnum = [&is_alpha](char chr) { return is_alpha(chr) || (chr >= '0' && chr <= '9'); };

    return !name.empty() && is_alpha(name.front()) && ranges::all_of(name.substr(1), is_alnum);
}

} // namespace fngrader
