#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fngrader {

/// What one call produced
struct ResultRecord
{
    /// Null when the function returns nothing
    Value return_value;

    /// Post-call state of each tracked parameter; empty when nothing is tracked
    std::map<std::string, Value> heap_param_values;

    bool operator==(const ResultRecord&) const = default;
};

using ResultRecords = std::vector<ResultRecord>;

/// `{"return_value": ..., "heap_param_values": {...}}`
Value result_record_to_value(const ResultRecord& record);
Value result_records_to_value(const ResultRecords& records);

Expected<ResultRecord, std::string> result_record_from_value(const Value& value);

/// Parses the sequence of records a harness prints
Expected<ResultRecords, std::string> parse_result_records(std::string_view text);

} // namespace fngrader

template <>
struct fmt::formatter<::fngrader::ResultRecord> : ::fngrader::DebugFormatter
{
    auto format(const ::fngrader::ResultRecord& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ::fngrader::result_record_to_value(from));
    }
};
