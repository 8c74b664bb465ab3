#include <fngrader/grading/result_record.hpp>

#include <fngrader/common/expected.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace fngrader {

namespace {

constexpr std::string_view RETURN_VALUE_KEY = "return_value";
constexpr std::string_view HEAP_PARAM_VALUES_KEY = "heap_param_values";

} // namespace

Value result_record_to_value(const ResultRecord& record) {
    Value heap = Value::make_mapping();
    for (const auto& [name, value] : record.heap_param_values) {
        heap.insert_or_assign(Value{name}, value);
    }

    return Value::make_mapping({
        {.key = std::string{RETURN_VALUE_KEY}, .value = record.return_value},
        {.key = std::string{HEAP_PARAM_VALUES_KEY}, .value = std::move(heap)},
    });
}

Value result_records_to_value(const ResultRecords& records) {
    Value::Sequence res;
    res.reserve(records.size());

    for (const ResultRecord& record : records) {
        res.push_back(result_record_to_value(record));
    }

    return Value{std::move(res)};
}

Expected<ResultRecord, std::string> result_record_from_value(const Value& value) {
    const Value* return_value = value.find(Value{std::string{RETURN_VALUE_KEY}});
    const Value* heap = value.find(Value{std::string{HEAP_PARAM_VALUES_KEY}});

    if (return_value == nullptr || heap == nullptr || !heap->is_mapping() || value.as_mapping().size() != 2) {
        return fmt::format("expected a {{{:?}, {:?}}} mapping, got {}", RETURN_VALUE_KEY, HEAP_PARAM_VALUES_KEY,
                           value.is_mapping() ? "a mapping with other keys" : kind_name(value.kind()));
    }

    ResultRecord res{.return_value = *return_value, .heap_param_values = {}};

    for (const MappingEntry& entry : heap->as_mapping()) {
        if (!entry.key.is_text()) {
            return fmt::format("tracked parameter name {} is not text", entry.key);
        }
        res.heap_param_values.insert_or_assign(entry.key.as_text(), entry.value);
    }

    return res;
}

Expected<ResultRecords, std::string> parse_result_records(std::string_view text) {
    auto parsed = parse_literal(text);

    if (!parsed) {
        return fmt::format("output is not a literal: {}", parsed.error());
    }

    if (!parsed->is_sequence()) {
        return fmt::format("output is a {}, not a sequence of results", kind_name(parsed->kind()));
    }

    ResultRecords res;
    const Value::Sequence& entries = parsed->as_sequence();
    res.reserve(entries.size());

    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto record = result_record_from_value(entries[i]);

        if (!record) {
            return fmt::format("result {}: {}", i, record.error());
        }

        res.push_back(std::move(record).value());
    }

    return res;
}

} // namespace fngrader
