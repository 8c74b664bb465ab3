#include <fngrader/value/value.hpp>

#include <fngrader/common/overloaded.hpp>
#include <fngrader/value/literal.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <cmath>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace fngrader {

Value::Value()
    : data_{Null{}} {}

Value::Value(Null null)
    : data_{null} {}

Value::Value(bool boolean)
    : data_{boolean} {}

Value::Value(Integer integer)
    : data_{std::move(integer)} {}

Value::Value(int integer)
    : data_{Integer{integer}} {}

Value::Value(long integer) // NOLINT(google-runtime-int)
    : data_{Integer{integer}} {}

Value::Value(long long integer) // NOLINT(google-runtime-int)
    : data_{Integer{integer}} {}

Value::Value(double decimal)
    : data_{decimal} {}

Value::Value(std::string text)
    : data_{std::move(text)} {}

Value::Value(const char* text)
    : data_{std::string{text}} {}

Value::Value(Sequence sequence)
    : data_{std::move(sequence)} {}

Value Value::make_mapping(Mapping entries) {
    Value result;
    result.data_ = MappingHolder{};

    for (MappingEntry& entry : entries) {
        result.insert_or_assign(std::move(entry.key), std::move(entry.value));
    }

    return result;
}

Value::Kind Value::kind() const noexcept {
    return std::visit(Overloaded{
                          [](const Null&) { return Kind::Null; },
                          [](bool) { return Kind::Boolean; },
                          [](const Integer&) { return Kind::Integer; },
                          [](double) { return Kind::Decimal; },
                          [](const std::string&) { return Kind::Text; },
                          [](const Sequence&) { return Kind::Sequence; },
                          [](const MappingHolder&) { return Kind::Mapping; },
                      },
                      data_);
}

bool Value::as_boolean() const {
    ASSERT(is_boolean(), kind_name(kind()));
    return std::get<bool>(data_);
}

const Value::Integer& Value::as_integer() const {
    ASSERT(is_integer(), kind_name(kind()));
    return std::get<Integer>(data_);
}

double Value::as_decimal() const {
    ASSERT(is_decimal(), kind_name(kind()));
    return std::get<double>(data_);
}

double Value::as_number() const {
    if (is_integer()) {
        return as_integer().convert_to<double>();
    }
    return as_decimal();
}

const std::string& Value::as_text() const {
    ASSERT(is_text(), kind_name(kind()));
    return std::get<std::string>(data_);
}

const Value::Sequence& Value::as_sequence() const {
    ASSERT(is_sequence(), kind_name(kind()));
    return std::get<Sequence>(data_);
}

Value::Sequence& Value::as_sequence() {
    ASSERT(is_sequence(), kind_name(kind()));
    return std::get<Sequence>(data_);
}

const Value::Mapping& Value::as_mapping() const {
    ASSERT(is_mapping(), kind_name(kind()));
    return std::get<MappingHolder>(data_).entries;
}

const Value* Value::find(const Value& key) const {
    if (!is_mapping()) {
        return nullptr;
    }

    const Mapping& entries = as_mapping();
    auto iter = ranges::find_if(entries, [&key](const MappingEntry& entry) { return entry.key == key; });

    if (iter == entries.end()) {
        return nullptr;
    }

    return &iter->value;
}

void Value::insert_or_assign(Value key, Value value) {
    ASSERT(is_mapping(), kind_name(kind()));
    ASSERT(key.is_hashable(), kind_name(key.kind()));

    Mapping& entries = std::get<MappingHolder>(data_).entries;
    auto iter = ranges::find_if(entries, [&key](const MappingEntry& entry) { return entry.key == key; });

    if (iter != entries.end()) {
        iter->value = std::move(value);
        return;
    }

    entries.push_back(MappingEntry{.key = std::move(key), .value = std::move(value)});
}

namespace {

bool integer_equals_decimal(const Value::Integer& integer, double decimal) {
    if (!std::isfinite(decimal) || std::trunc(decimal) != decimal) {
        return false;
    }

    return integer == Value::Integer{decimal};
}

bool numbers_equal(const Value& lhs, const Value& rhs) {
    if (lhs.is_integer() && rhs.is_integer()) {
        return lhs.as_integer() == rhs.as_integer();
    }
    if (lhs.is_decimal() && rhs.is_decimal()) {
        // Equality is structural: a nan result matches a nan answer
        if (std::isnan(lhs.as_decimal()) || std::isnan(rhs.as_decimal())) {
            return std::isnan(lhs.as_decimal()) && std::isnan(rhs.as_decimal());
        }
        return lhs.as_decimal() == rhs.as_decimal();
    }
    if (lhs.is_integer()) {
        return integer_equals_decimal(lhs.as_integer(), rhs.as_decimal());
    }
    return integer_equals_decimal(rhs.as_integer(), lhs.as_decimal());
}

bool mappings_equal(const Value::Mapping& lhs, const Value::Mapping& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    // keys are unique within a mapping, so one-directional containment with equal sizes suffices
    return ranges::all_of(lhs, [&rhs](const MappingEntry& entry) {
        auto iter = ranges::find_if(rhs, [&entry](const MappingEntry& other) { return other.key == entry.key; });
        return iter != rhs.end() && iter->value == entry.value;
    });
}

} // namespace

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.is_number() && rhs.is_number()) {
        return numbers_equal(lhs, rhs);
    }

    if (lhs.kind() != rhs.kind()) {
        return false;
    }

    switch (lhs.kind()) {
    case Value::Kind::Null:
        return true;
    case Value::Kind::Boolean:
        return lhs.as_boolean() == rhs.as_boolean();
    case Value::Kind::Text:
        return lhs.as_text() == rhs.as_text();
    case Value::Kind::Sequence:
        return ranges::equal(lhs.as_sequence(), rhs.as_sequence());
    case Value::Kind::Mapping:
        return mappings_equal(lhs.as_mapping(), rhs.as_mapping());
    case Value::Kind::Integer:
    case Value::Kind::Decimal:
        break;
    }

    UNREACHABLE();
}

bool operator==(const MappingEntry& lhs, const MappingEntry& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

std::string_view kind_name(Value::Kind kind) {
    switch (kind) {
    case Value::Kind::Null:
        return "null";
    case Value::Kind::Boolean:
        return "boolean";
    case Value::Kind::Integer:
        return "integer";
    case Value::Kind::Decimal:
        return "decimal";
    case Value::Kind::Text:
        return "text";
    case Value::Kind::Sequence:
        return "sequence";
    case Value::Kind::Mapping:
        return "mapping";
    }

    return "<unknown>";
}

} // namespace fngrader

fmt::format_context::iterator fmt::formatter<::fngrader::Value>::format(const ::fngrader::Value& from,
                                                                          fmt::format_context& ctx) const {
    if (is_debug_format) {
        return fmt::format_to(ctx.out(), "Value{{{}: {}}}", ::fngrader::kind_name(from.kind()),
                              ::fngrader::to_literal(from));
    }

    return fmt::format_to(ctx.out(), "{}", ::fngrader::to_literal(from));
}
