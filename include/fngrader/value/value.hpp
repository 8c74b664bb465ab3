/// \file
/// The engine's value model: everything that can be an argument, a return value, or the post-call
/// state of a tracked parameter.
#pragma once

#include <fngrader/common/formatters/debug.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fngrader {

struct MappingEntry;

class Value
{
public:
    using Integer = boost::multiprecision::cpp_int;
    using Sequence = std::vector<Value>;
    /// Insertion-ordered; keys are unique under `==`
    using Mapping = std::vector<MappingEntry>;

    /// The third state of a tri-state boolean; also what a function returns when it returns nothing
    struct Null
    {
        constexpr bool operator==(const Null&) const = default;
    };

    enum class Kind { Null, Boolean, Integer, Decimal, Text, Sequence, Mapping };

    Value();
    Value(Null null);      // NOLINT(google-explicit-constructor)
    Value(bool boolean);   // NOLINT(google-explicit-constructor)
    Value(Integer integer); // NOLINT(google-explicit-constructor)
    Value(int integer);    // NOLINT(google-explicit-constructor)
    Value(long integer);   // NOLINT(google-explicit-constructor,google-runtime-int)
    Value(long long integer); // NOLINT(google-explicit-constructor,google-runtime-int)
    Value(double decimal);    // NOLINT(google-explicit-constructor)
    Value(std::string text);  // NOLINT(google-explicit-constructor)
    Value(const char* text);  // NOLINT(google-explicit-constructor)
    Value(Sequence sequence); // NOLINT(google-explicit-constructor)

    static Value make_mapping(Mapping entries = {});

    Kind kind() const noexcept;

    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_boolean() const noexcept { return kind() == Kind::Boolean; }
    bool is_tristate() const noexcept { return is_null() || is_boolean(); }
    bool is_integer() const noexcept { return kind() == Kind::Integer; }
    bool is_decimal() const noexcept { return kind() == Kind::Decimal; }
    bool is_number() const noexcept { return is_integer() || is_decimal(); }
    bool is_text() const noexcept { return kind() == Kind::Text; }
    bool is_sequence() const noexcept { return kind() == Kind::Sequence; }
    bool is_mapping() const noexcept { return kind() == Kind::Mapping; }

    /// Whether this value may be used as a mapping key
    bool is_hashable() const noexcept { return !is_sequence() && !is_mapping(); }

    bool as_boolean() const;
    const Integer& as_integer() const;
    double as_decimal() const;
    /// Integers are converted, so this works for any number
    double as_number() const;
    const std::string& as_text() const;
    const Sequence& as_sequence() const;
    Sequence& as_sequence();
    const Mapping& as_mapping() const;

    /// Lookup in a mapping value. Returns nullptr if not a mapping or the key is absent
    const Value* find(const Value& key) const;

    /// Mapping assignment with overwrite-on-collision. The first insertion position of a key is kept.
    void insert_or_assign(Value key, Value value);

    /// Deep structural equality:
    ///  - integers and decimals compare numerically
    ///  - tri-state values never equal numbers
    ///  - mappings compare independently of entry order
    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    struct MappingHolder
    {
        Mapping entries;
    };

    using Storage = std::variant<Null, bool, Integer, double, std::string, Sequence, MappingHolder>;

    Storage data_;
};

struct MappingEntry
{
    Value key;
    Value value;
};

bool operator==(const MappingEntry& lhs, const MappingEntry& rhs);

/// Kind name as used in diagnostics ("integer", "text", ...)
std::string_view kind_name(Value::Kind kind);

} // namespace fngrader

/// Values format as their canonical literal text
template <>
struct fmt::formatter<::fngrader::Value> : ::fngrader::DebugFormatter
{
    fmt::format_context::iterator format(const ::fngrader::Value& from, fmt::format_context& ctx) const;
};
