/// \file
/// Declarative constraints from which the ValueGenerator draws candidate values
#pragma once

#include <fngrader/common/formatters/enum.hpp>
#include <fngrader/value/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fngrader {

struct ValueConfig;

struct NumberConfig
{
    /// Inclusive bounds. In integer mode these are truncated toward zero before use.
    Value lower{0};
    Value upper{100};

    /// Number of decimal places; integers are generated when absent
    std::optional<int> decimal;

    std::vector<Value> exclude;
};

enum class CaseTransform { None, Upper, Lower, Random };

struct TextConfig
{
    /// Inclusive length bounds, in code points
    std::size_t lower_len = 0;
    std::size_t upper_len = 10;

    /// Inclusive code point range each character is drawn from
    char32_t char_min = 32;  // NOLINT(readability-magic-numbers)
    char32_t char_max = 126; // NOLINT(readability-magic-numbers)

    /// Values equal to or containing any of these are rejected
    std::vector<std::string> exclude;

    /// Applied after drawing. Only affects ASCII letters.
    CaseTransform case_transform = CaseTransform::None;
};

/// Sampled with replacement; duplicates are expected
struct TriStateConfig
{
    bool include_true = true;
    bool include_false = true;
    bool include_null = true;
};

/// Each generated sequence holds exactly one value per element config, in order
struct SequenceConfig
{
    std::vector<ValueConfig> elements;
};

/// Keys and values are paired positionally; the shorter list truncates the pairing
struct MappingConfig
{
    std::vector<ValueConfig> keys;
    std::vector<ValueConfig> values;
};

struct ValueConfig
{
    static constexpr std::size_t DEFAULT_TOTAL_TESTS = 10;

    std::variant<NumberConfig, TextConfig, TriStateConfig, SequenceConfig, MappingConfig> type;

    /// Requested number of values
    std::size_t total_tests = DEFAULT_TOTAL_TESTS;
};

} // namespace fngrader

FMT_SERIALIZE_ENUM(::fngrader::CaseTransform, None, Upper, Lower, Random);
