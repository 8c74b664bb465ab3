/// \file
/// The engine-owned literal grammar. One text form is used for call expressions, captured harness
/// output, spec files and every persisted artifact.
#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace fngrader {

struct LiteralParseError
{
    /// Byte offset into the parsed text
    std::size_t offset;
    std::string message;

    bool operator==(const LiteralParseError&) const = default;

    friend std::string format_as(const LiteralParseError& from) {
        return fmt::format("{} (at byte offset {})", from.message, from.offset);
    }
};

/// Canonical serialization. `parse_literal(to_literal(v)) == v` for every value.
std::string to_literal(const Value& value);

/// Serialize text with quotes and escapes, as `to_literal` would
std::string quote_text(std::string_view text);

Expected<Value, LiteralParseError> parse_literal(std::string_view text);

} // namespace fngrader
