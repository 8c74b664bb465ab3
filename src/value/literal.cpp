#include <fngrader/value/literal.hpp>

#include "value/utf8.hpp"

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/value/value.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fngrader {

namespace {

std::string decimal_to_literal(double decimal) {
    if (std::isnan(decimal)) {
        return "nan";
    }
    if (std::isinf(decimal)) {
        return decimal < 0 ? "-inf" : "inf";
    }

    // shortest representation that round-trips
    std::string res = fmt::format("{}", decimal);

    if (res.find_first_of(".eE") == std::string::npos) {
        res += ".0";
    }

    return res;
}

void append_literal(std::string& out, const Value& value) {
    switch (value.kind()) {
    case Value::Kind::Null:
        out += "null";
        return;
    case Value::Kind::Boolean:
        out += value.as_boolean() ? "true" : "false";
        return;
    case Value::Kind::Integer:
        out += value.as_integer().str();
        return;
    case Value::Kind::Decimal:
        out += decimal_to_literal(value.as_decimal());
        return;
    case Value::Kind::Text:
        out += quote_text(value.as_text());
        return;
    case Value::Kind::Sequence: {
        out += '[';
        bool first = true;
        for (const Value& elem : value.as_sequence()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            append_literal(out, elem);
        }
        out += ']';
        return;
    }
    case Value::Kind::Mapping: {
        out += '{';
        bool first = true;
        for (const MappingEntry& entry : value.as_mapping()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            append_literal(out, entry.key);
            out += ": ";
            append_literal(out, entry.value);
        }
        out += '}';
        return;
    }
    }
}

class LiteralParser
{
public:
    explicit LiteralParser(std::string_view text)
        : text_{text} {}

    Expected<Value, LiteralParseError> parse_document() {
        Value res = TRY(parse_value(0));

        skip_whitespace();

        if (pos_ != text_.size()) {
            return error("unexpected trailing input");
        }

        return res;
    }

private:
    // Captured output is untrusted; bound the recursion
    static constexpr std::size_t MAX_DEPTH = 512;

    LiteralParseError error(std::string message) const { return {.offset = pos_, .message = std::move(message)}; }

    bool at_end() const { return pos_ >= text_.size(); }

    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    bool consume_keyword(std::string_view keyword) {
        if (text_.substr(pos_).starts_with(keyword)) {
            pos_ += keyword.size();
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
            ++pos_;
        }
    }

    Expected<Value, LiteralParseError> parse_value(std::size_t depth) {
        if (depth > MAX_DEPTH) {
            return error("values are nested too deeply");
        }

        skip_whitespace();

        if (at_end()) {
            return error("expected a value, found end of input");
        }

        const char first = peek();

        if (first == '"') {
            return TRY(parse_text());
        }
        if (first == '[') {
            return parse_sequence(depth);
        }
        if (first == '{') {
            return parse_mapping(depth);
        }
        if (first == '-' || (first >= '0' && first <= '9')) {
            return parse_number();
        }
        if (consume_keyword("true")) {
            return Value{true};
        }
        if (consume_keyword("false")) {
            return Value{false};
        }
        if (consume_keyword("null")) {
            return Value{Value::Null{}};
        }
        if (consume_keyword("inf")) {
            return Value{std::numeric_limits<double>::infinity()};
        }
        if (consume_keyword("nan")) {
            return Value{std::numeric_limits<double>::quiet_NaN()};
        }

        return error(fmt::format("unexpected character {:?}", first));
    }

    bool consume_digits() {
        const std::size_t start = pos_;
        while (!at_end() && peek() >= '0' && peek() <= '9') {
            ++pos_;
        }
        return pos_ != start;
    }

    Expected<Value, LiteralParseError> parse_number() {
        const std::size_t start = pos_;
        bool is_decimal = false;

        if (peek() == '-') {
            ++pos_;
            if (consume_keyword("inf")) {
                return Value{-std::numeric_limits<double>::infinity()};
            }
        }

        if (!consume_digits()) {
            return error("expected digits");
        }

        if (peek() == '.') {
            ++pos_;
            if (!consume_digits()) {
                return error("expected digits after decimal point");
            }
            is_decimal = true;
        }

        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') {
                ++pos_;
            }
            if (!consume_digits()) {
                return error("expected exponent digits");
            }
            is_decimal = true;
        }

        std::string_view number_text = text_.substr(start, pos_ - start);

        if (!is_decimal) {
            return Value{Value::Integer{std::string{number_text}}};
        }

        double decimal{};
        auto [ptr, ec] = std::from_chars(number_text.data(), number_text.data() + number_text.size(), decimal);

        // out-of-range exponents saturate like Python's float()
        if (ec == std::errc::result_out_of_range) {
            const bool negative = number_text.front() == '-';
            const bool overflow = number_text.find_first_of("eE") != std::string_view::npos &&
                                  number_text[number_text.find_first_of("eE") + 1] != '-';
            if (overflow) {
                decimal = negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
            } else {
                decimal = negative ? -0.0 : 0.0;
            }
        } else if (ec != std::errc{} || ptr != number_text.data() + number_text.size()) {
            pos_ = start;
            return error(fmt::format("malformed number {:?}", number_text));
        }

        return Value{decimal};
    }

    Expected<char32_t, LiteralParseError> parse_hex_escape(std::size_t digits) {
        if (pos_ + digits > text_.size()) {
            return error("truncated unicode escape");
        }

        std::string_view hex = text_.substr(pos_, digits);
        std::uint32_t code{};
        auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code, /*base=*/16);

        if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
            return error(fmt::format("malformed unicode escape {:?}", hex));
        }

        if (code > utf8::max_code_point) {
            return error(fmt::format("code point {:#x} is out of range", code));
        }

        pos_ += digits;
        return static_cast<char32_t>(code);
    }

    Expected<std::string, LiteralParseError> parse_text() {
        ++pos_; // opening quote
        std::string res;

        while (true) {
            if (at_end()) {
                return error("unterminated text");
            }

            const char curr = peek();

            if (curr == '"') {
                ++pos_;
                return res;
            }

            if (static_cast<unsigned char>(curr) < 0x20) { // NOLINT(readability-magic-numbers)
                return error("raw control character in text");
            }

            if (curr != '\\') {
                std::size_t next = pos_;
                auto code = utf8::decode(text_, next);
                if (!code) {
                    return error("invalid UTF-8 in text");
                }
                res.append(text_.substr(pos_, next - pos_));
                pos_ = next;
                continue;
            }

            ++pos_;
            if (at_end()) {
                return error("unterminated escape");
            }

            const char escape = peek();
            ++pos_;

            switch (escape) {
            case '"':
                res += '"';
                break;
            case '\\':
                res += '\\';
                break;
            case 'n':
                res += '\n';
                break;
            case 'r':
                res += '\r';
                break;
            case 't':
                res += '\t';
                break;
            case 'u':
                utf8::append(res, TRY(parse_hex_escape(4)));
                break;
            case 'U':
                utf8::append(res, TRY(parse_hex_escape(8))); // NOLINT(readability-magic-numbers)
                break;
            default:
                --pos_;
                return error(fmt::format("unknown escape \\{}", escape));
            }
        }
    }

    Expected<Value, LiteralParseError> parse_sequence(std::size_t depth) {
        ++pos_; // '['
        Value::Sequence elems;

        skip_whitespace();
        if (peek() == ']') {
            ++pos_;
            return Value{std::move(elems)};
        }

        while (true) {
            elems.push_back(TRY(parse_value(depth + 1)));

            skip_whitespace();

            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                return Value{std::move(elems)};
            }

            return error("expected ',' or ']' in sequence");
        }
    }

    Expected<Value, LiteralParseError> parse_mapping(std::size_t depth) {
        ++pos_; // '{'
        Value res = Value::make_mapping();

        skip_whitespace();
        if (peek() == '}') {
            ++pos_;
            return res;
        }

        while (true) {
            skip_whitespace();
            const std::size_t key_offset = pos_;

            Value key = TRY(parse_value(depth + 1));

            if (!key.is_hashable()) {
                return LiteralParseError{.offset = key_offset,
                                         .message = fmt::format("a {} cannot be a mapping key", kind_name(key.kind()))};
            }

            skip_whitespace();
            if (peek() != ':') {
                return error("expected ':' after mapping key");
            }
            ++pos_;

            Value value = TRY(parse_value(depth + 1));
            res.insert_or_assign(std::move(key), std::move(value));

            skip_whitespace();

            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                return res;
            }

            return error("expected ',' or '}' in mapping");
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // namespace

std::string quote_text(std::string_view text) {
    std::string res;
    res.reserve(text.size() + 2);
    res += '"';

    for (std::size_t pos = 0; pos < text.size();) {
        const std::size_t start = pos;
        auto code = utf8::decode(text, pos);

        if (!code) {
            // not produced by the parser or generator; keep the byte as its Latin-1 code point
            res += fmt::format("\\u{:04x}", static_cast<unsigned char>(text[pos]));
            ++pos;
            continue;
        }

        switch (*code) {
        case '"':
            res += "\\\"";
            break;
        case '\\':
            res += "\\\\";
            break;
        case '\n':
            res += "\\n";
            break;
        case '\r':
            res += "\\r";
            break;
        case '\t':
            res += "\\t";
            break;
        default:
            // NOLINTNEXTLINE(readability-magic-numbers)
            if (*code < 0x20 || *code == 0x7F || utf8::is_surrogate(*code)) {
                res += fmt::format("\\u{:04x}", static_cast<std::uint32_t>(*code));
            } else {
                res.append(text.substr(start, pos - start));
            }
        }
    }

    res += '"';
    return res;
}

std::string to_literal(const Value& value) {
    std::string res;
    append_literal(res, value);
    return res;
}

Expected<Value, LiteralParseError> parse_literal(std::string_view text) {
    return LiteralParser{text}.parse_document();
}

} // namespace fngrader
