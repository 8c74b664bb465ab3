#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fngrader::utf8 {

inline constexpr char32_t max_code_point = 0x10FFFF;

inline constexpr bool is_surrogate(char32_t code) {
    return code >= 0xD800 && code <= 0xDFFF;
}

/// Appends the UTF-8 encoding of `code`.
/// Lone surrogates are encoded like any other code point (the generalized "WTF-8" form), so text
/// drawn from any code range survives a round trip.
inline void append(std::string& out, char32_t code) {
    // NOLINTBEGIN(readability-magic-numbers)
    if (code < 0x80) {
        out.push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
    // NOLINTEND(readability-magic-numbers)
}

/// Decodes one code point starting at `pos`, advancing `pos` past it.
/// Returns nullopt (leaving `pos` untouched) on a malformed or overlong sequence.
inline std::optional<char32_t> decode(std::string_view text, std::size_t& pos) {
    // NOLINTBEGIN(readability-magic-numbers)
    const auto lead = static_cast<unsigned char>(text[pos]);

    std::size_t length = 0;
    char32_t code = 0;
    char32_t min_code = 0;

    if (lead < 0x80) {
        ++pos;
        return lead;
    }
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code = lead & 0x1F;
        min_code = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code = lead & 0x0F;
        min_code = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code = lead & 0x07;
        min_code = 0x10000;
    } else {
        return std::nullopt;
    }

    if (pos + length > text.size()) {
        return std::nullopt;
    }

    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return std::nullopt;
        }
        code = (code << 6) | (cont & 0x3F);
    }
    // NOLINTEND(readability-magic-numbers)

    if (code < min_code || code > max_code_point) {
        return std::nullopt;
    }

    pos += length;
    return code;
}

/// Number of code points in `text`; malformed bytes count as one each
inline std::size_t length(std::string_view text) {
    std::size_t count = 0;

    for (std::size_t pos = 0; pos < text.size(); ++count) {
        if (!decode(text, pos)) {
            ++pos;
        }
    }

    return count;
}

} // namespace fngrader::utf8
