#pragma once

#include <fmt/format.h>

namespace fngrader {

/// Base for formatters that accept an optional '?' spec to select a more verbose rendition
struct DebugFormatter
{
    bool is_debug_format = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        const auto* it = ctx.begin();
        const auto* end = ctx.end();

        if (it != end && *it == '?') {
            is_debug_format = true;
            ++it;
        }

        return it;
    }
};

} // namespace fngrader
