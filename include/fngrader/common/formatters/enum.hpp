#pragma once

#include <fngrader/common/formatters/debug.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>
#include <fmt/format.h>

#include <optional>
#include <string_view>

#define FMT_SERIALIZE_ENUM_CASE_IMPL(r, enum_name, ident)                                                              \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Generates a fmt::formatter for an enumeration, printing enumerator names.
/// The debug spec ('?') prefixes the enumeration's name: `ErrorKind{TimedOut}`
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::fngrader::DebugFormatter                                                      \
    {                                                                                                                  \
        static constexpr std::optional<std::string_view> enum_to_str(enum_name from) {                               \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(FMT_SERIALIZE_ENUM_CASE_IMPL, enum_name, BOOST_PP_TUPLE_TO_SEQ((__VA_ARGS__)))   \
            default:                                                                                                   \
                return std::nullopt;                                                                                   \
            }                                                                                                          \
        }                                                                                                              \
                                                                                                                       \
        auto format(const enum_name& from, fmt::format_context& ctx) const {                                           \
            auto res = enum_to_str(from);                                                                              \
                                                                                                                       \
            if (!res) {                                                                                                \
                return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));                             \
            }                                                                                                          \
            if (is_debug_format) {                                                                                     \
                return fmt::format_to(ctx.out(), "{}{{{}}}", #enum_name, *res);                                        \
            }                                                                                                          \
            return fmt::format_to(ctx.out(), "{}", *res);                                                              \
        }                                                                                                              \
    }
