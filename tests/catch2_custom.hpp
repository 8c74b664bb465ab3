#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <string>
#include <string_view>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Hacky way of overriding the stringification behavior for types Catch2 explicitly specializes
// String formatting without being able to see non-graphical chars is VERY annoying
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const char* e) {
    return fmt::format("{:?}", e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_all.hpp>         // IWYU pragma: export
#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

template <typename T>
    requires(fmt::is_formattable<T>::value && !is_range<T>::value && !Catch::Detail::IsStreamInsertable<T>::value)
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", t); }
};

} // namespace Catch

/// Parses a literal that is known to be well formed
inline fngrader::Value lit(std::string_view text) {
    auto res = fngrader::parse_literal(text);

    if (!res) {
        FAIL(fmt::format("bad literal in test {:?}: {}", text, res.error()));
    }

    return res.value();
}

inline std::filesystem::path resource(std::string_view name) {
    return std::filesystem::path{RESOURCES_DIR} / name;
}
