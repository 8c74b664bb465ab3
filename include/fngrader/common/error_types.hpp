#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/common/formatters/enum.hpp>

#include <boost/preprocessor/cat.hpp>

namespace fngrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Program / operation surpassed its wall-clock timeout
    SyscallFailure, ///< A Linux syscall failed
    LaunchFailure,  ///< A program could not be copied, isolated or exec'd
    ParseFailure,   ///< Text did not conform to the literal grammar or the expected shape
    ConfigError,    ///< A spec, limit or option was invalid
    UnknownError,   ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace fngrader

FMT_SERIALIZE_ENUM(::fngrader::ErrorKind, TimedOut, SyscallFailure, LaunchFailure, ParseFailure, ConfigError,
                   UnknownError, MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propagate the error type `e` up
/// the call stack. Otherwise, evaluate to the contained value.
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::fngrader::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        std::forward<decltype(ident)>(ident).value();                                                                  \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, evaluate to the contained value.
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
