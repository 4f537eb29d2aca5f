// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Error reporting for value conversion.
///
/// Two failure channels exist:
/// - mpvalue::Error, thrown for anything a serialized value can get wrong
///   (malformed extension capture, invalid char). Conversion is atomic: the
///   exception unwinds every open builder and no partial tree escapes.
/// - MPVALUE_CONTRACT, for misuse of the serialization protocol by the
///   producer itself (e.g. a map value supplied with no pending key). It
///   logs and aborts; it is never reachable from input data.

#pragma once

#include "api.h"
#include "log.h"

#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mpvalue {

class MPVALUE_API Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
    explicit Error(const char* message) : std::runtime_error(message) {}

    /// Build an error whose message is every argument streamed in order.
    /// @code
    ///   throw Error::custom("invalid char U+", std::hex, cp);
    /// @endcode
    template <typename... Args>
    [[nodiscard]] static Error custom(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return Error{oss.str()};
    }
};

namespace detail {

/// Logs the violation and aborts. Never returns.
[[noreturn]] MPVALUE_API void contract_failure(
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept;

} // namespace detail

} // namespace mpvalue

/// Check a serialization-protocol precondition. On failure the process
/// aborts; use only for producer bugs, never for data validation.
#define MPVALUE_CONTRACT(cond, message)                      \
    do {                                                     \
        if (!(cond)) {                                       \
            ::mpvalue::detail::contract_failure(message);    \
        }                                                    \
    } while (0)
