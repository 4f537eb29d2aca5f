// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief stderr diagnostics for mpvalue, gated by MPVALUE_VERBOSE_LOG.

#pragma once

#include "mpvalue_config.h"

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace mpvalue {

namespace detail {

inline void log_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if MPVALUE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if MPVALUE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

// Not gated: the process is about to abort.
inline void log_contract_violation(
    std::string_view message,
    const std::source_location& loc) noexcept
{
    std::cerr << "[mpvalue] contract violation: " << message
              << " (in " << loc.function_name() << " at " << loc.file_name()
              << ":" << loc.line() << ")\n";
}

} // namespace detail

} // namespace mpvalue
