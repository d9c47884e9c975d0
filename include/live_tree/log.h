// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging helpers (stderr, gated by LIVE_TREE_VERBOSE_LOG).

#pragma once

#include <live_tree/live_tree_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace live_tree {
namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if LIVE_TREE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if LIVE_TREE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if LIVE_TREE_VERBOSE_LOG
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

/// Scope lifecycle events (invalidation, rollback replay)
inline void log_scope_event(
    std::string_view origin,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if LIVE_TREE_VERBOSE_LOG
    std::cerr << "[scope " << origin << "] " << message
              << " (" << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)origin;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail
} // namespace live_tree
