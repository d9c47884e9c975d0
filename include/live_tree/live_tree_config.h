// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file live_tree_config.h
/// @brief Centralized compile-time configuration for live_tree and immer.
///
/// live_tree is single-threaded by contract (views, caches and the store
/// adapter are never touched from two threads at once), so immer is
/// configured without atomic reference counting.
///
/// It MUST be included before any immer header. All live_tree public
/// headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(LIVE_TREE_CONFIGURED)
#error "immer headers were included before live_tree/live_tree_config.h. " \
       "Please include live_tree headers before any direct immer includes."
#endif

#define LIVE_TREE_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic reference counting and lock-free free lists
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief No type tags in immer nodes
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

// ============================================================
// Verbose Logging
//
// When LIVE_TREE_VERBOSE_LOG is 1, rejected accesses, scope
// invalidations and rollback replays are reported on stderr.
//
// Default: enabled in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef LIVE_TREE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define LIVE_TREE_VERBOSE_LOG 0
#  else
#    define LIVE_TREE_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Scope Origins
// ============================================================

/// @brief Prefix of the origin tag generated for scopes opened without one
#ifndef LIVE_TREE_SCOPE_ORIGIN_PREFIX
#define LIVE_TREE_SCOPE_ORIGIN_PREFIX "live_tree.scope#"
#endif
