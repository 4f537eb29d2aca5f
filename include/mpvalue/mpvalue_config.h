// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file mpvalue_config.h
/// @brief Centralized configuration for mpvalue and immer
///
/// This file defines the compile-time configuration for immer (the persistent
/// containers behind Array and Map nodes) and for mpvalue's own switches.
///
/// It MUST be included before any immer header to ensure consistent settings.
/// All mpvalue public headers include it first, so users who only include
/// mpvalue headers don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(MPVALUE_CONFIGURED)
#error "immer headers were included before mpvalue/mpvalue_config.h. " \
       "Please include mpvalue headers before any direct immer includes."
#endif

#define MPVALUE_CONFIGURED 1

// ============================================================
// Feature Toggle: thread-safe value aliases
// ============================================================

/// @brief Expose SyncValue / SyncArrayBuilder / SyncMapBuilder.
///
/// These use immer::default_memory_policy (atomic refcount + spinlock)
/// and can be handed across threads after conversion.
#ifndef MPVALUE_ENABLE_THREAD_SAFE
#define MPVALUE_ENABLE_THREAD_SAFE 0
#endif

// ============================================================
// Immer Performance Settings
// ============================================================

/// @brief Non-atomic refcounts and lock-free free lists.
///
/// Value trees are built by one conversion call on one thread, so the
/// default Value type never pays for atomics. Left to immer's default when
/// SyncValue is enabled, since the atomic policy depends on it.
#if !MPVALUE_ENABLE_THREAD_SAFE && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Verbose Logging
//
// When MPVALUE_VERBOSE_LOG is 1:
//   - rejected extension-capture calls are logged to stderr
//
// Enabled by default in debug builds, disabled with NDEBUG.
// Contract violations are always logged regardless of this switch.
// ============================================================

#ifndef MPVALUE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define MPVALUE_VERBOSE_LOG 0
#  else
#    define MPVALUE_VERBOSE_LOG 1
#  endif
#endif

#ifdef MPVALUE_CONFIG_VERBOSE
#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#pragma message("mpvalue: immer thread safety DISABLED")
#else
#pragma message("mpvalue: immer thread safety ENABLED")
#endif
#if MPVALUE_VERBOSE_LOG
#pragma message("mpvalue: verbose logging ENABLED")
#endif
#endif // MPVALUE_CONFIG_VERBOSE
