// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file jsoncmp_config.h
/// @brief Centralized configuration for jsoncmp and its dependencies
///
/// This file defines the compile-time configuration for the third-party libraries
/// used by jsoncmp:
///   - immer: Immutable data structures backing Value
///   - lager: Store used by CompareSession
///   - zug:   Transducers (pulled in by lager)
///
/// It MUST be included before any library headers to ensure consistent settings.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSONCMP_CONFIGURED)
#error "immer headers were included before jsoncmp/jsoncmp_config.h. " \
       "Please include jsoncmp headers before any direct immer includes."
#endif

#define JSONCMP_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting.
///
/// Define IMMER_NO_THREAD_SAFETY=1 before including jsoncmp headers to trade
/// cross-thread sharing of Value trees for faster single-threaded refcounts.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose Logging Configuration
//
// When JSONCMP_VERBOSE_LOG is 1:
//   - Value::at() misses and invalid JSON pointers log to stderr
//   - from_json() failures log to stderr
//
// By default, verbose logging is DISABLED in release builds
// and ENABLED in debug builds.
// ============================================================

#ifndef JSONCMP_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONCMP_VERBOSE_LOG 0
#  else
#    define JSONCMP_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Reader Limits
// ============================================================

/// @brief Default nesting limit used by ParseOptions::max_depth
#ifndef JSONCMP_DEFAULT_MAX_DEPTH
#define JSONCMP_DEFAULT_MAX_DEPTH 512
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSONCMP_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("jsoncmp: immer thread safety DISABLED")
#else
#pragma message("jsoncmp: immer thread safety ENABLED")
#endif

#if JSONCMP_VERBOSE_LOG
#pragma message("jsoncmp: verbose access logging ENABLED")
#endif
#endif // JSONCMP_CONFIG_VERBOSE
