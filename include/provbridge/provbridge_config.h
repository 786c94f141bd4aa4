// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file provbridge_config.h
/// @brief Centralized configuration for provbridge and its dependencies
///
/// This file defines the compile-time configuration for all third-party libraries
/// used by provbridge:
///   - immer: Immutable containers backing every value tree
///   - lager / zug: Lenses for path-addressed access
///   - boost: container_hash for structural set hashing
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All provbridge public headers already include this file.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(PROVBRIDGE_CONFIGURED)
#error "immer headers were included before provbridge/provbridge_config.h. " \
       "Please include provbridge headers before any direct immer includes."
#endif

#define PROVBRIDGE_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting.
///
/// Diff requests for different resources run concurrently on the RPC
/// worker threads, and a decoded state may be handed from the thread that
/// parsed it to the one that diffs it.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions
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
// Lager / Zug Settings
// ============================================================

#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Disable Boost auto-linking (MSVC); only header-only parts are used
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When PROVBRIDGE_VERBOSE_LOG is 1, path lookups that miss, set elements
// without identity, dropped inputs and per-resource failures are logged
// to stderr. Enabled in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef PROVBRIDGE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define PROVBRIDGE_VERBOSE_LOG 0
#  else
#    define PROVBRIDGE_VERBOSE_LOG 1
#  endif
#endif

#ifdef PROVBRIDGE_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("provbridge: immer thread safety DISABLED")
#else
#pragma message("provbridge: immer thread safety ENABLED")
#endif
#endif // PROVBRIDGE_CONFIG_VERBOSE
