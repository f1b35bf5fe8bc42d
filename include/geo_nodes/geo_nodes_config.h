// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file geo_nodes_config.h
/// @brief Centralized compile-time configuration for geo_nodes and immer.
///
/// Snapshots are built and diffed on a single thread, so immer is configured
/// for its single-threaded policies. This file MUST be included before any
/// immer header; every geo_nodes public header already does so.
///
/// @warning Do NOT include immer headers directly before a geo_nodes header.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(GEO_NODES_CONFIGURED)
#error "immer headers were included before geo_nodes/geo_nodes_config.h. " \
       "Please include geo_nodes headers before any direct immer includes."
#endif

#define GEO_NODES_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic reference counting and lock-free free lists
#ifndef IMMER_NO_THREAD_SAFETY
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
// Boost Settings
// ============================================================

/// @brief Boost.Uuid is header-only; suppress MSVC auto-linking
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Diagnostics
//
// When GEO_NODES_VERBOSE_LOG is non-zero, missing keys, node overwrites,
// absent removals and duplicate registrations are reported on stderr.
//
// Defaults: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef GEO_NODES_VERBOSE_LOG
#  if defined(NDEBUG)
#    define GEO_NODES_VERBOSE_LOG 0
#  else
#    define GEO_NODES_VERBOSE_LOG 1
#  endif
#endif
