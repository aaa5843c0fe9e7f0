// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Centralized configuration for jsonb_delta and its dependencies
///
/// This file defines:
///   - compile-time settings for immer (persistent containers)
///   - the default traversal depth limit
///   - the verbose diagnostics switch
///   - Options, the single runtime tunable passed to every recursive operation
///
/// It MUST be included before any immer header. All jsonb_delta public
/// headers include it first, so users of jsonb_delta headers only need to
/// avoid including immer directly ahead of them.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSONB_DELTA_CONFIGURED)
#error "immer headers were included before jsonb_delta/config.h. " \
       "Please include jsonb_delta headers before any direct immer includes."
#endif

#define JSONB_DELTA_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting
///
/// Documents are immutable and may be read by several independent calls at
/// once (one per request in the host), so node refcounts must be atomic.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
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
// Depth Limit
// ============================================================

/// @brief Default maximum traversal/recursion depth
///
/// Applied uniformly by the navigator, the merge engine and the delta
/// engine. Override with -DJSONB_DELTA_DEFAULT_MAX_DEPTH=<n>.
#ifndef JSONB_DELTA_DEFAULT_MAX_DEPTH
#define JSONB_DELTA_DEFAULT_MAX_DEPTH 1000
#endif

// ============================================================
// Verbose Diagnostics
//
// When enabled, every error produced by an operation is also written to
// stderr together with the name of the failing function.
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef JSONB_DELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONB_DELTA_VERBOSE_LOG 0
#  else
#    define JSONB_DELTA_VERBOSE_LOG 1
#  endif
#endif

#include <cstddef>

namespace jsonb_delta {

/// Per-call settings. Every recursive operation takes `const Options&`
/// and threads it down to its helpers.
struct Options {
    /// Maximum number of container levels an operation may descend
    std::size_t max_depth = JSONB_DELTA_DEFAULT_MAX_DEPTH;
};

} // namespace jsonb_delta
