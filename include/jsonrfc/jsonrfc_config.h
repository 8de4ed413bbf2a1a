// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file jsonrfc_config.h
/// @brief Centralized compile-time configuration for jsonrfc and its dependencies
///
/// This file defines the configuration for the third-party libraries
/// used by jsonrfc:
///   - immer: persistent containers backing Value
///   - lager: lenses (see pointer_lens.h)
///
/// It MUST be included before any immer or lager header so that every
/// translation unit sees the same memory policy settings. All jsonrfc public
/// headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSONRFC_CONFIGURED)
#error "immer headers were included before jsonrfc/jsonrfc_config.h. " \
       "Please include jsonrfc headers before any direct immer includes."
#endif

#define JSONRFC_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep immer's thread-safe reference counting
///
/// Documents are shared between versions and may be read from several
/// threads at once, so the atomic refcount policy stays enabled.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

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
// Lager Settings
// ============================================================

#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Verbose Logging Configuration
//
// When JSONRFC_VERBOSE_LOG is 1, failed parse/fetch/transform/evaluate
// calls report the failure to stderr (see detail::log_failure in result.h).
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef JSONRFC_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONRFC_VERBOSE_LOG 0
#  else
#    define JSONRFC_VERBOSE_LOG 1
#  endif
#endif
