// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for video_uploader
 *
 * Central entry point for the kcenon ecosystem integration flags used by
 * the uploader. Include this header instead of testing BUILD_WITH_* macros
 * directly.
 *
 * Feature categories:
 * - KCENON_WITH_*              : System integration flags (inherited from common_system)
 * - VIDEO_UPLOADER_USE_*       : Derived flags consumed by uploader sources
 *
 * Usage:
 * @code
 * #include <kcenon/video_uploader/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto client = std::make_shared<kcenon::network::core::http_client>(timeout);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define VIDEO_UPLOADER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define VIDEO_UPLOADER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

/**
 * @brief Ensure KCENON_WITH_* flags are always available
 *
 * Normally set through CMake compile definitions when the matching kcenon
 * library is found. Defaults are provided here for standalone builds.
 */

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client used by network_http_transport)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in video_uploader
 *
 * logger_system requires common_system, so both must be present.
 */
#ifndef VIDEO_UPLOADER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define VIDEO_UPLOADER_USE_LOGGER_SYSTEM 1
    #else
        #define VIDEO_UPLOADER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef VIDEO_UPLOADER_PRINT_FEATURE_SUMMARY

#pragma message("=== Video Uploader Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available (uploads need a custom http_transport)")
#endif

#pragma message("======================================")

#endif // VIDEO_UPLOADER_PRINT_FEATURE_SUMMARY
