// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for segment_transfer
 *
 * Central entry point for integration flags. The build defines
 * BUILD_WITH_COMMON_SYSTEM / BUILD_WITH_LOGGER_SYSTEM when the matching
 * kcenon ecosystem packages are found; this header turns them into the
 * KCENON_WITH_* flags the sources test.
 *
 * Usage:
 * @code
 * #include <kcenon/segment_transfer/config/feature_flags.h>
 *
 * #if SEGMENT_TRANSFER_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (ILogger interface, VoidResult)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// logger_system integration (asynchronous structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in segment_transfer
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef SEGMENT_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define SEGMENT_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define SEGMENT_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef SEGMENT_TRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== Segment Transfer Feature Summary ===")

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

#pragma message("========================================")

#endif // SEGMENT_TRANSFER_PRINT_FEATURE_SUMMARY
