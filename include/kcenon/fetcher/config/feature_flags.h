// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for fetcher_system
 *
 * Central entry point for feature detection in the fetcher library.
 *
 * Feature categories:
 * - FETCHER_HAS_*        : Local feature availability (S3 signing, curl transport)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/fetcher/config/feature_flags.h>
 *
 * #if FETCHER_HAS_S3_SIGNING
 *     auto header = create_authorization_header(...);
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
#define FETCHER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define FETCHER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Fetcher Feature Flags
//==============================================================================

/**
 * @brief AWS Signature V4 support (OpenSSL)
 *
 * Required by the S3 remote filesystem for request signing.
 * Set via CMake option FETCHER_ENABLE_S3.
 */
#ifndef FETCHER_HAS_S3_SIGNING
    #if defined(FETCHER_ENABLE_S3)
        #define FETCHER_HAS_S3_SIGNING 1
    #else
        #define FETCHER_HAS_S3_SIGNING 0
    #endif
#endif

/**
 * @brief libcurl transport support
 *
 * Enables the FTP/SFTP remote filesystem and the curl HTTP fallback.
 * Set via CMake option FETCHER_ENABLE_CURL.
 */
#ifndef FETCHER_HAS_CURL
    #if defined(FETCHER_ENABLE_CURL)
        #define FETCHER_HAS_CURL 1
    #else
        #define FETCHER_HAS_CURL 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for the job executor)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP transport for object storage)
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
 * @brief Unified flag for logger_system usage in the fetcher
 *
 * logger_system requires common_system, so both must be present.
 */
#ifndef FETCHER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define FETCHER_USE_LOGGER_SYSTEM 1
    #else
        #define FETCHER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef FETCHER_PRINT_FEATURE_SUMMARY

#pragma message("=== Fetcher System Feature Summary ===")

#if FETCHER_HAS_S3_SIGNING
    #pragma message("  S3 signing (OpenSSL): Enabled")
#else
    #pragma message("  S3 signing (OpenSSL): Disabled")
#endif

#if FETCHER_HAS_CURL
    #pragma message("  libcurl transport: Enabled")
#else
    #pragma message("  libcurl transport: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("======================================")

#endif // FETCHER_PRINT_FEATURE_SUMMARY
