// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief System integration flags for background_transfer
 *
 * The KCENON_WITH_* macros tell which kcenon ecosystem modules the library
 * was built against. They are driven by the BUILD_WITH_* compile
 * definitions that CMake sets when the corresponding package is found.
 *
 * @code
 * #include <kcenon/background_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_transfer_adapter::create_default();
 * #endif
 * @endcode
 */

#pragma once

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#endif

// common_system integration (Result types used by thread_system jobs)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool behind the orchestrator)
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

/**
 * @brief Print feature detection summary at compile time
 *
 * Enable by defining BACKGROUND_TRANSFER_PRINT_FEATURE_SUMMARY before
 * including this header.
 */
#ifdef BACKGROUND_TRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== Background Transfer Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
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

#pragma message("===========================================")

#endif // BACKGROUND_TRANSFER_PRINT_FEATURE_SUMMARY
