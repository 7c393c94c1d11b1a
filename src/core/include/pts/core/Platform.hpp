/**
 * @file Platform.hpp
 * @brief Compiler detection and branch-prediction hints.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_CORE_PLATFORM_HPP
    #define PTS_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define PTS_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define PTS_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define PTS_COMPILER_MSVC  1
    #else
        #define PTS_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(PTS_COMPILER_GCC) || defined(PTS_COMPILER_CLANG)
        #define PTS_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define PTS_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #elif defined(PTS_COMPILER_MSVC)
        #define PTS_LIKELY(x)       (x)
        #define PTS_UNLIKELY(x)     (x)
    #else
        #define PTS_LIKELY(x)       (x)
        #define PTS_UNLIKELY(x)     (x)
    #endif

#endif // PTS_CORE_PLATFORM_HPP
