// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging system for GlowLink
 *
 * Provides consistent, colored logging with automatic timestamps and component tags.
 *
 * Usage:
 *   #define GL_LOG_TAG "MyComponent"
 *   #include "utils/Log.h"
 *
 *   GL_LOGI("Initialized with %d items", count);
 *   GL_LOGE("Failed: %s (code=%d)", msg, err);
 *   GL_LOGW("Token rejected: %u", code);
 *   GL_LOGD("Debug value: %f", val);
 *
 * Output format (stderr, so stdout stays clean for command output):
 *   [12345][INFO][MyComponent] Initialized with 5 items
 *   [12346][ERROR][MyComponent] Failed: timeout (code=-1)
 */

#pragma once

#include <cstdio>
#include <cstdint>
#include <chrono>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define GL_ANSI_RESET      "\033[0m"

#define GL_CLR_GREEN       "\033[1;32m"   // Effect / loop status
#define GL_CLR_RED         "\033[1;31m"   // Errors
#define GL_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define GL_CLR_GRAY        "\033[0;37m"   // Debug (dim)

// Semantic aliases for log levels
#define GL_CLR_ERROR       GL_CLR_RED
#define GL_CLR_WARN        GL_CLR_MAGENTA
#define GL_CLR_INFO        GL_CLR_GREEN
#define GL_CLR_DEBUG       GL_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via compile definitions:
//   -D GL_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)
//
// Default: INFO level (shows Error, Warn, Info)

#ifndef GL_LOG_LEVEL
    #ifdef NDEBUG
        #define GL_LOG_LEVEL 2   // Release: Warn and above
    #else
        #define GL_LOG_LEVEL 3   // Debug: Info and above
    #endif
#endif

#define GL_LOG_LEVEL_NONE  0
#define GL_LOG_LEVEL_ERROR 1
#define GL_LOG_LEVEL_WARN  2
#define GL_LOG_LEVEL_INFO  3
#define GL_LOG_LEVEL_DEBUG 4

// ============================================================================
// Time Source
// ============================================================================

namespace glowlink {
namespace utils {

/// Milliseconds since the first call (monotonic, wraps after ~49 days).
inline uint32_t logMillis() {
    using namespace std::chrono;
    static const steady_clock::time_point s_epoch = steady_clock::now();
    return static_cast<uint32_t>(
        duration_cast<milliseconds>(steady_clock::now() - s_epoch).count());
}

} // namespace utils
} // namespace glowlink

#define GL_LOG_MILLIS()    ::glowlink::utils::logMillis()
#define GL_LOG_PRINTF(...) std::fprintf(stderr, __VA_ARGS__)

// ============================================================================
// Core Logging Macros
// ============================================================================
// Format: [timestamp][LEVEL][TAG] message

#ifndef GL_LOG_TAG
    #define GL_LOG_TAG "GL"
#endif

#define GL_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" GL_ANSI_RESET "[" GL_LOG_TAG "] " fmt "\n"

#if GL_LOG_LEVEL >= GL_LOG_LEVEL_ERROR
    #define GL_LOGE(fmt, ...) \
        GL_LOG_PRINTF(GL_LOG_FORMAT("ERROR", GL_CLR_ERROR, fmt), \
                      (unsigned long)GL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define GL_LOGE(fmt, ...) ((void)0)
#endif

#if GL_LOG_LEVEL >= GL_LOG_LEVEL_WARN
    #define GL_LOGW(fmt, ...) \
        GL_LOG_PRINTF(GL_LOG_FORMAT("WARN", GL_CLR_WARN, fmt), \
                      (unsigned long)GL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define GL_LOGW(fmt, ...) ((void)0)
#endif

#if GL_LOG_LEVEL >= GL_LOG_LEVEL_INFO
    #define GL_LOGI(fmt, ...) \
        GL_LOG_PRINTF(GL_LOG_FORMAT("INFO", GL_CLR_INFO, fmt), \
                      (unsigned long)GL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define GL_LOGI(fmt, ...) ((void)0)
#endif

#if GL_LOG_LEVEL >= GL_LOG_LEVEL_DEBUG
    #define GL_LOGD(fmt, ...) \
        GL_LOG_PRINTF(GL_LOG_FORMAT("DEBUG", GL_CLR_DEBUG, fmt), \
                      (unsigned long)GL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define GL_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Conditional Logging (Throttled)
// ============================================================================
// For logs that should only appear occasionally from a per-frame loop.
//
// Usage:
//   static uint32_t lastLog = 0;
//   GL_LOG_THROTTLE(lastLog, 1000, GL_LOGW("Send failed: %s", err));

#define GL_LOG_THROTTLE(last_var, interval_ms, log_statement) \
    do { \
        uint32_t _now = GL_LOG_MILLIS(); \
        if (_now - (last_var) >= (interval_ms)) { \
            (last_var) = _now; \
            log_statement; \
        } \
    } while(0)
