// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Status.h
 * @brief Result type shared by every fallible GlowLink operation
 *
 * Operations report failure by value: a success flag, the error category and a
 * bounded human-readable message. Categories:
 * - TRANSPORT:  socket bind/connect/send/receive failure
 * - PROTOCOL:   non-2xx HTTP, malformed JSON, non-success device response code
 * - VALIDATION: bad caller input detected before any network action
 *
 * @author GlowLink Team
 * @version 1.0.0
 */

#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace glowlink {

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 128;

enum class ErrorKind : uint8_t {
    NONE = 0,
    TRANSPORT,
    PROTOCOL,
    VALIDATION
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:       return "none";
        case ErrorKind::TRANSPORT:  return "transport";
        case ErrorKind::PROTOCOL:   return "protocol";
        case ErrorKind::VALIDATION: return "validation";
    }
    return "unknown";
}

struct Status {
    bool success;
    ErrorKind kind;
    char errorMsg[MAX_ERROR_MSG];

    Status() : success(false), kind(ErrorKind::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }

    static Status ok() {
        Status s;
        s.success = true;
        return s;
    }

    static Status fail(ErrorKind kind, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
    {
        Status s;
        s.kind = kind;
        va_list args;
        va_start(args, fmt);
        vsnprintf(s.errorMsg, MAX_ERROR_MSG, fmt, args);
        va_end(args);
        return s;
    }

    explicit operator bool() const { return success; }
};

} // namespace glowlink
