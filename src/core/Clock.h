// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Clock.h
 * @brief Monotonic millisecond clock shared by effects, pacing and discovery
 *
 * Timestamps are uint32_t milliseconds and wrap after ~49 days; compare them
 * by unsigned subtraction (now - then), never by ordering.
 */

#pragma once

#include <stdint.h>
#include <chrono>
#include <functional>

namespace glowlink {

using MillisClock = std::function<uint32_t()>;

inline uint32_t monotonicMillis() {
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace glowlink
