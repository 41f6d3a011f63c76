// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FramePacer.h
 * @brief Fixed-rate tick pacing for real-time loops
 *
 * waitNextFrame() sleeps whatever is left of the current frame budget. A frame
 * that overruns its budget is not compensated for later: the next budget
 * starts when the overrun frame returns.
 */

#pragma once

#include <stdint.h>
#include <chrono>
#include <functional>
#include <thread>

#include "Clock.h"

namespace glowlink {

class FramePacer {
public:
    using Sleeper = std::function<void(uint32_t ms)>;

    explicit FramePacer(double frameRate, MillisClock clock = {}, Sleeper sleeper = {})
        : m_clock(clock ? clock : MillisClock(monotonicMillis))
        , m_sleep(sleeper ? sleeper : Sleeper(sleepMillis))
        , m_periodMs(frameRate > 0.0 ? static_cast<uint32_t>(1000.0 / frameRate) : 0)
        , m_frameStartMs(0) {}

    /// Mark the start of a frame
    uint32_t beginFrame() {
        m_frameStartMs = m_clock();
        return m_frameStartMs;
    }

    /// Sleep out the rest of the frame budget
    void waitNextFrame() {
        const uint32_t elapsed = m_clock() - m_frameStartMs;
        if (elapsed < m_periodMs) {
            m_sleep(m_periodMs - elapsed);
        }
    }

    uint32_t periodMs() const { return m_periodMs; }
    uint32_t now() const { return m_clock(); }

    static void sleepMillis(uint32_t ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

private:
    MillisClock m_clock;
    Sleeper m_sleep;
    uint32_t m_periodMs;
    uint32_t m_frameStartMs;
};

} // namespace glowlink
