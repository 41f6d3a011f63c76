// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file GlowEngine.h
 * @brief Independent per-LED rise-and-fade glow animation
 *
 * Each LED runs glow cycles: linear rise 0 -> 1 over riseMs, linear fade
 * 1 -> 0 over fadeMs, then idle. Every timeBetweenGlowStartMs a batch starts:
 * idle LEDs are shuffled and up to numStartSimultaneous of them begin a new
 * cycle with a random palette color.
 *
 * Time is injected (nowMs) so the engine is deterministic under test;
 * elapsed times use unsigned subtraction and survive millisecond wrap.
 */

#pragma once

#include <stdint.h>
#include <cstddef>
#include <random>
#include <vector>

#include "../core/RGB.h"
#include "../core/Status.h"

namespace glowlink {
namespace effects {

struct GlowConfig {
    uint32_t timeBetweenGlowStartMs = 100;
    uint32_t riseMs = 1000;
    uint32_t fadeMs = 2000;
    size_t numStartSimultaneous = 1;
    std::vector<RGB> palette;
};

class GlowEngine {
public:
    explicit GlowEngine(uint32_t seed);

    /**
     * @brief Validate the configuration and reset every LED to idle
     * @return VALIDATION failure if numStartSimultaneous is outside
     *         [1, ledCount], the palette is empty, or rise + fade is zero
     */
    Status configure(size_t ledCount, const GlowConfig& config, uint32_t nowMs);

    /**
     * @brief Start a batch if one is due, then render every LED
     */
    void tick(uint32_t nowMs, Frame& out);

    /**
     * @brief Brightness of one LED in [0,1]
     */
    double brightness(size_t led, uint32_t nowMs) const;

    /**
     * @brief True once the LED's last cycle has fully elapsed
     */
    bool isIdle(size_t led, uint32_t nowMs) const;

    uint32_t cycleStart(size_t led) const { return m_leds[led].startMs; }
    const RGB& ledColor(size_t led) const { return m_leds[led].color; }
    size_t ledCount() const { return m_leds.size(); }
    bool isConfigured() const { return m_configured; }

private:
    struct GlowState {
        uint32_t startMs;
        RGB color;
    };

    void startBatch(uint32_t nowMs);

    GlowConfig m_config;
    std::vector<GlowState> m_leds;
    std::vector<size_t> m_idle;
    uint32_t m_cycleMs;
    uint32_t m_lastBatchMs;
    bool m_batchStarted;
    bool m_configured;
    std::mt19937 m_rng;
};

} // namespace effects
} // namespace glowlink
