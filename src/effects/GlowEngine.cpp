// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file GlowEngine.cpp
 * @brief Per-LED glow animation
 */

#include "GlowEngine.h"

#include <algorithm>
#include <cmath>

#define GL_LOG_TAG "Glow"
#include "../utils/Log.h"

namespace glowlink {
namespace effects {

GlowEngine::GlowEngine(uint32_t seed)
    : m_cycleMs(0)
    , m_lastBatchMs(0)
    , m_batchStarted(false)
    , m_configured(false)
    , m_rng(seed) {
}

Status GlowEngine::configure(size_t ledCount, const GlowConfig& config, uint32_t nowMs) {
    m_configured = false;

    if (config.numStartSimultaneous == 0 || config.numStartSimultaneous > ledCount) {
        return Status::fail(ErrorKind::VALIDATION,
                            "num_start_simultaneous must be between 1 and %zu: %zu",
                            ledCount, config.numStartSimultaneous);
    }
    if (config.palette.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "Color palette must not be empty");
    }
    if (config.riseMs == 0 && config.fadeMs == 0) {
        return Status::fail(ErrorKind::VALIDATION, "Rise and fade times are both zero");
    }

    m_config = config;
    m_cycleMs = config.riseMs + config.fadeMs;

    // Every LED starts out fully faded
    GlowState idle;
    idle.startMs = nowMs - 2 * m_cycleMs;
    idle.color = RGB::Black();
    m_leds.assign(ledCount, idle);
    m_idle.reserve(ledCount);

    m_batchStarted = false;
    m_configured = true;
    GL_LOGD("Configured %zu LEDs, %zu colors, cycle %u ms", ledCount,
            config.palette.size(), m_cycleMs);
    return Status::ok();
}

bool GlowEngine::isIdle(size_t led, uint32_t nowMs) const {
    return (nowMs - m_leds[led].startMs) >= m_cycleMs;
}

double GlowEngine::brightness(size_t led, uint32_t nowMs) const {
    const uint32_t e = nowMs - m_leds[led].startMs;
    const uint32_t rise = m_config.riseMs;
    const uint32_t fade = m_config.fadeMs;

    if (e < rise) {
        return static_cast<double>(e) / rise;
    }
    if (e < rise + fade) {
        return 1.0 - static_cast<double>(e - rise) / fade;
    }
    return 0.0;
}

void GlowEngine::startBatch(uint32_t nowMs) {
    m_idle.clear();
    for (size_t i = 0; i < m_leds.size(); i++) {
        if (isIdle(i, nowMs)) {
            m_idle.push_back(i);
        }
    }

    std::shuffle(m_idle.begin(), m_idle.end(), m_rng);

    std::uniform_int_distribution<size_t> pick(0, m_config.palette.size() - 1);
    const size_t count = std::min(m_config.numStartSimultaneous, m_idle.size());
    for (size_t n = 0; n < count; n++) {
        GlowState& state = m_leds[m_idle[n]];
        state.startMs = nowMs;
        state.color = m_config.palette[pick(m_rng)];
    }

    m_lastBatchMs = nowMs;
    m_batchStarted = true;
}

void GlowEngine::tick(uint32_t nowMs, Frame& out) {
    out.resize(m_leds.size());
    if (!m_configured) {
        std::fill(out.begin(), out.end(), RGB::Black());
        return;
    }

    if (!m_batchStarted || (nowMs - m_lastBatchMs) >= m_config.timeBetweenGlowStartMs) {
        startBatch(nowMs);
    }

    for (size_t i = 0; i < m_leds.size(); i++) {
        const double level = brightness(i, nowMs);
        const RGB& c = m_leds[i].color;
        out[i] = RGB(static_cast<uint8_t>(std::lround(c.r * level)),
                     static_cast<uint8_t>(std::lround(c.g * level)),
                     static_cast<uint8_t>(std::lround(c.b * level)));
    }
}

} // namespace effects
} // namespace glowlink
