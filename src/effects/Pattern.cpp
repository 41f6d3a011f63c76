// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Pattern.cpp
 * @brief Frame pattern helpers
 */

#include "Pattern.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace glowlink {
namespace effects {

namespace {

uint8_t clampChannel(double v) {
    if (!(v > 0.0)) return 0;
    if (v > 255.0) return 255;
    return static_cast<uint8_t>(v);
}

} // namespace

Pattern::Pattern(uint32_t seed)
    : m_rng(seed) {
}

RGB Pattern::dim(const RGB& c, double prop) {
    return RGB(clampChannel(c.r * prop), clampChannel(c.g * prop), clampChannel(c.b * prop));
}

RGB Pattern::blend(const RGB& a, const RGB& b, double prop) {
    return RGB(clampChannel(a.r * (1.0 - prop) + b.r * prop),
               clampChannel(a.g * (1.0 - prop) + b.g * prop),
               clampChannel(a.b * (1.0 - prop) + b.b * prop));
}

Status Pattern::alternating(size_t ledCount, const std::vector<RGB>& palette, Frame& out) {
    if (palette.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "Palette must not be empty");
    }
    out.resize(ledCount);
    for (size_t i = 0; i < ledCount; i++) {
        out[i] = palette[i % palette.size()];
    }
    return Status::ok();
}

Frame Pattern::spectrum(size_t ledCount, size_t offset, double lightness,
                        const color::ColorModel& model) {
    Frame out(ledCount);
    for (size_t i = 0; i < ledCount; i++) {
        const double hue = static_cast<double>((i + offset) % ledCount) / ledCount;
        out[i] = model.hslColor(hue, 1.0, lightness);
    }
    return out;
}

Status Pattern::randomDiscrete(const std::vector<double>& probs, size_t& index) {
    const double sum = std::accumulate(probs.begin(), probs.end(), 0.0);
    if (probs.empty() || std::fabs(sum - 1.0) > 1e-5) {
        return Status::fail(ErrorKind::VALIDATION, "Probabilities sum to %f, expected 1.0", sum);
    }

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const double r = uniform(m_rng);
    double acc = 0.0;
    for (size_t i = 0; i < probs.size(); i++) {
        acc += probs[i];
        if (acc >= r) {
            index = i;
            return Status::ok();
        }
    }
    // r landed in the rounding slack above the accumulated sum
    index = probs.size() - 1;
    return Status::ok();
}

Status Pattern::randomSelect(size_t ledCount, const std::vector<RGB>& palette,
                             const std::vector<double>* probs, Frame& out) {
    if (palette.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "Palette must not be empty");
    }
    if (probs != nullptr && probs->size() != palette.size()) {
        return Status::fail(ErrorKind::VALIDATION, "%zu probabilities for %zu colors",
                            probs->size(), palette.size());
    }

    std::uniform_int_distribution<size_t> pick(0, palette.size() - 1);
    out.resize(ledCount);
    for (size_t i = 0; i < ledCount; i++) {
        size_t index = 0;
        if (probs != nullptr) {
            Status status = randomDiscrete(*probs, index);
            if (!status) return status;
        } else {
            index = pick(m_rng);
        }
        out[i] = palette[index];
    }
    return Status::ok();
}

Frame Pattern::randomBlend(size_t ledCount, const RGB& a, const RGB& b) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    Frame out(ledCount);
    for (size_t i = 0; i < ledCount; i++) {
        out[i] = blend(a, b, uniform(m_rng));
    }
    return out;
}

Frame Pattern::randomColors(size_t ledCount, double lightness, const color::ColorModel& model) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    Frame out(ledCount);
    for (size_t i = 0; i < ledCount; i++) {
        out[i] = model.hslColor(uniform(m_rng), 1.0, lightness);
    }
    return out;
}

Status Pattern::sprinkle(Frame& frame, const std::vector<RGB>& palette, double meanCount) {
    if (palette.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "Palette must not be empty");
    }
    if (!(meanCount > 0.0)) {
        return Status::fail(ErrorKind::VALIDATION, "Mean count must be positive: %f", meanCount);
    }

    std::poisson_distribution<size_t> poisson(meanCount);
    const size_t count = std::min(poisson(m_rng), frame.size());

    std::vector<size_t> indices(frame.size());
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), m_rng);

    std::uniform_int_distribution<size_t> pick(0, palette.size() - 1);
    for (size_t i = 0; i < count; i++) {
        frame[indices[i]] = palette[pick(m_rng)];
    }
    return Status::ok();
}

} // namespace effects
} // namespace glowlink
