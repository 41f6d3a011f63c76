// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Pattern.h
 * @brief Static frame pattern helpers
 *
 * Deterministic helpers are static. Random helpers draw from the instance's
 * own generator, seeded at construction.
 */

#pragma once

#include <stdint.h>
#include <cstddef>
#include <random>
#include <vector>

#include "../color/ColorModel.h"
#include "../core/RGB.h"
#include "../core/Status.h"

namespace glowlink {
namespace effects {

class Pattern {
public:
    explicit Pattern(uint32_t seed);

    // ========================================================================
    // Deterministic
    // ========================================================================

    /// Scale every channel by prop (truncated, clamped to [0,255])
    static RGB dim(const RGB& c, double prop);

    /// (1 - prop) * a + prop * b per channel
    static RGB blend(const RGB& a, const RGB& b, double prop);

    /// frame[i] = palette[i % palette.size()]
    static Status alternating(size_t ledCount, const std::vector<RGB>& palette, Frame& out);

    /// Full-saturation hue sweep over the strip, rotated by offset LEDs
    static Frame spectrum(size_t ledCount, size_t offset, double lightness,
                          const color::ColorModel& model);

    // ========================================================================
    // Random
    // ========================================================================

    /**
     * @brief Draw an index from a discrete distribution
     * @return VALIDATION failure unless probs sum to 1 (tolerance 1e-5)
     */
    Status randomDiscrete(const std::vector<double>& probs, size_t& index);

    /**
     * @brief Each LED picks a palette entry, uniformly or weighted by probs
     */
    Status randomSelect(size_t ledCount, const std::vector<RGB>& palette,
                        const std::vector<double>* probs, Frame& out);

    /// Each LED is a random blend between a and b
    Frame randomBlend(size_t ledCount, const RGB& a, const RGB& b);

    /// Each LED a random full-saturation hue at the given lightness
    Frame randomColors(size_t ledCount, double lightness, const color::ColorModel& model);

    /**
     * @brief Overwrite Poisson(meanCount) random LEDs with palette colors
     */
    Status sprinkle(Frame& frame, const std::vector<RGB>& palette, double meanCount);

private:
    std::mt19937 m_rng;
};

} // namespace effects
} // namespace glowlink
