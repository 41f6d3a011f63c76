// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorModel.h
 * @brief Device-accurate color conversion (gamma, channel balance, HSL)
 *
 * ColorModel provides:
 * - Device gamma x^g and its inverse
 * - sRGB transfer functions for converting image colors to/from device gamma
 * - rgbColor(): normalized linear RGB -> balanced device bytes
 * - hslColor(): hue ramp interpolation with Linear or Equilight lightness
 *
 * Usage:
 * @code
 * ColorModelConfig cfg;                       // gamma 1.0, 8-color ramp, Equilight
 * ColorModelConfig::parseStyle("6col", cfg);
 * ColorModel model(cfg);
 * RGB c = model.hslColor(0.25, 1.0, 0.0);     // fully saturated, mid lightness
 * @endcode
 *
 * Invariants:
 * - hslColor(h, 0, l) does not depend on h
 * - hslColor(h, s, -1) is black
 *
 * Immutable after construction; safe to share between threads.
 */

#pragma once

#include <stdint.h>

#include "../core/RGB.h"

namespace glowlink {
namespace color {

/**
 * @brief Number of hue anchors in the ramp
 */
enum class ColorStyle : uint8_t {
    Col3 = 0,
    Col4,
    Col6,
    Col8,
    Col10
};

enum class LightnessPolicy : uint8_t {
    Linear = 0,     ///< Two-branch split, no brightness correction
    Equilight = 1   ///< Perceived brightness linear in lightness
};

/**
 * @brief Color model parameters
 */
struct ColorModelConfig {
    double gamma = 1.0;
    double brightness[3] = {0.35, 0.50, 0.15};   ///< Perceptual weight per channel
    double balance[3] = {0.9, 1.0, 0.6};         ///< Device channel scaling
    ColorStyle style = ColorStyle::Col8;
    LightnessPolicy policy = LightnessPolicy::Equilight;

    /**
     * @brief Apply one of "3col|4col|6col|8col|10col|linear|equilight"
     *
     * Ramp names set the style, policy names set the policy.
     *
     * @return false for unknown names (config unchanged)
     */
    static bool parseStyle(const char* name, ColorModelConfig& config);
};

class ColorModel {
public:
    explicit ColorModel(const ColorModelConfig& config = ColorModelConfig());

    const ColorModelConfig& config() const { return m_config; }

    // ========================================================================
    // Transfer functions
    // ========================================================================

    double gamma(double x) const;
    double invGamma(double x) const;

    /// Linear -> sRGB encoded (threshold 0.0031308)
    static double srgbEncode(double x);

    /// sRGB encoded -> linear (threshold 0.04045)
    static double srgbDecode(double x);

    // ========================================================================
    // Conversions
    // ========================================================================

    /**
     * @brief Weighted channel sum using the brightness vector
     */
    double colorBrightness(double r, double g, double b) const;

    /**
     * @brief round(255 * balance_c * gamma(c)) per channel, clamped to [0,255]
     */
    RGB rgbColor(double r, double g, double b) const;

    /**
     * @param h Hue in [0,1), clamped
     * @param s Saturation in [0,1]
     * @param l Lightness in [-1,1]; -1 black, 0 full hue, 1 white
     */
    RGB hslColor(double h, double s, double l) const;

    /**
     * @brief sRGB image byte -> device byte in device gamma and balance
     */
    RGB imageToLedRgb(const RGB& image) const;

    /**
     * @brief Device byte -> sRGB image byte (inverse of imageToLedRgb)
     */
    RGB ledToImageRgb(const RGB& led) const;

private:
    ColorModelConfig m_config;
};

} // namespace color
} // namespace glowlink
