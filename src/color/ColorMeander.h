// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorMeander.h
 * @brief Slowly drifting ambient color from a random walk in color space
 *
 * A particle moves by `direction * stepLength` per step(). After each move the
 * direction gets uniform noise in [-noise, noise] per axis and is renormalized.
 * The particle is kept inside a manifold:
 * - Sphere:   radius > 1 is damped by 1/r^2 (soft)
 * - Cylinder: |z| <= 1 and x^2 + y^2 <= 1 (hard), direction bent at the caps
 * - Surface:  projected onto the unit sphere every step
 *
 * Position -> HSL: hue from the azimuth, lightness from height, saturation
 * from distance to the axis. The color comes from ColorModel::hslColor().
 */

#pragma once

#include <stdint.h>
#include <random>

#include "ColorModel.h"
#include "../core/RGB.h"

namespace glowlink {
namespace color {

enum class MeanderStyle : uint8_t {
    Sphere = 0,
    Cylinder,
    Surface
};

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct Hsl {
    double h = 0.0;
    double s = 0.0;
    double l = 0.0;
};

struct MeanderConfig {
    MeanderStyle style = MeanderStyle::Sphere;
    double stepLength = 0.02;
    double noise = 0.1;
    Vec3 start;

    static bool parseStyle(const char* name, MeanderStyle& out);
};

class ColorMeander {
public:
    /**
     * @param seed Seed for the direction noise; equal seeds give equal walks
     */
    ColorMeander(const MeanderConfig& config, uint32_t seed);

    void step();

    /**
     * @brief Color at the current position
     */
    RGB color(const ColorModel& model) const;

    /**
     * @brief Color at the position mirrored through the axis (-x, -y, z)
     */
    RGB complement(const ColorModel& model) const;

    const Vec3& position() const { return m_pos; }
    const Vec3& direction() const { return m_dir; }
    Hsl hsl() const { return toHsl(m_pos); }
    MeanderStyle style() const { return m_config.style; }

private:
    Hsl toHsl(const Vec3& p) const;
    double noise();

    MeanderConfig m_config;
    Vec3 m_pos;
    Vec3 m_dir;
    std::mt19937 m_rng;
    std::uniform_real_distribution<double> m_noise;
};

} // namespace color
} // namespace glowlink
