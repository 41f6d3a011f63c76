// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorMeander.cpp
 * @brief Random-walk ambient color generator
 */

#include "ColorMeander.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace glowlink {
namespace color {

namespace {

constexpr double kPi = 3.14159265358979323846;

double norm3(const Vec3& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

Vec3 normalized(const Vec3& v) {
    const double n = norm3(v);
    Vec3 out;
    if (n > 0.0) {
        out.x = v.x / n;
        out.y = v.y / n;
        out.z = v.z / n;
    }
    return out;
}

Vec3 delta(const Vec3& to, const Vec3& from) {
    Vec3 d;
    d.x = to.x - from.x;
    d.y = to.y - from.y;
    d.z = to.z - from.z;
    return d;
}

} // namespace

bool MeanderConfig::parseStyle(const char* name, MeanderStyle& out) {
    if (name == nullptr) return false;
    if (strcmp(name, "sphere") == 0)   { out = MeanderStyle::Sphere;   return true; }
    if (strcmp(name, "cylinder") == 0) { out = MeanderStyle::Cylinder; return true; }
    if (strcmp(name, "surface") == 0)  { out = MeanderStyle::Surface;  return true; }
    return false;
}

ColorMeander::ColorMeander(const MeanderConfig& config, uint32_t seed)
    : m_config(config)
    , m_pos(config.start)
    , m_rng(seed)
    , m_noise(-std::fabs(config.noise), std::fabs(config.noise)) {
    // Initial heading: random, biased back toward the equator
    std::uniform_real_distribution<double> initial(-0.5, 0.5);
    Vec3 dir;
    dir.x = initial(m_rng);
    dir.y = initial(m_rng);
    dir.z = initial(m_rng) - config.start.z;
    m_dir = normalized(dir);
}

double ColorMeander::noise() {
    return m_noise(m_rng);
}

void ColorMeander::step() {
    const double len = m_config.stepLength;
    Vec3 next;
    next.x = m_pos.x + m_dir.x * len;
    next.y = m_pos.y + m_dir.y * len;
    next.z = m_pos.z + m_dir.z * len;

    Vec3 heading = m_dir;

    switch (m_config.style) {
        case MeanderStyle::Cylinder: {
            next.z = std::min(1.0, std::max(-1.0, next.z));
            const double radius = std::sqrt(next.x * next.x + next.y * next.y);
            if (radius > 1.0) {
                next.x /= radius;
                next.y /= radius;
                heading = normalized(delta(next, m_pos));
            }
            heading.x += noise();
            heading.y += noise();
            heading.z += noise();

            // Heading would leave through a cap: bend it onto the cap edge
            if (std::fabs(next.z + heading.z) > 1.0) {
                const double sgn = (next.z + heading.z > 0.0) ? 1.0 : -1.0;
                const double dz = sgn - next.z;
                const double reach = std::sqrt(std::max(0.0, 1.0 - dz * dz));
                const double planar = std::sqrt(heading.x * heading.x + heading.y * heading.y);
                if (planar > 0.0) {
                    heading.x = heading.x * reach / planar;
                    heading.y = heading.y * reach / planar;
                }
                heading.z = dz;
            }
            break;
        }
        case MeanderStyle::Surface: {
            const double r = norm3(next);
            if (r > 0.0) {
                next.x /= r;
                next.y /= r;
                next.z /= r;
            } else {
                next.x = 0.0;
                next.y = 0.0;
                next.z = 1.0;
            }
            heading = normalized(delta(next, m_pos));
            heading.x += noise();
            heading.y += noise();
            heading.z += noise();
            break;
        }
        case MeanderStyle::Sphere:
        default: {
            const double r = norm3(next);
            if (r > 1.0) {
                const double r2 = r * r;
                next.x /= r2;
                next.y /= r2;
                next.z /= r2;
                heading = normalized(delta(next, m_pos));
            }
            heading.x += noise();
            heading.y += noise();
            heading.z += noise();
            break;
        }
    }

    if (norm3(heading) > 0.0) {
        m_dir = normalized(heading);
    }
    m_pos = next;
}

Hsl ColorMeander::toHsl(const Vec3& p) const {
    Hsl out;
    out.h = std::atan2(p.y, p.x) / (2.0 * kPi) + 0.5;
    const double radius = std::sqrt(p.x * p.x + p.y * p.y);

    if (m_config.style == MeanderStyle::Cylinder) {
        out.s = std::min(1.0, radius);
        out.l = p.z;
        return out;
    }

    const double z = std::min(1.0, std::max(-1.0, p.z));
    out.l = std::asin(z) * 2.0 / kPi;
    const double r0 = std::sqrt(1.0 - z * z);
    out.s = (r0 > 0.0) ? std::min(1.0, radius / r0) : 0.0;
    return out;
}

RGB ColorMeander::color(const ColorModel& model) const {
    const Hsl c = toHsl(m_pos);
    return model.hslColor(c.h, c.s, c.l);
}

RGB ColorMeander::complement(const ColorModel& model) const {
    Vec3 mirrored = m_pos;
    mirrored.x = -mirrored.x;
    mirrored.y = -mirrored.y;
    const Hsl c = toHsl(mirrored);
    return model.hslColor(c.h, c.s, c.l);
}

} // namespace color
} // namespace glowlink
