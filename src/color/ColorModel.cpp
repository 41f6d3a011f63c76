// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorModel.cpp
 * @brief Device color model implementation
 */

#include "ColorModel.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace glowlink {
namespace color {

namespace {

constexpr int RAMP_POINTS = 7;

// Hue anchors per ramp style
constexpr double kHueRamps[5][RAMP_POINTS] = {
    {0.0, 1.0 / 6.0,  2.0 / 6.0, 3.0 / 6.0, 4.0 / 6.0, 5.0 / 6.0, 1.0},   // Col3
    {0.0, 1.0 / 8.0,  1.0 / 4.0, 2.0 / 4.0, 3.0 / 4.0, 7.0 / 8.0, 1.0},   // Col4
    {0.0, 1.0 / 12.0, 1.0 / 6.0, 1.0 / 3.0, 2.0 / 3.0, 3.0 / 4.0, 1.0},   // Col6
    {0.0, 1.0 / 8.0,  2.0 / 8.0, 3.0 / 8.0, 5.0 / 8.0, 6.0 / 8.0, 1.0},   // Col8
    {0.0, 0.2,        0.3,       0.4,       0.7,       0.8,       1.0},   // Col10
};

uint8_t toByte(double v) {
    double rounded = std::round(v);
    if (!(rounded > 0.0)) return 0;
    if (rounded > 255.0) return 255;
    return static_cast<uint8_t>(rounded);
}

} // namespace

bool ColorModelConfig::parseStyle(const char* name, ColorModelConfig& config) {
    if (name == nullptr) return false;

    if (strcmp(name, "3col") == 0)       config.style = ColorStyle::Col3;
    else if (strcmp(name, "4col") == 0)  config.style = ColorStyle::Col4;
    else if (strcmp(name, "6col") == 0)  config.style = ColorStyle::Col6;
    else if (strcmp(name, "8col") == 0)  config.style = ColorStyle::Col8;
    else if (strcmp(name, "10col") == 0) config.style = ColorStyle::Col10;
    else if (strcmp(name, "linear") == 0)    config.policy = LightnessPolicy::Linear;
    else if (strcmp(name, "equilight") == 0) config.policy = LightnessPolicy::Equilight;
    else return false;

    return true;
}

ColorModel::ColorModel(const ColorModelConfig& config)
    : m_config(config) {
}

double ColorModel::gamma(double x) const {
    if (m_config.gamma == 1.0) return x;
    return std::pow(x, m_config.gamma);
}

double ColorModel::invGamma(double x) const {
    if (m_config.gamma == 1.0) return x;
    return std::pow(x, 1.0 / m_config.gamma);
}

double ColorModel::srgbEncode(double x) {
    if (x > 0.0031308) {
        return std::pow(x, 1.0 / 2.4) * 1.055 - 0.055;
    }
    return x * 12.92;
}

double ColorModel::srgbDecode(double x) {
    if (x > 0.04045) {
        return std::pow((x + 0.055) / 1.055, 2.4);
    }
    return x / 12.92;
}

double ColorModel::colorBrightness(double r, double g, double b) const {
    return r * m_config.brightness[0] + g * m_config.brightness[1] + b * m_config.brightness[2];
}

RGB ColorModel::rgbColor(double r, double g, double b) const {
    const double* bal = m_config.balance;
    return RGB(toByte(255.0 * bal[0] * gamma(std::max(0.0, r))),
               toByte(255.0 * bal[1] * gamma(std::max(0.0, g))),
               toByte(255.0 * bal[2] * gamma(std::max(0.0, b))));
}

RGB ColorModel::imageToLedRgb(const RGB& image) const {
    const double* bal = m_config.balance;
    return RGB(toByte(255.0 * bal[0] * gamma(srgbDecode(image.r / 255.0))),
               toByte(255.0 * bal[1] * gamma(srgbDecode(image.g / 255.0))),
               toByte(255.0 * bal[2] * gamma(srgbDecode(image.b / 255.0))));
}

RGB ColorModel::ledToImageRgb(const RGB& led) const {
    const double* bal = m_config.balance;
    return RGB(toByte(255.0 * srgbEncode(invGamma(led.r / (bal[0] * 255.0)))),
               toByte(255.0 * srgbEncode(invGamma(led.g / (bal[1] * 255.0)))),
               toByte(255.0 * srgbEncode(invGamma(led.b / (bal[2] * 255.0)))));
}

RGB ColorModel::hslColor(double h, double s, double l) const {
    const double* hramp = kHueRamps[static_cast<int>(m_config.style)];
    const double* bal = m_config.balance;

    h = std::min(1.0, std::max(0.0, h));
    s = std::min(1.0, std::max(0.0, s));
    l = std::min(1.0, std::max(-1.0, l));

    // Ideal channel vectors: each anchor saturates the weakest balanced channel
    const double ir = 1.0 / bal[0];
    const double ig = 1.0 / bal[1];
    const double ib = 1.0 / bal[2];
    const double irg = std::min(ir, ig);
    const double irb = std::min(ir, ib);
    const double igb = std::min(ig, ib);
    const double iramp[RAMP_POINTS][3] = {
        {0.0,       0.0,       ib},
        {0.0,       igb / 2.0, igb / 2.0},
        {0.0,       ig,        0.0},
        {irg / 2.0, irg / 2.0, 0.0},
        {ir,        0.0,       0.0},
        {irb / 2.0, 0.0,       irb / 2.0},
        {0.0,       0.0,       ib},
    };

    int i = 0;
    while (i < RAMP_POINTS - 2 && h > hramp[i + 1]) {
        i++;
    }
    const double p = (h - hramp[i]) / (hramp[i + 1] - hramp[i]);
    double r = iramp[i][0] + p * (iramp[i + 1][0] - iramp[i][0]);
    double g = iramp[i][1] + p * (iramp[i + 1][1] - iramp[i][1]);
    double b = iramp[i][2] + p * (iramp[i + 1][2] - iramp[i][2]);

    // Largest balance-scaled component becomes 1
    const double nrm = std::max(r / ir, std::max(g / ig, b / ib));
    if (nrm > 0.0) {
        r /= nrm;
        g /= nrm;
        b /= nrm;
    }

    const double ll = (l + 1.0) * 0.5;
    double t1 = 0.0;
    double t2 = 0.0;

    if (m_config.policy == LightnessPolicy::Linear) {
        if (ll < 0.5) {
            t1 = l + 1.0;
            t2 = 0.0;
        } else {
            t1 = 1.0 - l;
            t2 = l;
        }
    } else {
        const double br = colorBrightness(r, g, b);
        const double e = std::max(r, std::max(g, b));
        const double pe = std::min(1.0,
                          std::min((1.0 - ll / e) / (1.0 - br),
                                   (1.0 - ll * bal[1]) / (1.0 - m_config.brightness[1])));
        t1 = ll * pe / ((br - e) * pe + e);
        t2 = std::max(0.0, ll - t1 * br);
    }

    t1 = s * t1;
    t2 = s * t2 + ll * (1.0 - s);
    return rgbColor(r * t1 + t2, g * t1 + t2, b * t1 + t2);
}

} // namespace color
} // namespace glowlink
