// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file NamedColors.cpp
 * @brief Named color table
 */

#include "NamedColors.h"

#include <strings.h>

namespace glowlink {
namespace color {

namespace {

const NamedColor kNamedColors[] = {
    {"red",      RGB(255, 0, 0)},
    {"green",    RGB(0, 255, 0)},
    {"blue",     RGB(0, 0, 255)},
    {"yellow",   RGB(255, 255, 0)},
    {"orange",   RGB(255, 165, 0)},
    {"purple",   RGB(128, 0, 128)},
    {"cyan",     RGB(0, 255, 255)},
    {"magenta",  RGB(255, 0, 255)},
    {"lime",     RGB(50, 205, 50)},
    {"pink",     RGB(255, 192, 203)},
    {"teal",     RGB(0, 128, 128)},
    {"lavender", RGB(230, 230, 250)},
    {"brown",    RGB(165, 42, 42)},
    {"beige",    RGB(245, 245, 220)},
    {"maroon",   RGB(128, 0, 0)},
    {"mint",     RGB(189, 252, 201)},
};

} // namespace

bool lookupNamedColor(const char* name, RGB& out) {
    if (name == nullptr) return false;
    for (const NamedColor& entry : kNamedColors) {
        if (strcasecmp(entry.name, name) == 0) {
            out = entry.rgb;
            return true;
        }
    }
    return false;
}

const NamedColor* namedColors(size_t& count) {
    count = sizeof(kNamedColors) / sizeof(kNamedColors[0]);
    return kNamedColors;
}

} // namespace color
} // namespace glowlink
