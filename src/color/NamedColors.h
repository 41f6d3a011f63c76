// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file NamedColors.h
 * @brief Fixed table of named colors accepted on the command line
 */

#pragma once

#include <cstddef>

#include "../core/RGB.h"

namespace glowlink {
namespace color {

struct NamedColor {
    const char* name;
    RGB rgb;
};

/**
 * @brief Case-insensitive lookup ("red", "Mint", ...)
 * @return false for unknown names
 */
bool lookupNamedColor(const char* name, RGB& out);

const NamedColor* namedColors(size_t& count);

} // namespace color
} // namespace glowlink
