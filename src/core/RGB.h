// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RGB.h
 * @brief Color triple and frame types shared by the color engine and transport
 *
 * Memory layout matches the device's real-time wire order (3 bytes per LED).
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace glowlink {

/**
 * @brief RGB color structure
 */
struct RGB {
    uint8_t r;  ///< Red component (0-255)
    uint8_t g;  ///< Green component (0-255)
    uint8_t b;  ///< Blue component (0-255)

    constexpr RGB() : r(0), g(0), b(0) {}

    constexpr RGB(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    /**
     * @brief Construct from packed 24-bit value (0xRRGGBB)
     */
    constexpr explicit RGB(uint32_t packed)
        : r((packed >> 16) & 0xFF)
        , g((packed >> 8) & 0xFF)
        , b(packed & 0xFF) {}

    constexpr uint32_t toPacked() const {
        return (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) |
               static_cast<uint32_t>(b);
    }

    constexpr bool operator==(const RGB& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    constexpr bool operator!=(const RGB& other) const {
        return !(*this == other);
    }

    static constexpr RGB Black() { return RGB(0, 0, 0); }
    static constexpr RGB White() { return RGB(255, 255, 255); }
    static constexpr RGB Red()   { return RGB(255, 0, 0); }
    static constexpr RGB Green() { return RGB(0, 255, 0); }
    static constexpr RGB Blue()  { return RGB(0, 0, 255); }
};

/**
 * @brief One real-time frame: index i is LED i, size equals the device LED count
 */
using Frame = std::vector<RGB>;

/**
 * @brief Channel layout of the device LEDs
 */
enum class LedProfile : uint8_t {
    RGB = 0,
    RGBW = 1
};

} // namespace glowlink
