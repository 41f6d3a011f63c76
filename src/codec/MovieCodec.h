// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MovieCodec.h
 * @brief Binary body for the device movie upload endpoint
 *
 * Body = frames concatenated, each frame = LED groups in index order:
 *   RGB profile:  [r][g][b]
 *   RGBW profile: [r-w][g-w][b-w][w] with w = min(r, g, b)
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "../core/RGB.h"
#include "../core/Status.h"

namespace glowlink {
namespace codec {

class MovieCodec {
public:
    static size_t bytesPerLed(LedProfile profile) {
        return (profile == LedProfile::RGBW) ? 4 : 3;
    }

    /**
     * @brief Encode frames into an upload body
     * @return VALIDATION failure if there are no frames or frame sizes differ
     */
    static Status encode(const std::vector<Frame>& frames, LedProfile profile,
                         std::vector<uint8_t>& body);
};

} // namespace codec
} // namespace glowlink
