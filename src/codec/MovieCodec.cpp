// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MovieCodec.cpp
 * @brief Movie upload body encoder
 */

#include "MovieCodec.h"

#include <algorithm>

namespace glowlink {
namespace codec {

Status MovieCodec::encode(const std::vector<Frame>& frames, LedProfile profile,
                          std::vector<uint8_t>& body) {
    body.clear();

    if (frames.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "Movie has no frames");
    }

    const size_t ledCount = frames.front().size();
    body.reserve(frames.size() * ledCount * bytesPerLed(profile));

    for (size_t f = 0; f < frames.size(); f++) {
        const Frame& frame = frames[f];
        if (frame.size() != ledCount) {
            body.clear();
            return Status::fail(ErrorKind::VALIDATION,
                                "Frame %zu has %zu LEDs, expected %zu",
                                f, frame.size(), ledCount);
        }

        for (const RGB& c : frame) {
            if (profile == LedProfile::RGBW) {
                const uint8_t w = std::min(c.r, std::min(c.g, c.b));
                body.push_back(static_cast<uint8_t>(c.r - w));
                body.push_back(static_cast<uint8_t>(c.g - w));
                body.push_back(static_cast<uint8_t>(c.b - w));
                body.push_back(w);
            } else {
                body.push_back(c.r);
                body.push_back(c.g);
                body.push_back(c.b);
            }
        }
    }

    return Status::ok();
}

} // namespace codec
} // namespace glowlink
