// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RtStreamCodec.h
 * @brief Line-based frame decoder for piping real-time frames into glowctl
 *
 * Formats:
 *   hex:  one LED per line, 6 hex digits "rrggbb" (optional leading '#').
 *         ledsPerFrame consecutive lines form one frame.
 *   json: one frame per line, [[r,g,b],[r,g,b],...] with exactly
 *         ledsPerFrame entries.
 *
 * Blank lines are ignored in both formats.
 *
 * Error modes:
 *   abort: a malformed record is a VALIDATION failure and ends the stream.
 *   skip:  the record is logged and dropped; a partially collected hex
 *          frame is discarded with it.
 */

#pragma once

#include <stdint.h>
#include <cstddef>
#include <istream>
#include <string>

#include "../core/RGB.h"
#include "../core/Status.h"

namespace glowlink {
namespace codec {

enum class RtStreamFormat : uint8_t {
    Hex = 0,
    Json
};

enum class RtStreamErrorMode : uint8_t {
    Abort = 0,
    Skip
};

bool parseStreamFormat(const char* name, RtStreamFormat& out);
bool parseStreamErrorMode(const char* name, RtStreamErrorMode& out);

class RtStreamDecoder {
public:
    RtStreamDecoder(RtStreamFormat format, RtStreamErrorMode errorMode, size_t ledsPerFrame);

    /**
     * @brief Feed one input line
     * @param frameReady Set true when the line completed a frame (see frame())
     * @return VALIDATION failure for a malformed record in abort mode
     */
    Status pushLine(const std::string& line, bool& frameReady);

    /**
     * @brief Read lines until a frame completes or the stream ends
     * @param eof Set true when the stream ended before a full frame
     */
    Status readFrame(std::istream& in, Frame& out, bool& eof);

    const Frame& frame() const { return m_frame; }
    size_t skippedRecords() const { return m_skipped; }
    size_t ledsPerFrame() const { return m_ledsPerFrame; }

private:
    bool decodeHexLine(const std::string& line, RGB& out) const;
    bool decodeJsonLine(const std::string& line, Frame& out, char* errorMsg) const;
    Status reject(size_t lineNo, const char* reason);

    RtStreamFormat m_format;
    RtStreamErrorMode m_errorMode;
    size_t m_ledsPerFrame;
    Frame m_frame;
    Frame m_pending;
    size_t m_lineNo;
    size_t m_skipped;
};

} // namespace codec
} // namespace glowlink
