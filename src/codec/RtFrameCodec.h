// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RtFrameCodec.h
 * @brief Real-time frame encoder for the device UDP streaming port
 *
 * Wire formats (token = raw bytes of the base64 session token):
 *   v1: [0x01][token][led_count u8][frame bytes]               single datagram
 *   v2: [0x02][token][0x00][frame bytes]                       single datagram
 *   v3: [0x03][token][0x00][0x00][chunk index u8][<=900 bytes] one datagram per chunk
 *
 * Frame bytes are LED triples in index order (see flatten()).
 *
 * Pure encoding only; sending lives in network::FrameTransport.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "../core/RGB.h"
#include "../core/Status.h"

namespace glowlink {
namespace codec {

enum class RtProtocolVersion : uint8_t {
    V1 = 1,
    V2 = 2,
    V3 = 3
};

/**
 * @brief Header fields recovered from an encoded packet
 */
struct RtPacketHeader {
    RtProtocolVersion version;
    uint8_t ledCount;       // v1 only
    uint8_t chunkIndex;     // v3 only
    size_t headerSize;
    size_t payloadSize;
};

using RtPacket = std::vector<uint8_t>;

class RtFrameCodec {
public:
    /**
     * @brief Flatten a frame to r,g,b bytes in LED order
     */
    static std::vector<uint8_t> flatten(const Frame& frame);

    /**
     * @brief Number of v3 datagrams needed for frameBytes: ceil(frameBytes / 900)
     */
    static size_t chunkCount(size_t frameBytes);

    static size_t headerSize(RtProtocolVersion version, size_t tokenLen);

    /**
     * @brief Encode one frame into one (v1/v2) or more (v3) packets
     * @param ledCount Written into the v1 header; must fit one byte for v1
     * @return VALIDATION failure for an empty token/frame, a v1 LED count
     *         above 255, or a v3 frame needing more than 256 chunks
     */
    static Status encode(RtProtocolVersion version,
                         const std::vector<uint8_t>& token,
                         const uint8_t* frame, size_t frameLen,
                         size_t ledCount,
                         std::vector<RtPacket>& packets);

    /**
     * @brief Parse the header of an encoded packet
     * @return false if the packet is too short or the version byte is unknown
     */
    static bool parseHeader(const uint8_t* packet, size_t len, size_t tokenLen,
                            RtPacketHeader& out);
};

} // namespace codec
} // namespace glowlink
