// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RtFrameCodec.cpp
 * @brief Versioned real-time frame encoder
 */

#include "RtFrameCodec.h"
#include "../config/network_config.h"

#include <algorithm>
#include <utility>

namespace glowlink {
namespace codec {

using config::NetworkConfig::RT_CHUNK_PAYLOAD;
using config::NetworkConfig::RT_MAX_CHUNKS;

std::vector<uint8_t> RtFrameCodec::flatten(const Frame& frame) {
    std::vector<uint8_t> bytes;
    bytes.reserve(frame.size() * 3);
    for (const RGB& c : frame) {
        bytes.push_back(c.r);
        bytes.push_back(c.g);
        bytes.push_back(c.b);
    }
    return bytes;
}

size_t RtFrameCodec::chunkCount(size_t frameBytes) {
    return (frameBytes + RT_CHUNK_PAYLOAD - 1) / RT_CHUNK_PAYLOAD;
}

size_t RtFrameCodec::headerSize(RtProtocolVersion version, size_t tokenLen) {
    switch (version) {
        case RtProtocolVersion::V1:
        case RtProtocolVersion::V2:
            return 1 + tokenLen + 1;
        case RtProtocolVersion::V3:
            return 1 + tokenLen + 3;
    }
    return 0;
}

Status RtFrameCodec::encode(RtProtocolVersion version,
                            const std::vector<uint8_t>& token,
                            const uint8_t* frame, size_t frameLen,
                            size_t ledCount,
                            std::vector<RtPacket>& packets) {
    packets.clear();

    if (token.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "No session token");
    }
    if (frame == nullptr || frameLen == 0) {
        return Status::fail(ErrorKind::VALIDATION, "Empty frame");
    }

    const uint8_t versionByte = static_cast<uint8_t>(version);
    const size_t header = headerSize(version, token.size());

    switch (version) {
        case RtProtocolVersion::V1: {
            if (ledCount > 255) {
                return Status::fail(ErrorKind::VALIDATION,
                                    "v1 frames carry at most 255 LEDs: %zu", ledCount);
            }
            RtPacket packet;
            packet.reserve(header + frameLen);
            packet.push_back(versionByte);
            packet.insert(packet.end(), token.begin(), token.end());
            packet.push_back(static_cast<uint8_t>(ledCount));
            packet.insert(packet.end(), frame, frame + frameLen);
            packets.push_back(std::move(packet));
            break;
        }
        case RtProtocolVersion::V2: {
            RtPacket packet;
            packet.reserve(header + frameLen);
            packet.push_back(versionByte);
            packet.insert(packet.end(), token.begin(), token.end());
            packet.push_back(0);
            packet.insert(packet.end(), frame, frame + frameLen);
            packets.push_back(std::move(packet));
            break;
        }
        case RtProtocolVersion::V3: {
            const size_t chunks = chunkCount(frameLen);
            if (chunks > RT_MAX_CHUNKS) {
                return Status::fail(ErrorKind::VALIDATION,
                                    "Frame needs %zu chunks (max %zu)", chunks, RT_MAX_CHUNKS);
            }
            packets.reserve(chunks);
            for (size_t i = 0; i < chunks; i++) {
                const size_t offset = i * RT_CHUNK_PAYLOAD;
                const size_t len = std::min(RT_CHUNK_PAYLOAD, frameLen - offset);
                RtPacket packet;
                packet.reserve(header + len);
                packet.push_back(versionByte);
                packet.insert(packet.end(), token.begin(), token.end());
                packet.push_back(0);
                packet.push_back(0);
                packet.push_back(static_cast<uint8_t>(i));
                packet.insert(packet.end(), frame + offset, frame + offset + len);
                packets.push_back(std::move(packet));
            }
            break;
        }
        default:
            return Status::fail(ErrorKind::VALIDATION, "Unknown protocol version %u", versionByte);
    }

    return Status::ok();
}

bool RtFrameCodec::parseHeader(const uint8_t* packet, size_t len, size_t tokenLen,
                               RtPacketHeader& out) {
    if (packet == nullptr || len == 0) return false;

    switch (packet[0]) {
        case 1: out.version = RtProtocolVersion::V1; break;
        case 2: out.version = RtProtocolVersion::V2; break;
        case 3: out.version = RtProtocolVersion::V3; break;
        default: return false;
    }

    out.headerSize = headerSize(out.version, tokenLen);
    if (len < out.headerSize) return false;

    out.ledCount = (out.version == RtProtocolVersion::V1) ? packet[1 + tokenLen] : 0;
    out.chunkIndex = (out.version == RtProtocolVersion::V3) ? packet[out.headerSize - 1] : 0;
    out.payloadSize = len - out.headerSize;
    return true;
}

} // namespace codec
} // namespace glowlink
