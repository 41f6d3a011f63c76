// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DiscoveryCodec.h
 * @brief Binary codec for the UDP discovery ping and its replies
 *
 * Ping: 0x01 "discover" (9 bytes), broadcast to the discovery port.
 * Reply: [ip3][ip2][ip1][ip0] "OK" <device id ASCII> 0x00
 * The IP is stored little-endian, i.e. reversed relative to dotted order.
 *
 * @author GlowLink Team
 * @version 1.0.0
 */

#pragma once

#include <stdint.h>
#include <cstddef>
#include <string>
#include <vector>

namespace glowlink {
namespace codec {

static constexpr size_t DISCOVERY_MIN_REPLY = 8;

/**
 * @brief Decoded discovery reply
 */
struct DiscoveryResponse {
    uint8_t ip[4];          // dotted order: ip[0].ip[1].ip[2].ip[3]
    std::string deviceId;

    DiscoveryResponse() : ip{0, 0, 0, 0} {}

    std::string ipString() const;

    bool operator==(const DiscoveryResponse& other) const {
        return ip[0] == other.ip[0] && ip[1] == other.ip[1] &&
               ip[2] == other.ip[2] && ip[3] == other.ip[3] &&
               deviceId == other.deviceId;
    }
};

class DiscoveryCodec {
public:
    /**
     * @brief Build the broadcast ping payload
     */
    static std::vector<uint8_t> encodePing();

    /**
     * @brief Decode a discovery reply
     *
     * Valid iff len >= 8, the last byte is 0 and bytes[4..6] == "OK".
     * The id runs from byte 6 to the first zero byte and must be ASCII.
     *
     * @return false for packets that are not discovery replies
     */
    static bool decode(const uint8_t* data, size_t len, DiscoveryResponse& out);
};

} // namespace codec
} // namespace glowlink
