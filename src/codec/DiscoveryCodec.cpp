// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DiscoveryCodec.cpp
 * @brief Discovery ping/reply codec implementation
 */

#include "DiscoveryCodec.h"
#include "../config/network_config.h"

#include <cstdio>
#include <cstring>

namespace glowlink {
namespace codec {

std::string DiscoveryResponse::ipString() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return std::string(buf);
}

std::vector<uint8_t> DiscoveryCodec::encodePing() {
    using namespace config::NetworkConfig;

    std::vector<uint8_t> ping;
    ping.push_back(DISCOVERY_MARKER);
    const char* text = DISCOVERY_PING;
    ping.insert(ping.end(), text, text + strlen(text));
    return ping;
}

bool DiscoveryCodec::decode(const uint8_t* data, size_t len, DiscoveryResponse& out) {
    if (data == nullptr || len < DISCOVERY_MIN_REPLY) {
        return false;
    }
    if (data[len - 1] != 0) {
        return false;
    }
    if (data[4] != 'O' || data[5] != 'K') {
        return false;
    }

    // Id stops at the first terminator; replies may be zero-padded
    size_t end = 6;
    while (end < len && data[end] != 0) {
        if (data[end] >= 0x80) {
            return false;
        }
        end++;
    }

    out.ip[0] = data[3];
    out.ip[1] = data[2];
    out.ip[2] = data[1];
    out.ip[3] = data[0];
    out.deviceId.assign(reinterpret_cast<const char*>(data + 6), end - 6);
    return true;
}

} // namespace codec
} // namespace glowlink
