// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceIdentifier.h
 * @brief Identity record for a discovered device
 *
 * The session token rides along so a rediscovered device does not need a new
 * handshake, but it is a volatile credential: equality, ordering and hashing
 * ignore it.
 */

#pragma once

#include <stdint.h>
#include <cstddef>
#include <functional>
#include <string>
#include <tuple>

namespace glowlink {
namespace protocol {

struct DeviceIdentifier {
    std::string ipAddress;
    std::string deviceId;      // discovery instance id
    std::string macAddress;
    std::string deviceName;
    uint32_t ledCount = 0;
    std::string token;         // base64, empty if none

    bool hasToken() const { return !token.empty(); }

    /**
     * @brief True if this record describes the given discovery reply
     */
    bool matches(const std::string& ip, const std::string& id) const {
        return ipAddress == ip && deviceId == id;
    }

    bool operator==(const DeviceIdentifier& other) const {
        return key() == other.key();
    }
    bool operator!=(const DeviceIdentifier& other) const {
        return !(*this == other);
    }
    bool operator<(const DeviceIdentifier& other) const {
        return key() < other.key();
    }

private:
    std::tuple<const std::string&, const std::string&, const std::string&,
               const std::string&, const uint32_t&> key() const {
        return std::tie(ipAddress, deviceId, macAddress, deviceName, ledCount);
    }
};

} // namespace protocol
} // namespace glowlink

namespace std {

template <>
struct hash<glowlink::protocol::DeviceIdentifier> {
    size_t operator()(const glowlink::protocol::DeviceIdentifier& d) const {
        size_t h = hash<string>()(d.ipAddress);
        h = h * 31 + hash<string>()(d.deviceId);
        h = h * 31 + hash<string>()(d.macAddress);
        h = h * 31 + hash<string>()(d.deviceName);
        h = h * 31 + hash<uint32_t>()(d.ledCount);
        return h;
    }
};

} // namespace std
