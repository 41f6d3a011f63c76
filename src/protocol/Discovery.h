// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Discovery.h
 * @brief UDP broadcast discovery of devices on the local network
 *
 * scan():
 *   1. Broadcast 0x01 "discover" to the discovery port.
 *   2. Receive replies until a deadline fixed once at loop entry. A socket
 *      error ends the scan early.
 *   3. Replies already seen in this scan (id + IP) are skipped. Replies
 *      matching a known device are reported as rediscovered, without a new
 *      handshake.
 *   4. New devices: unauthenticated gestalt (MAC, name), full handshake, then
 *      an authenticated gestalt for the LED count. A failure here drops only
 *      that device.
 */

#pragma once

#include <stdint.h>
#include <cstdio>
#include <string>
#include <vector>

#include "DeviceIdentifier.h"
#include "../codec/DiscoveryCodec.h"
#include "../config/network_config.h"
#include "../core/Clock.h"
#include "../core/Status.h"
#include "../network/IDatagramSocket.h"
#include "../network/IHttpClient.h"

namespace glowlink {
namespace protocol {

struct DiscoveryOptions {
    uint32_t timeoutMs = config::NetworkConfig::DISCOVERY_TIMEOUT_MS;
    std::string broadcastAddress = config::NetworkConfig::BROADCAST_ADDRESS;
    uint16_t port = config::NetworkConfig::DISCOVERY_PORT;

    /// Devices found by an earlier scan; matches are reported as rediscovered
    const std::vector<DeviceIdentifier>* knownDevices = nullptr;
};

struct DiscoveryReport {
    Status status;
    std::vector<DeviceIdentifier> discovered;
    std::vector<DeviceIdentifier> rediscovered;

    uint32_t packetsReceived = 0;
    uint32_t invalidPackets = 0;
    uint32_t duplicates = 0;
    uint32_t failedDevices = 0;
};

class Discovery {
public:
    /**
     * @param socket Unopened socket; scan() opens and closes it
     * @param http   Client for the gestalt and handshake requests
     * @param clock  Millisecond clock (defaults to monotonicMillis)
     */
    Discovery(network::IDatagramSocket& socket, network::IHttpClient& http,
              MillisClock clock = MillisClock());

    DiscoveryReport scan(const DiscoveryOptions& options);

    /**
     * @brief Print a fixed-width table (IP, id, MAC, name, LED count)
     */
    static void printTable(const std::vector<DeviceIdentifier>& devices, FILE* out);

    /**
     * @brief Render devices as a JSON array
     */
    static std::string toJson(const std::vector<DeviceIdentifier>& devices);

private:
    Status identify(const codec::DiscoveryResponse& reply, DeviceIdentifier& out);

    network::IDatagramSocket& m_socket;
    network::IHttpClient& m_http;
    MillisClock m_clock;
};

} // namespace protocol
} // namespace glowlink
