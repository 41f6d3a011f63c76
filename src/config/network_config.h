// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file network_config.h
 * @brief Network and device protocol configuration for GlowLink
 *
 * Ports, endpoint paths and timeouts used to talk to the LED devices.
 * Values marked overridable can be changed with build flags, e.g.:
 *   -D GL_HTTP_TIMEOUT_MS=5000
 *   -D GL_DISCOVERY_TIMEOUT_MS=3000
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace glowlink {
namespace config {

/**
 * @brief Network configuration constants
 */
namespace NetworkConfig {
    // ========================================================================
    // UDP Ports
    // ========================================================================

    constexpr uint16_t DISCOVERY_PORT = 5555;
    constexpr uint16_t RT_PORT = 7777;
    constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";

    // ========================================================================
    // Discovery
    // ========================================================================

    #ifdef GL_DISCOVERY_TIMEOUT_MS
        constexpr uint32_t DISCOVERY_TIMEOUT_MS = GL_DISCOVERY_TIMEOUT_MS;
    #else
        constexpr uint32_t DISCOVERY_TIMEOUT_MS = 1000;
    #endif

    constexpr uint8_t DISCOVERY_MARKER = 0x01;
    constexpr const char* DISCOVERY_PING = "discover";
    constexpr size_t DISCOVERY_MAX_PACKET = 1024;

    // ========================================================================
    // Real-Time Streaming
    // ========================================================================

    // Largest v3 chunk payload; the device reassembles by chunk index
    constexpr size_t RT_CHUNK_PAYLOAD = 900;
    constexpr size_t RT_MAX_CHUNKS = 256;
    constexpr uint32_t RT_DEFAULT_FRAME_RATE = 25;

    // ========================================================================
    // HTTP
    // ========================================================================

    #ifdef GL_HTTP_TIMEOUT_MS
        constexpr uint32_t HTTP_TIMEOUT_MS = GL_HTTP_TIMEOUT_MS;
    #else
        constexpr uint32_t HTTP_TIMEOUT_MS = 3000;
    #endif

    constexpr const char* AUTH_HEADER = "X-Auth-Token";

    constexpr const char* EP_LOGIN = "/xled/v1/login";
    constexpr const char* EP_VERIFY = "/xled/v1/verify";
    constexpr const char* EP_GESTALT = "/xled/v1/gestalt";
    constexpr const char* EP_MODE = "/xled/v1/led/mode";
    constexpr const char* EP_MOVIES = "/xled/v1/led/movies";
    constexpr const char* EP_MOVIE_FULL = "/xled/v1/led/movie/full";

    // ========================================================================
    // Authentication
    // ========================================================================

    // Fixed secret XORed with the device MAC to form the RC4 key
    constexpr const char* SHARED_SECRET = "evenmoresecret!!";
    constexpr size_t SHARED_SECRET_LEN = 16;
    constexpr size_t CHALLENGE_LENGTH = 32;
    constexpr size_t MAC_LENGTH = 6;
    constexpr size_t TOKEN_MAX_BYTES = 64;

} // namespace NetworkConfig

} // namespace config
} // namespace glowlink
