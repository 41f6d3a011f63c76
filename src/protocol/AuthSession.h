// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AuthSession.h
 * @brief MAC-keyed challenge-response handshake and session token holder
 *
 * Handshake:
 *   1. POST base64(32 random bytes) to /login; device returns a token and
 *      its own challenge-response.
 *   2. Compute hex(SHA-1(RC4(secret XOR mac, challenge))).
 *   3. POST it to /verify with the token in X-Auth-Token; code 1000 = success.
 *
 * Token access is guarded by a readers-writer lock. reauthenticate() runs the
 * whole handshake unlocked and swaps the token under the exclusive lock, so
 * readers always see either the old or the new token. Serializing frames that
 * are already in flight against a reauthentication is the caller's job.
 *
 * @author GlowLink Team
 * @version 1.0.0
 */

#pragma once

#include <stdint.h>
#include <shared_mutex>
#include <string>
#include <vector>

#include "../core/Status.h"
#include "../network/IHttpClient.h"

namespace glowlink {
namespace protocol {

class AuthSession {
public:
    /**
     * @param http Client used for the handshake; must outlive the session
     * @param host Device IPv4 address
     * @param mac  Device MAC "aa:bb:cc:dd:ee:ff"
     */
    AuthSession(network::IHttpClient& http, const std::string& host, const std::string& mac);

    /**
     * @brief Run the handshake and store the token
     * @return VALIDATION for a malformed MAC, TRANSPORT if the device is
     *         unreachable, PROTOCOL for any rejected or malformed exchange
     */
    Status authenticate();

    /**
     * @brief Re-run the handshake and replace the token on success
     *
     * The previous token stays in place when the handshake fails.
     */
    bool reauthenticate();

    bool hasToken() const;

    /**
     * @brief Current base64 token (empty before authenticate())
     */
    std::string token() const;

    /**
     * @brief Raw decoded token bytes, as embedded in real-time packets
     */
    std::vector<uint8_t> tokenBytes() const;

    /**
     * @brief Add the X-Auth-Token header carrying the current token
     */
    void authorize(network::HttpRequest& request) const;

    const std::string& host() const { return m_host; }
    const std::string& mac() const { return m_mac; }

private:
    Status runHandshake(std::string& tokenOut, std::vector<uint8_t>& tokenBytesOut);

    network::IHttpClient& m_http;
    std::string m_host;
    std::string m_mac;

    mutable std::shared_mutex m_tokenMutex;
    std::string m_token;
    std::vector<uint8_t> m_tokenBytes;
};

} // namespace protocol
} // namespace glowlink
