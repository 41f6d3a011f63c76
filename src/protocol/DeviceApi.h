// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceApi.h
 * @brief Plain REST accessors of the device HTTP API
 *
 * Every call maps to one request. Errors:
 * - TRANSPORT: no HTTP response
 * - PROTOCOL:  unexpected HTTP status, malformed JSON, non-Ok response code
 *
 * Nothing here retries.
 */

#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "AuthSession.h"
#include "../codec/HttpDeviceCodec.h"
#include "../core/Status.h"
#include "../network/IHttpClient.h"

namespace glowlink {
namespace protocol {

/**
 * @brief Fetch the gestalt description
 * @param auth Session whose token is sent, or nullptr for an unauthenticated query
 */
Status fetchDeviceInfo(network::IHttpClient& http, const std::string& host,
                       const AuthSession* auth, codec::DeviceInfo& out);

/**
 * @brief Unauthenticated gestalt query for MAC and friendly name only
 */
Status fetchGestaltIdentity(network::IHttpClient& http, const std::string& host,
                            codec::GestaltIdentity& out);

class DeviceApi {
public:
    DeviceApi(network::IHttpClient& http, const AuthSession& auth);

    Status getDeviceInfo(codec::DeviceInfo& out);
    Status getMode(codec::DeviceMode& out);
    Status setMode(codec::DeviceMode mode);

    /**
     * @brief Frames still free in movie storage
     */
    Status getCapacity(uint32_t& availableFrames);

    Status clearMovies();

    /**
     * @brief Upload an encoded movie body (see codec::MovieCodec)
     * @param movieId Receives the id assigned by the device
     */
    Status uploadMovie(const std::vector<uint8_t>& body, uint32_t& movieId);

private:
    Status send(network::HttpMethod method, const char* path, const std::string& body,
                const char* contentType, network::HttpResponse& response,
                long expectedStatus);

    network::IHttpClient& m_http;
    const AuthSession& m_auth;
};

} // namespace protocol
} // namespace glowlink
