// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AuthSession.cpp
 * @brief Device handshake implementation
 */

#include "AuthSession.h"
#include "../codec/HttpDeviceCodec.h"
#include "../config/network_config.h"
#include "../crypto/AuthCrypto.h"

#include <mutex>

#define GL_LOG_TAG "Auth"
#include "../utils/Log.h"

namespace glowlink {
namespace protocol {

using namespace config::NetworkConfig;
using codec::HttpDeviceCodec;

AuthSession::AuthSession(network::IHttpClient& http, const std::string& host,
                         const std::string& mac)
    : m_http(http)
    , m_host(host)
    , m_mac(mac) {
}

Status AuthSession::runHandshake(std::string& tokenOut, std::vector<uint8_t>& tokenBytesOut) {
    uint8_t mac[MAC_LENGTH];
    if (!crypto::parseMac(m_mac.c_str(), mac)) {
        return Status::fail(ErrorKind::VALIDATION, "Invalid MAC address: %s", m_mac.c_str());
    }

    uint8_t challenge[CHALLENGE_LENGTH];
    if (!crypto::generateChallenge(challenge, sizeof(challenge))) {
        return Status::fail(ErrorKind::PROTOCOL, "Could not generate challenge");
    }

    std::string challengeB64;
    if (!crypto::base64Encode(challenge, sizeof(challenge), challengeB64)) {
        return Status::fail(ErrorKind::PROTOCOL, "Could not encode challenge");
    }

    // ------------------------------------------------------------------------
    // Step 1: login
    // ------------------------------------------------------------------------
    network::HttpRequest login;
    login.method = network::HttpMethod::Post;
    login.url = network::makeUrl(m_host, EP_LOGIN);
    login.contentType = "application/json";
    {
        JsonDocument doc;
        JsonObject obj = doc.to<JsonObject>();
        HttpDeviceCodec::encodeChallenge(challengeB64.c_str(), obj);
        login.body = HttpDeviceCodec::toBody(doc);
    }

    network::HttpResponse response;
    Status status = m_http.perform(login, response);
    if (!status) {
        return status;
    }
    if (!response.isSuccess()) {
        return Status::fail(ErrorKind::PROTOCOL, "Login failed with HTTP %ld", response.status);
    }

    char errorMsg[MAX_ERROR_MSG] = {0};
    JsonDocument loginDoc;
    if (!HttpDeviceCodec::parseBody(response.body, loginDoc, errorMsg)) {
        return Status::fail(ErrorKind::PROTOCOL, "Login: %s", errorMsg);
    }
    codec::LoginDecodeResult loginResult =
        HttpDeviceCodec::decodeLogin(loginDoc.as<JsonObjectConst>());
    if (!loginResult.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Login: %s", loginResult.errorMsg);
    }

    std::vector<uint8_t> rawToken;
    if (!crypto::base64Decode(loginResult.response.authenticationToken, rawToken) ||
        rawToken.empty() || rawToken.size() > TOKEN_MAX_BYTES) {
        return Status::fail(ErrorKind::PROTOCOL, "Login returned an undecodable token");
    }

    // ------------------------------------------------------------------------
    // Step 2: local challenge-response
    // ------------------------------------------------------------------------
    char localResponse[crypto::CHALLENGE_RESPONSE_HEX_LEN + 1];
    if (!crypto::makeChallengeResponse(challenge, sizeof(challenge), mac, localResponse)) {
        return Status::fail(ErrorKind::PROTOCOL, "Could not compute challenge-response");
    }
    if (loginResult.response.challengeResponse != localResponse) {
        // The device's own digest is informational; verify decides.
        GL_LOGW("Device challenge-response differs from local digest (%s)", m_host.c_str());
    }

    // ------------------------------------------------------------------------
    // Step 3: verify
    // ------------------------------------------------------------------------
    network::HttpRequest verify;
    verify.method = network::HttpMethod::Post;
    verify.url = network::makeUrl(m_host, EP_VERIFY);
    verify.contentType = "application/json";
    verify.headers.emplace_back(AUTH_HEADER, loginResult.response.authenticationToken);
    {
        JsonDocument doc;
        JsonObject obj = doc.to<JsonObject>();
        HttpDeviceCodec::encodeVerify(localResponse, obj);
        verify.body = HttpDeviceCodec::toBody(doc);
    }

    status = m_http.perform(verify, response);
    if (!status) {
        return status;
    }
    if (!response.isSuccess()) {
        return Status::fail(ErrorKind::PROTOCOL, "Verify failed with HTTP %ld", response.status);
    }

    JsonDocument verifyDoc;
    if (!HttpDeviceCodec::parseBody(response.body, verifyDoc, errorMsg)) {
        return Status::fail(ErrorKind::PROTOCOL, "Verify: %s", errorMsg);
    }
    codec::CodeDecodeResult verifyResult =
        HttpDeviceCodec::decodeCode(verifyDoc.as<JsonObjectConst>());
    if (!verifyResult.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Verify rejected: %s", verifyResult.errorMsg);
    }

    tokenOut = loginResult.response.authenticationToken;
    tokenBytesOut.swap(rawToken);
    return Status::ok();
}

Status AuthSession::authenticate() {
    std::string token;
    std::vector<uint8_t> bytes;
    Status status = runHandshake(token, bytes);
    if (!status) {
        GL_LOGE("Authentication with %s failed: %s", m_host.c_str(), status.errorMsg);
        return status;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_tokenMutex);
        m_token.swap(token);
        m_tokenBytes.swap(bytes);
    }
    GL_LOGI("Authenticated with %s (token %zu bytes)", m_host.c_str(), tokenBytes().size());
    return Status::ok();
}

bool AuthSession::reauthenticate() {
    return static_cast<bool>(authenticate());
}

bool AuthSession::hasToken() const {
    std::shared_lock<std::shared_mutex> lock(m_tokenMutex);
    return !m_token.empty();
}

std::string AuthSession::token() const {
    std::shared_lock<std::shared_mutex> lock(m_tokenMutex);
    return m_token;
}

std::vector<uint8_t> AuthSession::tokenBytes() const {
    std::shared_lock<std::shared_mutex> lock(m_tokenMutex);
    return m_tokenBytes;
}

void AuthSession::authorize(network::HttpRequest& request) const {
    std::shared_lock<std::shared_mutex> lock(m_tokenMutex);
    request.headers.emplace_back(AUTH_HEADER, m_token);
}

} // namespace protocol
} // namespace glowlink
