// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceApi.cpp
 * @brief Device REST accessors
 */

#include "DeviceApi.h"
#include "../config/network_config.h"

#define GL_LOG_TAG "DeviceApi"
#include "../utils/Log.h"

namespace glowlink {
namespace protocol {

using namespace config::NetworkConfig;
using codec::HttpDeviceCodec;

namespace {

Status parseJson(const network::HttpResponse& response, const char* what, JsonDocument& doc) {
    char errorMsg[MAX_ERROR_MSG] = {0};
    if (!HttpDeviceCodec::parseBody(response.body, doc, errorMsg)) {
        return Status::fail(ErrorKind::PROTOCOL, "%s: %s", what, errorMsg);
    }
    return Status::ok();
}

Status getGestalt(network::IHttpClient& http, const std::string& host,
                  const AuthSession* auth, JsonDocument& doc) {
    network::HttpRequest request;
    request.method = network::HttpMethod::Get;
    request.url = network::makeUrl(host, EP_GESTALT);
    if (auth != nullptr) {
        auth->authorize(request);
    }

    network::HttpResponse response;
    Status status = http.perform(request, response);
    if (!status) {
        return status;
    }
    if (!response.isSuccess()) {
        return Status::fail(ErrorKind::PROTOCOL, "Gestalt failed with HTTP %ld", response.status);
    }
    return parseJson(response, "Gestalt", doc);
}

} // namespace

Status fetchDeviceInfo(network::IHttpClient& http, const std::string& host,
                       const AuthSession* auth, codec::DeviceInfo& out) {
    JsonDocument doc;
    Status status = getGestalt(http, host, auth, doc);
    if (!status) {
        return status;
    }

    codec::DeviceInfoDecodeResult result =
        HttpDeviceCodec::decodeDeviceInfo(doc.as<JsonObjectConst>());
    if (!result.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Gestalt: %s", result.errorMsg);
    }

    out = result.info;
    return Status::ok();
}

Status fetchGestaltIdentity(network::IHttpClient& http, const std::string& host,
                            codec::GestaltIdentity& out) {
    JsonDocument doc;
    Status status = getGestalt(http, host, nullptr, doc);
    if (!status) {
        return status;
    }

    codec::GestaltIdentityDecodeResult result =
        HttpDeviceCodec::decodeGestaltIdentity(doc.as<JsonObjectConst>());
    if (!result.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Gestalt: %s", result.errorMsg);
    }

    out = result.identity;
    return Status::ok();
}

DeviceApi::DeviceApi(network::IHttpClient& http, const AuthSession& auth)
    : m_http(http)
    , m_auth(auth) {
}

Status DeviceApi::send(network::HttpMethod method, const char* path, const std::string& body,
                       const char* contentType, network::HttpResponse& response,
                       long expectedStatus) {
    network::HttpRequest request;
    request.method = method;
    request.url = network::makeUrl(m_auth.host(), path);
    request.body = body;
    if (contentType != nullptr) {
        request.contentType = contentType;
    }
    m_auth.authorize(request);

    Status status = m_http.perform(request, response);
    if (!status) {
        return status;
    }
    if (response.status != expectedStatus) {
        return Status::fail(ErrorKind::PROTOCOL, "%s %s failed with HTTP %ld",
                            network::httpMethodName(method), path, response.status);
    }
    return Status::ok();
}

Status DeviceApi::getDeviceInfo(codec::DeviceInfo& out) {
    return fetchDeviceInfo(m_http, m_auth.host(), &m_auth, out);
}

Status DeviceApi::getMode(codec::DeviceMode& out) {
    network::HttpResponse response;
    Status status = send(network::HttpMethod::Get, EP_MODE, std::string(), nullptr, response, 200);
    if (!status) {
        return status;
    }

    JsonDocument doc;
    status = parseJson(response, "Mode", doc);
    if (!status) {
        return status;
    }

    codec::ModeDecodeResult result = HttpDeviceCodec::decodeMode(doc.as<JsonObjectConst>());
    if (!result.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Mode: %s", result.errorMsg);
    }
    out = result.mode;
    return Status::ok();
}

Status DeviceApi::setMode(codec::DeviceMode mode) {
    JsonDocument request;
    JsonObject obj = request.to<JsonObject>();
    HttpDeviceCodec::encodeMode(mode, obj);

    network::HttpResponse response;
    Status status = send(network::HttpMethod::Post, EP_MODE, HttpDeviceCodec::toBody(request),
                         "application/json", response, 200);
    if (!status) {
        return status;
    }

    // Older firmware answers with an empty body
    if (response.body.empty()) {
        return Status::ok();
    }

    JsonDocument doc;
    status = parseJson(response, "Set mode", doc);
    if (!status) {
        return status;
    }
    codec::CodeDecodeResult result = HttpDeviceCodec::decodeCode(doc.as<JsonObjectConst>());
    if (!result.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Set mode %s: %s",
                            codec::deviceModeName(mode), result.errorMsg);
    }
    GL_LOGD("Mode set to %s", codec::deviceModeName(mode));
    return Status::ok();
}

Status DeviceApi::getCapacity(uint32_t& availableFrames) {
    network::HttpResponse response;
    Status status = send(network::HttpMethod::Get, EP_MOVIES, std::string(), nullptr, response, 200);
    if (!status) {
        return status;
    }

    JsonDocument doc;
    status = parseJson(response, "Movies", doc);
    if (!status) {
        return status;
    }

    codec::CapacityDecodeResult result = HttpDeviceCodec::decodeCapacity(doc.as<JsonObjectConst>());
    if (!result.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Movies: %s", result.errorMsg);
    }
    availableFrames = result.availableFrames;
    return Status::ok();
}

Status DeviceApi::clearMovies() {
    network::HttpResponse response;
    return send(network::HttpMethod::Delete, EP_MOVIES, std::string(), nullptr, response, 204);
}

Status DeviceApi::uploadMovie(const std::vector<uint8_t>& body, uint32_t& movieId) {
    network::HttpResponse response;
    std::string payload(body.begin(), body.end());
    Status status = send(network::HttpMethod::Post, EP_MOVIE_FULL, payload,
                         "application/octet-stream", response, 200);
    if (!status) {
        return status;
    }

    JsonDocument doc;
    status = parseJson(response, "Movie upload", doc);
    if (!status) {
        return status;
    }

    codec::MovieIdDecodeResult result = HttpDeviceCodec::decodeMovieId(doc.as<JsonObjectConst>());
    if (!result.success) {
        return Status::fail(ErrorKind::PROTOCOL, "Movie upload: %s", result.errorMsg);
    }
    movieId = result.id;
    GL_LOGI("Uploaded movie %u (%zu bytes)", movieId, body.size());
    return Status::ok();
}

} // namespace protocol
} // namespace glowlink
