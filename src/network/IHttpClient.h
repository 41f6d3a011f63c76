// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IHttpClient.h
 * @brief Abstract HTTP client used for the device JSON API
 *
 * Implementations:
 * - CurlHttpClient: libcurl easy interface (production)
 * - MockHttpClient: scripted responses (unit tests)
 */

#pragma once

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include "../core/Status.h"

namespace glowlink {
namespace network {

enum class HttpMethod : uint8_t {
    Get = 0,
    Post,
    Delete
};

inline const char* httpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Build "http://<host><path>"
 */
inline std::string makeUrl(const std::string& host, const char* path) {
    return "http://" + host + path;
}

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform a request
     *
     * A completed exchange is a success regardless of HTTP status; the caller
     * interprets the status code.
     *
     * @return TRANSPORT failure if no response was received
     */
    virtual Status perform(const HttpRequest& request, HttpResponse& response) = 0;
};

} // namespace network
} // namespace glowlink
