// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CurlHttpClient.h
 * @brief IHttpClient backed by a reusable libcurl easy handle
 */

#pragma once

#include <curl/curl.h>

#include <mutex>

#include "IHttpClient.h"

namespace glowlink {
namespace network {

/**
 * @brief Blocking HTTP client
 *
 * Thread-safe: requests on one instance are serialized on an internal mutex.
 */
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(uint32_t timeoutMs);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Status perform(const HttpRequest& request, HttpResponse& response) override;

private:
    CURL* m_curl;
    uint32_t m_timeoutMs;
    std::mutex m_mutex;
};

} // namespace network
} // namespace glowlink
