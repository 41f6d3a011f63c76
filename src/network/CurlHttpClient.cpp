// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CurlHttpClient.cpp
 * @brief libcurl implementation of the device HTTP client
 */

#include "CurlHttpClient.h"
#include "../config/version.h"

#define GL_LOG_TAG "Http"
#include "../utils/Log.h"

namespace glowlink {
namespace network {

namespace {

std::once_flag s_globalInit;

size_t appendBody(char* data, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

/**
 * @brief Owns a curl_slist for the duration of one request
 */
class HeaderList {
public:
    HeaderList() : m_list(nullptr) {}
    ~HeaderList() { curl_slist_free_all(m_list); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    bool add(const std::string& line) {
        curl_slist* next = curl_slist_append(m_list, line.c_str());
        if (next == nullptr) return false;
        m_list = next;
        return true;
    }

    curl_slist* get() const { return m_list; }

private:
    curl_slist* m_list;
};

} // namespace

CurlHttpClient::CurlHttpClient(uint32_t timeoutMs)
    : m_curl(nullptr)
    , m_timeoutMs(timeoutMs) {
    std::call_once(s_globalInit, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    m_curl = curl_easy_init();
    if (m_curl == nullptr) {
        GL_LOGE("curl_easy_init failed");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (m_curl != nullptr) {
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
    }
}

Status CurlHttpClient::perform(const HttpRequest& request, HttpResponse& response) {
    std::lock_guard<std::mutex> lock(m_mutex);

    response = HttpResponse();
    if (m_curl == nullptr) {
        return Status::fail(ErrorKind::TRANSPORT, "HTTP client not initialised");
    }

    curl_easy_reset(m_curl);

    HeaderList headers;
    for (const auto& header : request.headers) {
        if (!headers.add(header.first + ": " + header.second)) {
            return Status::fail(ErrorKind::TRANSPORT, "Out of memory building headers");
        }
    }
    if (!request.contentType.empty() &&
        !headers.add("Content-Type: " + request.contentType)) {
        return Status::fail(ErrorKind::TRANSPORT, "Out of memory building headers");
    }

    curl_easy_setopt(m_curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(m_curl, CURLOPT_USERAGENT, GLOWLINK_USER_AGENT);
    curl_easy_setopt(m_curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeoutMs));
    curl_easy_setopt(m_curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, &response.body);
    if (headers.get() != nullptr) {
        curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, headers.get());
    }

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(m_curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(m_curl, CURLOPT_POST, 1L);
            curl_easy_setopt(m_curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(m_curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::Delete:
            curl_easy_setopt(m_curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    CURLcode rc = curl_easy_perform(m_curl);
    if (rc != CURLE_OK) {
        GL_LOGD("%s %s failed: %s", httpMethodName(request.method), request.url.c_str(),
                curl_easy_strerror(rc));
        return Status::fail(ErrorKind::TRANSPORT, "%s %s: %s", httpMethodName(request.method),
                            request.url.c_str(), curl_easy_strerror(rc));
    }

    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &response.status);
    GL_LOGD("%s %s -> %ld (%zu bytes)", httpMethodName(request.method), request.url.c_str(),
            response.status, response.body.size());
    return Status::ok();
}

} // namespace network
} // namespace glowlink
