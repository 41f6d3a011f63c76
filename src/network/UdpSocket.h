// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file UdpSocket.h
 * @brief POSIX UDP socket
 */

#pragma once

#include "IDatagramSocket.h"
#include "../core/Status.h"

namespace glowlink {
namespace network {

class UdpSocket : public IDatagramSocket {
public:
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    bool open(bool broadcast) override;
    void close() override;
    bool isOpen() const override { return m_fd >= 0; }
    bool connect(const char* host, uint16_t port) override;
    int send(const uint8_t* data, size_t len) override;
    int sendTo(const char* host, uint16_t port, const uint8_t* data, size_t len) override;
    int receive(uint8_t* buffer, size_t capacity, uint32_t timeoutMs) override;
    const char* lastError() const override { return m_lastError; }

private:
    void setError(const char* what, int err);

    int m_fd;
    char m_lastError[MAX_ERROR_MSG];
};

} // namespace network
} // namespace glowlink
