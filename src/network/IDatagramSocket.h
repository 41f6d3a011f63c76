// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IDatagramSocket.h
 * @brief Abstract UDP socket used by discovery and real-time streaming
 *
 * Implementations:
 * - UdpSocket: POSIX BSD socket (production)
 * - MockDatagramSocket: records sends, replays scripted receives (unit tests)
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

namespace glowlink {
namespace network {

class IDatagramSocket {
public:
    static constexpr int SOCK_ERROR = -1;
    static constexpr int RECV_TIMEOUT = -2;

    virtual ~IDatagramSocket() = default;

    /**
     * @brief Create and bind to an ephemeral local port
     * @param broadcast Enable SO_BROADCAST
     */
    virtual bool open(bool broadcast) = 0;

    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Fix the default destination used by send()
     */
    virtual bool connect(const char* host, uint16_t port) = 0;

    /**
     * @return Bytes sent, or SOCK_ERROR
     */
    virtual int send(const uint8_t* data, size_t len) = 0;

    /**
     * @return Bytes sent, or SOCK_ERROR
     */
    virtual int sendTo(const char* host, uint16_t port, const uint8_t* data, size_t len) = 0;

    /**
     * @brief Wait up to timeoutMs for one datagram
     * @return Bytes received, RECV_TIMEOUT, or SOCK_ERROR
     */
    virtual int receive(uint8_t* buffer, size_t capacity, uint32_t timeoutMs) = 0;

    /**
     * @brief Description of the most recent failure
     */
    virtual const char* lastError() const = 0;
};

} // namespace network
} // namespace glowlink
