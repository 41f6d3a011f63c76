// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameTransport.h
 * @brief Sends encoded real-time frames to one device over UDP
 *
 * Owns a single socket, opened once in begin() and reused for every frame.
 * Fire-and-forget: no ACKs, no retransmits. A lost v3 chunk only degrades
 * that frame.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "IDatagramSocket.h"
#include "../codec/RtFrameCodec.h"
#include "../core/Status.h"

namespace glowlink {
namespace network {

class FrameTransport {
public:
    struct Stats {
        uint32_t framesAttempted = 0;
        uint32_t framesSent = 0;
        uint32_t frameFailures = 0;
        uint32_t datagramsSent = 0;
        uint64_t bytesSent = 0;
    };

    explicit FrameTransport(std::unique_ptr<IDatagramSocket> socket,
                            codec::RtProtocolVersion version = codec::RtProtocolVersion::V3);
    ~FrameTransport();

    FrameTransport(const FrameTransport&) = delete;
    FrameTransport& operator=(const FrameTransport&) = delete;

    /**
     * @brief Open the socket and fix the device as its destination
     */
    Status begin(const std::string& host, uint16_t port);

    void stop();

    bool isStarted() const { return m_started; }

    /**
     * @brief Encode and send one frame
     *
     * v3 chunks go out in ascending index order. The first socket error aborts
     * the remaining chunks. Concurrent callers are serialized.
     *
     * @param bytesWritten Total datagram bytes written (sum across chunks)
     * @return VALIDATION for encoding errors, TRANSPORT for socket errors
     */
    Status sendFrame(const std::vector<uint8_t>& token,
                     const uint8_t* frame, size_t frameLen,
                     size_t ledCount, size_t& bytesWritten);

    void getStats(Stats& outStats) const;

private:
    std::unique_ptr<IDatagramSocket> m_socket;
    const codec::RtProtocolVersion m_version;
    bool m_started;
    std::string m_host;
    uint16_t m_port;

    mutable std::mutex m_sendMutex;
    std::vector<codec::RtPacket> m_packets;
    Stats m_stats;
};

} // namespace network
} // namespace glowlink
