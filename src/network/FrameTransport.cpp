// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameTransport.cpp
 * @brief Real-time frame sender
 */

#include "FrameTransport.h"

#include <utility>

#define GL_LOG_TAG "RtSend"
#include "../utils/Log.h"

namespace glowlink {
namespace network {

FrameTransport::FrameTransport(std::unique_ptr<IDatagramSocket> socket,
                               codec::RtProtocolVersion version)
    : m_socket(std::move(socket))
    , m_version(version)
    , m_started(false)
    , m_port(0) {
}

FrameTransport::~FrameTransport() {
    stop();
}

Status FrameTransport::begin(const std::string& host, uint16_t port) {
    std::lock_guard<std::mutex> lock(m_sendMutex);

    if (m_started) return Status::ok();

    if (!m_socket) {
        return Status::fail(ErrorKind::TRANSPORT, "No socket");
    }
    if (!m_socket->open(false)) {
        return Status::fail(ErrorKind::TRANSPORT, "Open failed: %s", m_socket->lastError());
    }
    if (!m_socket->connect(host.c_str(), port)) {
        Status status = Status::fail(ErrorKind::TRANSPORT, "Connect to %s:%u failed: %s",
                                     host.c_str(), port, m_socket->lastError());
        m_socket->close();
        return status;
    }

    m_host = host;
    m_port = port;
    m_started = true;
    GL_LOGI("Streaming to %s:%u (protocol v%u)", host.c_str(), port,
            static_cast<unsigned>(m_version));
    return Status::ok();
}

void FrameTransport::stop() {
    std::lock_guard<std::mutex> lock(m_sendMutex);

    if (!m_started) return;

    m_socket->close();
    m_started = false;
    GL_LOGI("Streaming to %s stopped (%u frames, %u failures)", m_host.c_str(),
            m_stats.framesSent, m_stats.frameFailures);
}

Status FrameTransport::sendFrame(const std::vector<uint8_t>& token,
                                 const uint8_t* frame, size_t frameLen,
                                 size_t ledCount, size_t& bytesWritten) {
    std::lock_guard<std::mutex> lock(m_sendMutex);

    bytesWritten = 0;
    if (!m_started) {
        return Status::fail(ErrorKind::TRANSPORT, "Transport not started");
    }

    Status status = codec::RtFrameCodec::encode(m_version, token, frame, frameLen,
                                                ledCount, m_packets);
    if (!status) {
        return status;
    }

    m_stats.framesAttempted++;
    for (const codec::RtPacket& packet : m_packets) {
        int sent = m_socket->send(packet.data(), packet.size());
        if (sent < 0) {
            m_stats.frameFailures++;
            return Status::fail(ErrorKind::TRANSPORT, "Send to %s:%u failed: %s",
                                m_host.c_str(), m_port, m_socket->lastError());
        }
        bytesWritten += static_cast<size_t>(sent);
        m_stats.datagramsSent++;
    }

    m_stats.framesSent++;
    m_stats.bytesSent += bytesWritten;
    return Status::ok();
}

void FrameTransport::getStats(Stats& outStats) const {
    std::lock_guard<std::mutex> lock(m_sendMutex);
    outStats = m_stats;
}

} // namespace network
} // namespace glowlink
