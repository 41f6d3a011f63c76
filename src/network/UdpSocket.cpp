// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file UdpSocket.cpp
 * @brief POSIX UDP socket implementation
 */

#include "UdpSocket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#define GL_LOG_TAG "Udp"
#include "../utils/Log.h"

namespace glowlink {
namespace network {

namespace {

bool makeAddress(const char* host, uint16_t port, sockaddr_in& addr) {
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    return inet_pton(AF_INET, host, &addr.sin_addr) == 1;
}

} // namespace

UdpSocket::UdpSocket()
    : m_fd(-1) {
    memset(m_lastError, 0, sizeof(m_lastError));
}

UdpSocket::~UdpSocket() {
    close();
}

void UdpSocket::setError(const char* what, int err) {
    snprintf(m_lastError, sizeof(m_lastError), "%s: %s", what, strerror(err));
}

bool UdpSocket::open(bool broadcast) {
    if (m_fd >= 0) return true;

    m_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (m_fd < 0) {
        setError("socket", errno);
        GL_LOGE("%s", m_lastError);
        return false;
    }

    if (broadcast) {
        int enable = 1;
        if (setsockopt(m_fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
            setError("SO_BROADCAST", errno);
            GL_LOGE("%s", m_lastError);
            close();
            return false;
        }
    }

    sockaddr_in local;
    memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (::bind(m_fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        setError("bind", errno);
        GL_LOGE("%s", m_lastError);
        close();
        return false;
    }

    return true;
}

void UdpSocket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool UdpSocket::connect(const char* host, uint16_t port) {
    sockaddr_in addr;
    if (!makeAddress(host, port, addr)) {
        snprintf(m_lastError, sizeof(m_lastError), "Invalid IPv4 address: %s", host);
        return false;
    }
    if (::connect(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        setError("connect", errno);
        return false;
    }
    return true;
}

int UdpSocket::send(const uint8_t* data, size_t len) {
    ssize_t sent = ::send(m_fd, data, len, 0);
    if (sent < 0) {
        setError("send", errno);
        return SOCK_ERROR;
    }
    return static_cast<int>(sent);
}

int UdpSocket::sendTo(const char* host, uint16_t port, const uint8_t* data, size_t len) {
    sockaddr_in addr;
    if (!makeAddress(host, port, addr)) {
        snprintf(m_lastError, sizeof(m_lastError), "Invalid IPv4 address: %s", host);
        return SOCK_ERROR;
    }
    ssize_t sent = ::sendto(m_fd, data, len, 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        setError("sendto", errno);
        return SOCK_ERROR;
    }
    return static_cast<int>(sent);
}

int UdpSocket::receive(uint8_t* buffer, size_t capacity, uint32_t timeoutMs) {
    pollfd pfd;
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
    if (ready < 0) {
        setError("poll", errno);
        return SOCK_ERROR;
    }
    if (ready == 0) {
        return RECV_TIMEOUT;
    }

    ssize_t received = ::recv(m_fd, buffer, capacity, 0);
    if (received < 0) {
        setError("recv", errno);
        return SOCK_ERROR;
    }
    return static_cast<int>(received);
}

} // namespace network
} // namespace glowlink
