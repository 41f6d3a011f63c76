// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Discovery.cpp
 * @brief Broadcast discovery implementation
 */

#include "Discovery.h"
#include "AuthSession.h"
#include "DeviceApi.h"

#include <ArduinoJson.h>

#include <algorithm>
#include <cstring>

#define GL_LOG_TAG "Discovery"
#include "../utils/Log.h"

namespace glowlink {
namespace protocol {

using namespace config::NetworkConfig;

Discovery::Discovery(network::IDatagramSocket& socket, network::IHttpClient& http,
                     MillisClock clock)
    : m_socket(socket)
    , m_http(http)
    , m_clock(clock ? clock : MillisClock(monotonicMillis)) {
}

Status Discovery::identify(const codec::DiscoveryResponse& reply, DeviceIdentifier& out) {
    const std::string ip = reply.ipString();

    codec::GestaltIdentity gestalt;
    Status status = fetchGestaltIdentity(m_http, ip, gestalt);
    if (!status) {
        return status;
    }

    AuthSession session(m_http, ip, gestalt.mac);
    status = session.authenticate();
    if (!status) {
        return status;
    }

    codec::DeviceInfo info;
    status = fetchDeviceInfo(m_http, ip, &session, info);
    if (!status) {
        return status;
    }

    out.ipAddress = ip;
    out.deviceId = reply.deviceId;
    out.macAddress = gestalt.mac;
    out.deviceName = gestalt.deviceName;
    out.ledCount = info.numberOfLed;
    out.token = session.token();
    return Status::ok();
}

DiscoveryReport Discovery::scan(const DiscoveryOptions& options) {
    DiscoveryReport report;

    if (!m_socket.open(true)) {
        report.status = Status::fail(ErrorKind::TRANSPORT, "Discovery socket: %s",
                                     m_socket.lastError());
        return report;
    }

    const std::vector<uint8_t> ping = codec::DiscoveryCodec::encodePing();
    if (m_socket.sendTo(options.broadcastAddress.c_str(), options.port,
                        ping.data(), ping.size()) < 0) {
        report.status = Status::fail(ErrorKind::TRANSPORT, "Discovery broadcast: %s",
                                     m_socket.lastError());
        m_socket.close();
        return report;
    }
    GL_LOGI("Broadcast ping to %s:%u, listening %u ms", options.broadcastAddress.c_str(),
            options.port, options.timeoutMs);

    std::vector<codec::DiscoveryResponse> seen;
    uint8_t buffer[DISCOVERY_MAX_PACKET];

    const uint32_t deadline = m_clock() + options.timeoutMs;
    report.status = Status::ok();

    while (true) {
        const int32_t remaining = static_cast<int32_t>(deadline - m_clock());
        if (remaining <= 0) {
            break;
        }

        int received = m_socket.receive(buffer, sizeof(buffer), static_cast<uint32_t>(remaining));
        if (received == network::IDatagramSocket::RECV_TIMEOUT) {
            break;
        }
        if (received < 0) {
            GL_LOGW("Receive failed, ending scan: %s", m_socket.lastError());
            break;
        }
        report.packetsReceived++;

        codec::DiscoveryResponse reply;
        if (!codec::DiscoveryCodec::decode(buffer, static_cast<size_t>(received), reply)) {
            report.invalidPackets++;
            continue;
        }

        if (std::find(seen.begin(), seen.end(), reply) != seen.end()) {
            report.duplicates++;
            continue;
        }
        seen.push_back(reply);

        const std::string ip = reply.ipString();
        if (options.knownDevices != nullptr) {
            auto known = std::find_if(options.knownDevices->begin(), options.knownDevices->end(),
                                      [&](const DeviceIdentifier& d) {
                                          return d.matches(ip, reply.deviceId);
                                      });
            if (known != options.knownDevices->end()) {
                GL_LOGI("Rediscovered %s (%s)", ip.c_str(), reply.deviceId.c_str());
                report.rediscovered.push_back(*known);
                continue;
            }
        }

        GL_LOGI("Found %s (%s)", ip.c_str(), reply.deviceId.c_str());
        DeviceIdentifier device;
        Status status = identify(reply, device);
        if (!status) {
            GL_LOGW("Dropping %s: [%s] %s", ip.c_str(), errorKindName(status.kind),
                    status.errorMsg);
            report.failedDevices++;
            continue;
        }
        report.discovered.push_back(device);
    }

    m_socket.close();
    GL_LOGI("Scan complete: %zu new, %zu rediscovered, %u dropped",
            report.discovered.size(), report.rediscovered.size(), report.failedDevices);
    return report;
}

void Discovery::printTable(const std::vector<DeviceIdentifier>& devices, FILE* out) {
    size_t ipWidth = strlen("IP Address");
    size_t idWidth = strlen("Device ID");
    size_t macWidth = strlen("MAC Address");
    size_t nameWidth = 20;
    size_t countWidth = strlen("LED Count");

    for (const DeviceIdentifier& d : devices) {
        ipWidth = std::max(ipWidth, d.ipAddress.size());
        idWidth = std::max(idWidth, d.deviceId.size());
        macWidth = std::max(macWidth, d.macAddress.size());
        nameWidth = std::max(nameWidth, d.deviceName.size());
    }

    const std::string rule(ipWidth + idWidth + macWidth + nameWidth + countWidth + 8, '-');

    fprintf(out, "%-*s  %-*s  %-*s  %-*s  %*s\n",
            static_cast<int>(ipWidth), "IP Address",
            static_cast<int>(idWidth), "Device ID",
            static_cast<int>(macWidth), "MAC Address",
            static_cast<int>(nameWidth), "Device Name",
            static_cast<int>(countWidth), "LED Count");
    fprintf(out, "%s\n", rule.c_str());

    for (const DeviceIdentifier& d : devices) {
        fprintf(out, "%-*s  %-*s  %-*s  %-*s  %*u\n",
                static_cast<int>(ipWidth), d.ipAddress.c_str(),
                static_cast<int>(idWidth), d.deviceId.c_str(),
                static_cast<int>(macWidth), d.macAddress.c_str(),
                static_cast<int>(nameWidth), d.deviceName.c_str(),
                static_cast<int>(countWidth), d.ledCount);
    }
}

std::string Discovery::toJson(const std::vector<DeviceIdentifier>& devices) {
    JsonDocument doc;
    JsonArray arr = doc.to<JsonArray>();
    for (const DeviceIdentifier& d : devices) {
        JsonObject obj = arr.add<JsonObject>();
        obj["ip_address"] = d.ipAddress;
        obj["device_id"] = d.deviceId;
        obj["mac_address"] = d.macAddress;
        obj["device_name"] = d.deviceName;
        obj["led_count"] = d.ledCount;
    }

    std::string out;
    serializeJsonPretty(doc, out);
    return out;
}

} // namespace protocol
} // namespace glowlink
