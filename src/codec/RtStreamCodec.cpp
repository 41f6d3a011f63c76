// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RtStreamCodec.cpp
 * @brief Line-based real-time frame decoder
 */

#include "RtStreamCodec.h"

#include <ArduinoJson.h>

#include <cstdio>
#include <cstring>

#define GL_LOG_TAG "RtStream"
#include "../utils/Log.h"

namespace glowlink {
namespace codec {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && (s[begin] == ' ' || s[begin] == '\t' || s[begin] == '\r')) begin++;
    while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r')) end--;
    return s.substr(begin, end - begin);
}

} // namespace

bool parseStreamFormat(const char* name, RtStreamFormat& out) {
    if (name == nullptr) return false;
    if (strcmp(name, "hex") == 0)  { out = RtStreamFormat::Hex;  return true; }
    if (strcmp(name, "json") == 0) { out = RtStreamFormat::Json; return true; }
    return false;
}

bool parseStreamErrorMode(const char* name, RtStreamErrorMode& out) {
    if (name == nullptr) return false;
    if (strcmp(name, "abort") == 0) { out = RtStreamErrorMode::Abort; return true; }
    if (strcmp(name, "skip") == 0)  { out = RtStreamErrorMode::Skip;  return true; }
    return false;
}

RtStreamDecoder::RtStreamDecoder(RtStreamFormat format, RtStreamErrorMode errorMode,
                                 size_t ledsPerFrame)
    : m_format(format)
    , m_errorMode(errorMode)
    , m_ledsPerFrame(ledsPerFrame)
    , m_lineNo(0)
    , m_skipped(0) {
    m_pending.reserve(ledsPerFrame);
}

bool RtStreamDecoder::decodeHexLine(const std::string& line, RGB& out) const {
    const char* p = line.c_str();
    if (*p == '#') p++;
    if (strlen(p) != 6) return false;

    uint8_t bytes[3];
    for (int i = 0; i < 3; i++) {
        int hi = hexValue(p[i * 2]);
        int lo = hexValue(p[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = RGB(bytes[0], bytes[1], bytes[2]);
    return true;
}

bool RtStreamDecoder::decodeJsonLine(const std::string& line, Frame& out, char* errorMsg) const {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, line);
    if (err) {
        snprintf(errorMsg, MAX_ERROR_MSG, "invalid JSON: %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonArrayConst>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "expected an array of [r,g,b]");
        return false;
    }

    JsonArrayConst leds = doc.as<JsonArrayConst>();
    if (leds.size() != m_ledsPerFrame) {
        snprintf(errorMsg, MAX_ERROR_MSG, "expected %zu LEDs, got %zu",
                 m_ledsPerFrame, static_cast<size_t>(leds.size()));
        return false;
    }

    out.clear();
    out.reserve(m_ledsPerFrame);
    for (JsonVariantConst led : leds) {
        if (!led.is<JsonArrayConst>() || led.size() != 3) {
            snprintf(errorMsg, MAX_ERROR_MSG, "LED %zu is not [r,g,b]", out.size());
            return false;
        }
        uint8_t ch[3];
        for (size_t c = 0; c < 3; c++) {
            if (!led[c].is<uint8_t>()) {
                snprintf(errorMsg, MAX_ERROR_MSG, "LED %zu channel %zu out of range (0-255)",
                         out.size(), c);
                return false;
            }
            ch[c] = led[c].as<uint8_t>();
        }
        out.push_back(RGB(ch[0], ch[1], ch[2]));
    }
    return true;
}

Status RtStreamDecoder::reject(size_t lineNo, const char* reason) {
    if (m_errorMode == RtStreamErrorMode::Abort) {
        return Status::fail(ErrorKind::VALIDATION, "Line %zu: %s", lineNo, reason);
    }
    m_skipped++;
    m_pending.clear();
    GL_LOGW("Skipping line %zu: %s", lineNo, reason);
    return Status::ok();
}

Status RtStreamDecoder::pushLine(const std::string& rawLine, bool& frameReady) {
    frameReady = false;
    m_lineNo++;

    const std::string line = trim(rawLine);
    if (line.empty()) {
        return Status::ok();
    }

    if (m_format == RtStreamFormat::Hex) {
        RGB color;
        if (!decodeHexLine(line, color)) {
            return reject(m_lineNo, "expected 6 hex digits");
        }
        m_pending.push_back(color);
        if (m_pending.size() == m_ledsPerFrame) {
            m_frame.swap(m_pending);
            m_pending.clear();
            frameReady = true;
        }
        return Status::ok();
    }

    char errorMsg[MAX_ERROR_MSG] = {0};
    Frame decoded;
    if (!decodeJsonLine(line, decoded, errorMsg)) {
        return reject(m_lineNo, errorMsg);
    }
    m_frame.swap(decoded);
    frameReady = true;
    return Status::ok();
}

Status RtStreamDecoder::readFrame(std::istream& in, Frame& out, bool& eof) {
    eof = false;
    if (m_ledsPerFrame == 0) {
        return Status::fail(ErrorKind::VALIDATION, "LEDs per frame must be at least 1");
    }

    std::string line;
    while (std::getline(in, line)) {
        bool frameReady = false;
        Status status = pushLine(line, frameReady);
        if (!status) {
            return status;
        }
        if (frameReady) {
            out = m_frame;
            return Status::ok();
        }
    }

    if (!m_pending.empty()) {
        GL_LOGW("Input ended inside a frame (%zu of %zu LEDs)", m_pending.size(), m_ledsPerFrame);
        m_pending.clear();
    }
    eof = true;
    return Status::ok();
}

} // namespace codec
} // namespace glowlink
