// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceSession.cpp
 * @brief Authenticated device connection and real-time effect loops
 */

#include "DeviceSession.h"

#include <algorithm>
#include <utility>

#include "../codec/MovieCodec.h"
#include "../config/network_config.h"
#include "../effects/Pattern.h"

#define GL_LOG_TAG "Session"
#include "../utils/Log.h"

namespace glowlink {

using config::NetworkConfig::RT_PORT;
using config::NetworkConfig::RT_DEFAULT_FRAME_RATE;

SessionOptions::SessionOptions()
    : rtPort(RT_PORT)
    , rtVersion(codec::RtProtocolVersion::V3) {
}

LoopOptions::LoopOptions()
    : frameRate(RT_DEFAULT_FRAME_RATE)
    , maxFrames(0) {
}

DeviceSession::DeviceSession(network::IHttpClient& http,
                             std::unique_ptr<network::IDatagramSocket> socket,
                             const std::string& host, const std::string& mac,
                             const SessionOptions& options)
    : m_http(http)
    , m_auth(http, host, mac)
    , m_api(http, m_auth)
    , m_transport(std::move(socket), options.rtVersion)
    , m_options(options)
    , m_ready(false)
    , m_stopRequested(false)
    , m_lastTransportLog(0) {
    if (!m_options.clock) {
        m_options.clock = monotonicMillis;
    }
}

Status DeviceSession::begin() {
    if (m_ready) return Status::ok();

    Status status = m_auth.authenticate();
    if (!status) {
        GL_LOGE("Authentication with %s failed: %s", m_auth.host().c_str(), status.errorMsg);
        return status;
    }

    status = m_api.getDeviceInfo(m_info);
    if (!status) {
        GL_LOGE("Device info from %s failed: %s", m_auth.host().c_str(), status.errorMsg);
        return status;
    }
    if (m_info.numberOfLed == 0) {
        return Status::fail(ErrorKind::PROTOCOL, "Device reports zero LEDs");
    }

    status = m_transport.begin(m_auth.host(), m_options.rtPort);
    if (!status) {
        return status;
    }

    m_ready = true;
    GL_LOGI("Session with '%s' (%s) ready: %u LEDs, %s", m_info.deviceName.c_str(),
            m_auth.host().c_str(), m_info.numberOfLed,
            m_info.ledProfile == LedProfile::RGBW ? "RGBW" : "RGB");
    return Status::ok();
}

void DeviceSession::end() {
    m_transport.stop();
    m_ready = false;
}

bool DeviceSession::reauthenticate() {
    return m_auth.reauthenticate();
}

Status DeviceSession::requireReady() const {
    if (!m_ready) {
        return Status::fail(ErrorKind::VALIDATION, "Session not started");
    }
    return Status::ok();
}

// ============================================================================
// REST
// ============================================================================

Status DeviceSession::getMode(codec::DeviceMode& out) {
    Status status = requireReady();
    if (!status) return status;
    return m_api.getMode(out);
}

Status DeviceSession::setMode(codec::DeviceMode mode) {
    Status status = requireReady();
    if (!status) return status;
    return m_api.setMode(mode);
}

Status DeviceSession::getCapacity(uint32_t& availableFrames) {
    Status status = requireReady();
    if (!status) return status;
    return m_api.getCapacity(availableFrames);
}

Status DeviceSession::clearMovies() {
    Status status = requireReady();
    if (!status) return status;
    return m_api.clearMovies();
}

Status DeviceSession::uploadMovie(const std::vector<Frame>& frames, uint32_t& movieId) {
    Status status = requireReady();
    if (!status) return status;

    for (const Frame& frame : frames) {
        if (frame.size() != m_info.numberOfLed) {
            return Status::fail(ErrorKind::VALIDATION, "Movie frame has %zu LEDs, device has %u",
                                frame.size(), m_info.numberOfLed);
        }
    }

    std::vector<uint8_t> body;
    status = codec::MovieCodec::encode(frames, m_info.ledProfile, body);
    if (!status) return status;
    return m_api.uploadMovie(body, movieId);
}

// ============================================================================
// Real-time
// ============================================================================

Status DeviceSession::sendFrame(const Frame& frame) {
    Status status = requireReady();
    if (!status) return status;

    if (frame.size() != m_info.numberOfLed) {
        return Status::fail(ErrorKind::VALIDATION, "Frame has %zu LEDs, device has %u",
                            frame.size(), m_info.numberOfLed);
    }

    std::vector<Frame> single(1, frame);
    status = codec::MovieCodec::encode(single, m_info.ledProfile, m_wireFrame);
    if (!status) return status;

    size_t written = 0;
    return m_transport.sendFrame(m_auth.tokenBytes(), m_wireFrame.data(), m_wireFrame.size(),
                                 m_info.numberOfLed, written);
}

Status DeviceSession::runLoop(const char* name, const FrameSource& source,
                              const LoopOptions& options) {
    m_loopStats = LoopStats();

    Status status = requireReady();
    if (!status) return status;

    if (!(options.frameRate > 0.0)) {
        return Status::fail(ErrorKind::VALIDATION, "Frame rate must be positive");
    }

    status = m_api.setMode(codec::DeviceMode::RealTime);
    if (!status) {
        GL_LOGE("%s: switching to real-time mode failed: %s", name, status.errorMsg);
        return status;
    }

    m_stopRequested.store(false);
    FramePacer pacer(options.frameRate, m_options.clock, m_options.sleeper);
    Frame frame(m_info.numberOfLed);

    GL_LOGI("%s: running at %.1f fps", name, options.frameRate);

    for (uint32_t index = 0; options.maxFrames == 0 || index < options.maxFrames; index++) {
        if (m_stopRequested.load()) break;

        const uint32_t now = pacer.beginFrame();
        bool done = false;
        status = source(index, now, frame, done);
        if (!status) {
            GL_LOGE("%s: frame %u rejected: %s", name, index, status.errorMsg);
            return status;
        }
        if (done) break;
        m_loopStats.framesRendered++;

        status = sendFrame(frame);
        if (status) {
            m_loopStats.framesSent++;
        } else if (status.kind == ErrorKind::TRANSPORT) {
            m_loopStats.transportErrors++;
            GL_LOG_THROTTLE(m_lastTransportLog, 1000,
                            GL_LOGW("%s: frame %u dropped: %s", name, index, status.errorMsg));
        } else {
            GL_LOGE("%s: %s", name, status.errorMsg);
            return status;
        }

        pacer.waitNextFrame();
    }

    GL_LOGI("%s: done, %u frames sent, %u dropped", name, m_loopStats.framesSent,
            m_loopStats.transportErrors);
    return Status::ok();
}

Status DeviceSession::showSolidColor(const RGB& color, const LoopOptions& options) {
    FrameSource source = [color](uint32_t, uint32_t, Frame& out, bool&) {
        std::fill(out.begin(), out.end(), color);
        return Status::ok();
    };
    return runLoop("Solid", source, options);
}

Status DeviceSession::shineLeds(const effects::GlowConfig& config, uint32_t seed,
                                const LoopOptions& options) {
    Status status = requireReady();
    if (!status) return status;

    effects::GlowEngine engine(seed);
    status = engine.configure(m_info.numberOfLed, config, m_options.clock());
    if (!status) return status;

    FrameSource source = [&engine](uint32_t, uint32_t now, Frame& out, bool&) {
        engine.tick(now, out);
        return Status::ok();
    };
    return runLoop("Shine", source, options);
}

Status DeviceSession::meander(const color::MeanderConfig& config, const color::ColorModel& model,
                              uint32_t seed, const LoopOptions& options) {
    if (!(config.stepLength > 0.0) || config.noise < 0.0) {
        return Status::fail(ErrorKind::VALIDATION, "Invalid meander step %.3f / noise %.3f",
                            config.stepLength, config.noise);
    }

    color::ColorMeander walker(config, seed);
    FrameSource source = [&walker, &model](uint32_t, uint32_t, Frame& out, bool&) {
        std::fill(out.begin(), out.end(), walker.color(model));
        walker.step();
        return Status::ok();
    };
    return runLoop("Meander", source, options);
}

Status DeviceSession::showColorSpectrum(const color::ColorModel& model, double lightness,
                                        const LoopOptions& options) {
    if (lightness < -1.0 || lightness > 1.0) {
        return Status::fail(ErrorKind::VALIDATION, "Lightness %.2f outside [-1,1]", lightness);
    }

    const size_t leds = m_info.numberOfLed;
    FrameSource source = [&model, lightness, leds](uint32_t index, uint32_t, Frame& out, bool&) {
        out = effects::Pattern::spectrum(leds, leds > 0 ? index % leds : 0, lightness, model);
        return Status::ok();
    };
    return runLoop("Spectrum", source, options);
}

Status DeviceSession::streamFrames(const FrameSource& source, const LoopOptions& options) {
    if (!source) {
        return Status::fail(ErrorKind::VALIDATION, "No frame source");
    }
    return runLoop("Stream", source, options);
}

} // namespace glowlink
