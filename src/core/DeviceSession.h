// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceSession.h
 * @brief One authenticated connection to a device, plus its real-time loops
 *
 * A session owns the token (AuthSession), the REST accessors (DeviceApi) and a
 * single UDP socket (FrameTransport) opened once in begin() and reused for the
 * session lifetime.
 *
 * Effect loops run on the calling thread: render, send, sleep the remaining
 * frame budget. Transport errors drop the frame and the loop continues;
 * validation and protocol errors end the loop. Nothing re-authenticates on its
 * own; call reauthenticate() between loops. A loop and reauthenticate() may be
 * called from different threads, the token is read under a shared lock.
 */

#pragma once

#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "Clock.h"
#include "FramePacer.h"
#include "RGB.h"
#include "Status.h"
#include "../codec/HttpDeviceCodec.h"
#include "../codec/RtFrameCodec.h"
#include "../color/ColorMeander.h"
#include "../color/ColorModel.h"
#include "../effects/GlowEngine.h"
#include "../network/FrameTransport.h"
#include "../network/IDatagramSocket.h"
#include "../network/IHttpClient.h"
#include "../protocol/AuthSession.h"
#include "../protocol/DeviceApi.h"

namespace glowlink {

struct SessionOptions {
    uint16_t rtPort;
    codec::RtProtocolVersion rtVersion;
    MillisClock clock;                  ///< Empty: monotonicMillis
    FramePacer::Sleeper sleeper;        ///< Empty: real sleep

    SessionOptions();
};

struct LoopOptions {
    double frameRate;
    uint32_t maxFrames;                 ///< 0 runs until requestStop()

    LoopOptions();
};

struct LoopStats {
    uint32_t framesRendered = 0;
    uint32_t framesSent = 0;
    uint32_t transportErrors = 0;
};

class DeviceSession {
public:
    /**
     * @brief Renders frame number frameIndex at nowMs into out
     *
     * Set done to end the loop without error. A failed Status ends the loop
     * and is returned to the caller.
     */
    using FrameSource = std::function<Status(uint32_t frameIndex, uint32_t nowMs,
                                             Frame& out, bool& done)>;

    DeviceSession(network::IHttpClient& http,
                  std::unique_ptr<network::IDatagramSocket> socket,
                  const std::string& host, const std::string& mac,
                  const SessionOptions& options = SessionOptions());

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * @brief Authenticate, read the device description and open the stream socket
     */
    Status begin();
    void end();

    bool isReady() const { return m_ready; }

    /**
     * @brief Re-run the handshake, keeping the old token on failure
     */
    bool reauthenticate();

    const codec::DeviceInfo& info() const { return m_info; }
    size_t ledCount() const { return m_info.numberOfLed; }
    protocol::AuthSession& auth() { return m_auth; }

    // ========================================================================
    // REST
    // ========================================================================

    Status getMode(codec::DeviceMode& out);
    Status setMode(codec::DeviceMode mode);
    Status getCapacity(uint32_t& availableFrames);
    Status clearMovies();

    /**
     * @brief Encode frames for the device LED profile and upload them as one movie
     */
    Status uploadMovie(const std::vector<Frame>& frames, uint32_t& movieId);

    // ========================================================================
    // Real-time
    // ========================================================================

    /**
     * @brief Send one frame; its size must equal the LED count
     */
    Status sendFrame(const Frame& frame);

    Status showSolidColor(const RGB& color, const LoopOptions& options);
    Status shineLeds(const effects::GlowConfig& config, uint32_t seed,
                     const LoopOptions& options);
    Status meander(const color::MeanderConfig& config, const color::ColorModel& model,
                   uint32_t seed, const LoopOptions& options);

    /**
     * @brief Full hue sweep that rotates one LED per frame
     */
    Status showColorSpectrum(const color::ColorModel& model, double lightness,
                             const LoopOptions& options);

    Status streamFrames(const FrameSource& source, const LoopOptions& options);

    /// Ask the running loop to return after the current frame
    void requestStop() { m_stopRequested.store(true); }

    const LoopStats& lastLoopStats() const { return m_loopStats; }

private:
    Status runLoop(const char* name, const FrameSource& source, const LoopOptions& options);
    Status requireReady() const;

    network::IHttpClient& m_http;
    protocol::AuthSession m_auth;
    protocol::DeviceApi m_api;
    network::FrameTransport m_transport;
    SessionOptions m_options;

    codec::DeviceInfo m_info;
    bool m_ready;
    std::vector<uint8_t> m_wireFrame;
    std::atomic<bool> m_stopRequested;
    LoopStats m_loopStats;
    uint32_t m_lastTransportLog;
};

} // namespace glowlink
