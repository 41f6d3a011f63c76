// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main.cpp
 * @brief glowctl: discover and drive GlowLink devices from the command line
 *
 *   glowctl discover [--timeout ms] [--json]
 *   glowctl device-call --ip A --mac M [options] <command> [args]
 *
 * Commands: get-mode, set-mode MODE, get-capacity, print-config,
 * show-color NAME | R G B, shine [COLOR...], meander, spectrum, rt-stdin.
 */

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/network_config.h"
#include "config/version.h"
#include "codec/HttpDeviceCodec.h"
#include "codec/RtStreamCodec.h"
#include "color/ColorMeander.h"
#include "color/ColorModel.h"
#include "color/NamedColors.h"
#include "core/Clock.h"
#include "core/DeviceSession.h"
#include "effects/GlowEngine.h"
#include "network/CurlHttpClient.h"
#include "network/UdpSocket.h"
#include "protocol/Discovery.h"

#define GL_LOG_TAG "glowctl"
#include "utils/Log.h"

using namespace glowlink;

namespace {

std::atomic<DeviceSession*> g_activeSession(nullptr);

void onSignal(int) {
    DeviceSession* session = g_activeSession.load();
    if (session != nullptr) {
        session->requestStop();
    }
}

// ============================================================================
// Argument parsing
// ============================================================================

struct Args {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;

    bool has(const char* key) const { return options.count(key) != 0; }

    const char* get(const char* key, const char* fallback) const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second.c_str();
    }
};

bool isFlag(const std::string& name) {
    return name == "--json" || name == "--version" || name == "--help";
}

bool parseArgs(int argc, char** argv, Args& out) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (isFlag(arg)) {
                out.options[arg.substr(2)] = "1";
                continue;
            }
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Option %s needs a value\n", arg.c_str());
                return false;
            }
            out.options[arg.substr(2)] = argv[++i];
        } else {
            out.positional.push_back(arg);
        }
    }
    return true;
}

bool parseUnsigned(const char* text, unsigned long max, unsigned long& out) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool parseDouble(const char* text, double& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool parseColorArg(const std::vector<std::string>& words, size_t first, RGB& out, size_t& used) {
    if (first < words.size() && color::lookupNamedColor(words[first].c_str(), out)) {
        used = 1;
        return true;
    }
    if (first + 3 <= words.size()) {
        unsigned long c[3];
        for (size_t k = 0; k < 3; k++) {
            if (!parseUnsigned(words[first + k].c_str(), 255, c[k])) return false;
        }
        out = RGB(static_cast<uint8_t>(c[0]), static_cast<uint8_t>(c[1]),
                  static_cast<uint8_t>(c[2]));
        used = 3;
        return true;
    }
    return false;
}

void printUsage() {
    std::printf(
        "glowctl %s\n"
        "\n"
        "Usage:\n"
        "  glowctl discover [--timeout ms] [--json]\n"
        "  glowctl device-call --ip A --mac M [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  get-mode | set-mode MODE | get-capacity | print-config\n"
        "  show-color NAME | R G B\n"
        "  shine [COLOR...]     --rise ms --fade ms --interval ms --simultaneous n\n"
        "  meander              --meander-style sphere|cylinder|surface --step s --noise n\n"
        "  spectrum             --lightness l\n"
        "  rt-stdin             --format hex|json --error-mode abort|skip --leds-per-frame n\n"
        "\n"
        "Options:\n"
        "  --fps F --frames N --seed N --style 3col|4col|6col|8col|10col|linear|equilight\n"
        "  --gamma G --rt-version 1|2|3\n",
        GLOWLINK_VERSION_STRING);
}

int report(const Status& status) {
    if (status) return 0;
    std::fprintf(stderr, "error (%s): %s\n", errorKindName(status.kind), status.errorMsg);
    return 1;
}

// ============================================================================
// discover
// ============================================================================

int runDiscover(const Args& args) {
    protocol::DiscoveryOptions options;
    unsigned long timeout = 0;
    if (args.has("timeout")) {
        if (!parseUnsigned(args.get("timeout", ""), 600000, timeout)) {
            std::fprintf(stderr, "Invalid --timeout\n");
            return 2;
        }
        options.timeoutMs = static_cast<uint32_t>(timeout);
    }

    network::UdpSocket socket;
    network::CurlHttpClient http(config::NetworkConfig::HTTP_TIMEOUT_MS);
    protocol::Discovery discovery(socket, http);

    protocol::DiscoveryReport result = discovery.scan(options);
    if (!result.status) {
        return report(result.status);
    }

    if (args.has("json")) {
        std::printf("%s\n", protocol::Discovery::toJson(result.discovered).c_str());
    } else {
        protocol::Discovery::printTable(result.discovered, stdout);
        std::printf("%zu device(s), %u failed\n", result.discovered.size(), result.failedDevices);
    }
    return 0;
}

// ============================================================================
// device-call
// ============================================================================

bool buildColorModel(const Args& args, color::ColorModelConfig& config) {
    if (args.has("style") && !color::ColorModelConfig::parseStyle(args.get("style", ""), config)) {
        std::fprintf(stderr, "Unknown --style %s\n", args.get("style", ""));
        return false;
    }
    if (args.has("gamma") && (!parseDouble(args.get("gamma", ""), config.gamma) || config.gamma <= 0.0)) {
        std::fprintf(stderr, "Invalid --gamma\n");
        return false;
    }
    return true;
}

bool buildLoopOptions(const Args& args, LoopOptions& loop) {
    if (args.has("fps") && (!parseDouble(args.get("fps", ""), loop.frameRate) || loop.frameRate <= 0.0)) {
        std::fprintf(stderr, "Invalid --fps\n");
        return false;
    }
    unsigned long frames = 0;
    if (args.has("frames")) {
        if (!parseUnsigned(args.get("frames", ""), 0xFFFFFFFFUL, frames)) {
            std::fprintf(stderr, "Invalid --frames\n");
            return false;
        }
        loop.maxFrames = static_cast<uint32_t>(frames);
    }
    return true;
}

void printConfig(const codec::DeviceInfo& info) {
    std::printf("Name:            %s\n", info.deviceName.c_str());
    std::printf("Product:         %s (%s)\n", info.productName.c_str(), info.productCode.c_str());
    std::printf("Hardware:        %s\n", info.hardwareVersion.c_str());
    std::printf("Firmware family: %s\n", info.fwFamily.c_str());
    std::printf("MAC:             %s\n", info.mac.c_str());
    std::printf("UUID:            %s\n", info.uuid.c_str());
    std::printf("LEDs:            %u (%s, max %u)\n", info.numberOfLed,
                info.ledProfile == LedProfile::RGBW ? "RGBW" : "RGB", info.maxSupportedLed);
    std::printf("Frame rate:      %.1f (measured %.1f)\n", info.frameRate, info.measuredFrameRate);
    std::printf("Movies:          capacity %u, max %u\n", info.movieCapacity, info.maxMovies);
    std::printf("Uptime:          %llu ms\n", static_cast<unsigned long long>(info.uptimeMs));
}

int runShine(DeviceSession& session, const Args& args, const std::vector<std::string>& words,
             uint32_t seed, const LoopOptions& loop) {
    effects::GlowConfig glow;
    unsigned long value = 0;
    const struct { const char* key; uint32_t* target; } timings[] = {
        {"rise", &glow.riseMs},
        {"fade", &glow.fadeMs},
        {"interval", &glow.timeBetweenGlowStartMs},
    };
    for (const auto& t : timings) {
        if (!args.has(t.key)) continue;
        if (!parseUnsigned(args.get(t.key, ""), 3600000, value)) {
            std::fprintf(stderr, "Invalid --%s\n", t.key);
            return 2;
        }
        *t.target = static_cast<uint32_t>(value);
    }
    if (args.has("simultaneous")) {
        if (!parseUnsigned(args.get("simultaneous", ""), 0xFFFFUL, value)) {
            std::fprintf(stderr, "Invalid --simultaneous\n");
            return 2;
        }
        glow.numStartSimultaneous = value;
    }

    size_t pos = 1;
    while (pos < words.size()) {
        RGB c;
        size_t used = 0;
        if (!parseColorArg(words, pos, c, used)) {
            std::fprintf(stderr, "Unknown color '%s'\n", words[pos].c_str());
            return 2;
        }
        glow.palette.push_back(c);
        pos += used;
    }
    if (words.size() == 1) {
        glow.palette = {RGB(255, 180, 60), RGB(255, 120, 20), RGB(255, 220, 150)};
    }

    return report(session.shineLeds(glow, seed, loop));
}

int runRtStdin(DeviceSession& session, const Args& args, const LoopOptions& loop) {
    codec::RtStreamFormat format = codec::RtStreamFormat::Hex;
    codec::RtStreamErrorMode errorMode = codec::RtStreamErrorMode::Abort;
    if (!codec::parseStreamFormat(args.get("format", "hex"), format)) {
        std::fprintf(stderr, "Unknown --format\n");
        return 2;
    }
    if (!codec::parseStreamErrorMode(args.get("error-mode", "abort"), errorMode)) {
        std::fprintf(stderr, "Unknown --error-mode\n");
        return 2;
    }

    unsigned long leds = session.ledCount();
    if (args.has("leds-per-frame") &&
        !parseUnsigned(args.get("leds-per-frame", ""), session.ledCount(), leds)) {
        std::fprintf(stderr, "--leds-per-frame must be between 1 and %zu\n", session.ledCount());
        return 2;
    }

    codec::RtStreamDecoder decoder(format, errorMode, leds);
    Frame input;
    DeviceSession::FrameSource source = [&decoder, &input](uint32_t, uint32_t, Frame& out, bool& done) {
        bool eof = false;
        Status status = decoder.readFrame(std::cin, input, eof);
        if (!status) return status;
        if (eof) {
            done = true;
            return Status::ok();
        }
        // Shorter input frames leave the remaining LEDs dark
        std::fill(out.begin(), out.end(), RGB::Black());
        std::copy(input.begin(), input.end(), out.begin());
        return Status::ok();
    };

    Status status = session.streamFrames(source, loop);
    if (decoder.skippedRecords() > 0) {
        GL_LOGW("Skipped %zu malformed records", decoder.skippedRecords());
    }
    return report(status);
}

int runDeviceCall(const Args& args, const std::vector<std::string>& words) {
    if (!args.has("ip") || !args.has("mac") || words.empty()) {
        printUsage();
        return 2;
    }

    color::ColorModelConfig modelConfig;
    LoopOptions loop;
    if (!buildColorModel(args, modelConfig) || !buildLoopOptions(args, loop)) {
        return 2;
    }
    color::ColorModel model(modelConfig);

    unsigned long seedArg = monotonicMillis();
    if (args.has("seed") && !parseUnsigned(args.get("seed", ""), 0xFFFFFFFFUL, seedArg)) {
        std::fprintf(stderr, "Invalid --seed\n");
        return 2;
    }
    const uint32_t seed = static_cast<uint32_t>(seedArg);

    SessionOptions options;
    unsigned long version = 3;
    if (args.has("rt-version")) {
        if (!parseUnsigned(args.get("rt-version", ""), 3, version) || version == 0) {
            std::fprintf(stderr, "Invalid --rt-version\n");
            return 2;
        }
        options.rtVersion = static_cast<codec::RtProtocolVersion>(version);
    }

    network::CurlHttpClient http(config::NetworkConfig::HTTP_TIMEOUT_MS);
    DeviceSession session(http, std::unique_ptr<network::IDatagramSocket>(new network::UdpSocket()),
                          args.get("ip", ""), args.get("mac", ""), options);

    Status status = session.begin();
    if (!status) {
        return report(status);
    }

    g_activeSession.store(&session);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string& command = words[0];
    int rc = 0;

    if (command == "get-mode") {
        codec::DeviceMode mode;
        status = session.getMode(mode);
        if (status) std::printf("%s\n", codec::deviceModeName(mode));
        rc = report(status);
    } else if (command == "set-mode") {
        codec::DeviceMode mode;
        if (words.size() < 2 || !codec::parseDeviceMode(words[1].c_str(), mode)) {
            std::fprintf(stderr, "set-mode needs one of movie|playlist|rt|demo|effect|color|off\n");
            rc = 2;
        } else {
            rc = report(session.setMode(mode));
        }
    } else if (command == "get-capacity") {
        uint32_t frames = 0;
        status = session.getCapacity(frames);
        if (status) std::printf("%u\n", frames);
        rc = report(status);
    } else if (command == "print-config") {
        printConfig(session.info());
    } else if (command == "show-color") {
        RGB c;
        size_t used = 0;
        if (!parseColorArg(words, 1, c, used)) {
            std::fprintf(stderr, "show-color needs a color name or R G B\n");
            rc = 2;
        } else {
            rc = report(session.showSolidColor(c, loop));
        }
    } else if (command == "shine") {
        rc = runShine(session, args, words, seed, loop);
    } else if (command == "meander") {
        color::MeanderConfig meanderConfig;
        if ((args.has("meander-style") &&
             !color::MeanderConfig::parseStyle(args.get("meander-style", ""), meanderConfig.style)) ||
            (args.has("step") && !parseDouble(args.get("step", ""), meanderConfig.stepLength)) ||
            (args.has("noise") && !parseDouble(args.get("noise", ""), meanderConfig.noise))) {
            std::fprintf(stderr, "Invalid meander options\n");
            rc = 2;
        } else {
            rc = report(session.meander(meanderConfig, model, seed, loop));
        }
    } else if (command == "spectrum") {
        double lightness = 0.0;
        if (args.has("lightness") && !parseDouble(args.get("lightness", ""), lightness)) {
            std::fprintf(stderr, "Invalid --lightness\n");
            rc = 2;
        } else {
            rc = report(session.showColorSpectrum(model, lightness, loop));
        }
    } else if (command == "rt-stdin") {
        rc = runRtStdin(session, args, loop);
    } else {
        std::fprintf(stderr, "Unknown command '%s'\n", command.c_str());
        printUsage();
        rc = 2;
    }

    g_activeSession.store(nullptr);
    session.end();
    return rc;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!parseArgs(argc, argv, args)) {
        return 2;
    }
    if (args.has("version")) {
        std::printf("glowctl %s\n", GLOWLINK_VERSION_STRING);
        return 0;
    }
    if (args.has("help") || args.positional.empty()) {
        printUsage();
        return args.has("help") ? 0 : 2;
    }

    const std::string command = args.positional[0];
    std::vector<std::string> rest(args.positional.begin() + 1, args.positional.end());

    if (command == "discover") {
        return runDiscover(args);
    }
    if (command == "device-call") {
        return runDeviceCall(args, rest);
    }

    std::fprintf(stderr, "Unknown command '%s'\n", command.c_str());
    printUsage();
    return 2;
}
