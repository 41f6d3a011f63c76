// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HttpDeviceCodec.h
 * @brief JSON codec for the device HTTP API (login, verify, gestalt, mode, movies)
 *
 * Single canonical location for reading and writing device HTTP JSON bodies.
 * Enforces type checking and required-field validation.
 *
 * Rule: Only this module is allowed to read JSON keys from device HTTP responses.
 * All other code consumes typed result structs.
 *
 * @author GlowLink Team
 * @version 1.0.0
 */

#pragma once

#include <ArduinoJson.h>
#include <stdint.h>
#include <cstddef>
#include <cstring>
#include <string>

#include "ResponseCode.h"
#include "../core/RGB.h"
#include "../core/Status.h"

namespace glowlink {
namespace codec {

// ============================================================================
// Device Mode
// ============================================================================

enum class DeviceMode : uint8_t {
    Movie = 0,
    Playlist,
    RealTime,
    Demo,
    Effect,
    Color,
    Off
};

/**
 * @brief Parse the wire name ("movie", "rt", ...) of a mode
 * @return false for unknown names
 */
bool parseDeviceMode(const char* name, DeviceMode& out);

const char* deviceModeName(DeviceMode mode);

// ============================================================================
// Decoded Response Structs
// ============================================================================

/**
 * @brief Login response: bearer token plus the device's own challenge digest
 */
struct LoginResponse {
    std::string authenticationToken;
    std::string challengeResponse;
    uint32_t expiresIn;
    ResponseCode code;

    LoginResponse() : expiresIn(0), code(ResponseCode::Error) {}
};

struct LoginDecodeResult {
    bool success;
    LoginResponse response;
    char errorMsg[MAX_ERROR_MSG];

    LoginDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Result for endpoints that only answer with {"code": N}
 */
struct CodeDecodeResult {
    bool success;
    ResponseCode code;
    char errorMsg[MAX_ERROR_MSG];

    CodeDecodeResult() : success(false), code(ResponseCode::Error) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Device self-description from the gestalt endpoint
 */
struct DeviceInfo {
    std::string productName;
    std::string hardwareVersion;
    uint32_t bytesPerLed;
    std::string hwId;
    uint32_t flashSize;
    uint32_t ledType;
    std::string productCode;
    std::string fwFamily;
    std::string deviceName;
    uint64_t uptimeMs;              // volatile
    std::string mac;
    std::string uuid;
    uint32_t maxSupportedLed;
    uint32_t numberOfLed;
    LedProfile ledProfile;
    double frameRate;
    double measuredFrameRate;       // volatile
    uint32_t movieCapacity;
    uint32_t maxMovies;
    uint32_t wireType;
    std::string copyright;
    ResponseCode code;

    DeviceInfo()
        : bytesPerLed(3), flashSize(0), ledType(0), uptimeMs(0),
          maxSupportedLed(0), numberOfLed(0), ledProfile(LedProfile::RGB),
          frameRate(0.0), measuredFrameRate(0.0), movieCapacity(0),
          maxMovies(0), wireType(0), code(ResponseCode::Ok) {}

    /**
     * @brief Identity comparison ignoring uptime and measured frame rate
     */
    bool sameIdentity(const DeviceInfo& other) const;
};

struct DeviceInfoDecodeResult {
    bool success;
    DeviceInfo info;
    char errorMsg[MAX_ERROR_MSG];

    DeviceInfoDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct ModeDecodeResult {
    bool success;
    DeviceMode mode;
    ResponseCode code;
    char errorMsg[MAX_ERROR_MSG];

    ModeDecodeResult() : success(false), mode(DeviceMode::Off), code(ResponseCode::Error) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct CapacityDecodeResult {
    bool success;
    uint32_t availableFrames;
    char errorMsg[MAX_ERROR_MSG];

    CapacityDecodeResult() : success(false), availableFrames(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Identity fields of the unauthenticated gestalt query
 */
struct GestaltIdentity {
    std::string mac;
    std::string deviceName;
};

struct GestaltIdentityDecodeResult {
    bool success;
    GestaltIdentity identity;
    char errorMsg[MAX_ERROR_MSG];

    GestaltIdentityDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct MovieIdDecodeResult {
    bool success;
    uint32_t id;
    char errorMsg[MAX_ERROR_MSG];

    MovieIdDecodeResult() : success(false), id(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief HTTP Device API JSON Codec
 *
 * Decoders never look at HTTP status; callers check that first. A decoded
 * `code` other than Ok is reported as a failure by the decoders that carry
 * one, except decodeLogin which leaves the verdict to the handshake.
 */
class HttpDeviceCodec {
public:
    // Encode functions (request building)
    static void encodeChallenge(const char* challengeB64, JsonObject& obj);
    static void encodeVerify(const char* challengeResponseHex, JsonObject& obj);
    static void encodeMode(DeviceMode mode, JsonObject& obj);
    static void encodeDeviceInfo(const DeviceInfo& info, JsonObject& obj);

    /**
     * @brief Serialize a request document to a compact string body
     */
    static std::string toBody(const JsonDocument& doc);

    /**
     * @brief Parse a response body into doc
     * @param errorMsg Receives the parser error on failure (MAX_ERROR_MSG)
     * @return false if the body is not a JSON object
     */
    static bool parseBody(const std::string& body, JsonDocument& doc, char* errorMsg);

    // Decode functions (response parsing)
    static LoginDecodeResult decodeLogin(JsonObjectConst root);
    static CodeDecodeResult decodeCode(JsonObjectConst root);
    static DeviceInfoDecodeResult decodeDeviceInfo(JsonObjectConst root);

    /**
     * @brief Lenient gestalt decode: only `mac` is required
     *
     * Used before authentication, where firmware may report a reduced
     * description. `device_name` is read when present.
     */
    static GestaltIdentityDecodeResult decodeGestaltIdentity(JsonObjectConst root);
    static ModeDecodeResult decodeMode(JsonObjectConst root);
    static CapacityDecodeResult decodeCapacity(JsonObjectConst root);
    static MovieIdDecodeResult decodeMovieId(JsonObjectConst root);
};

} // namespace codec
} // namespace glowlink
