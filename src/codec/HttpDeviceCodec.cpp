// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HttpDeviceCodec.cpp
 * @brief HTTP device API codec implementation
 *
 * Single canonical JSON reader for device HTTP responses.
 *
 * @author GlowLink Team
 * @version 1.0.0
 */

#include "HttpDeviceCodec.h"

#include <cstdio>
#include <cstdlib>

namespace glowlink {
namespace codec {

// ============================================================================
// Device Mode
// ============================================================================

namespace {

struct ModeName {
    DeviceMode mode;
    const char* name;
};

const ModeName kModeNames[] = {
    {DeviceMode::Movie,    "movie"},
    {DeviceMode::Playlist, "playlist"},
    {DeviceMode::RealTime, "rt"},
    {DeviceMode::Demo,     "demo"},
    {DeviceMode::Effect,   "effect"},
    {DeviceMode::Color,    "color"},
    {DeviceMode::Off,      "off"},
};

/**
 * @brief Copy an optional string field; leaves out unchanged if absent
 */
void readString(JsonObjectConst root, const char* key, std::string& out) {
    if (root[key].is<const char*>()) {
        out = root[key].as<const char*>();
    }
}

void readUint(JsonObjectConst root, const char* key, uint32_t& out) {
    if (root[key].is<uint32_t>()) {
        out = root[key].as<uint32_t>();
    }
}

/**
 * @brief Read the optional `code` field; absent means Ok
 */
ResponseCode readCode(JsonObjectConst root) {
    if (root["code"].is<int64_t>()) {
        return responseCodeFromInt(root["code"].as<int64_t>());
    }
    return ResponseCode::Ok;
}

} // namespace

bool parseDeviceMode(const char* name, DeviceMode& out) {
    if (name == nullptr) return false;
    for (const ModeName& entry : kModeNames) {
        if (strcmp(entry.name, name) == 0) {
            out = entry.mode;
            return true;
        }
    }
    return false;
}

const char* deviceModeName(DeviceMode mode) {
    for (const ModeName& entry : kModeNames) {
        if (entry.mode == mode) return entry.name;
    }
    return "off";
}

bool DeviceInfo::sameIdentity(const DeviceInfo& other) const {
    return productName == other.productName &&
           hardwareVersion == other.hardwareVersion &&
           bytesPerLed == other.bytesPerLed &&
           hwId == other.hwId &&
           flashSize == other.flashSize &&
           ledType == other.ledType &&
           productCode == other.productCode &&
           fwFamily == other.fwFamily &&
           deviceName == other.deviceName &&
           mac == other.mac &&
           uuid == other.uuid &&
           maxSupportedLed == other.maxSupportedLed &&
           numberOfLed == other.numberOfLed &&
           ledProfile == other.ledProfile &&
           frameRate == other.frameRate &&
           movieCapacity == other.movieCapacity &&
           maxMovies == other.maxMovies &&
           wireType == other.wireType &&
           copyright == other.copyright;
}

// ============================================================================
// Encode Functions
// ============================================================================

void HttpDeviceCodec::encodeChallenge(const char* challengeB64, JsonObject& obj) {
    obj["challenge"] = challengeB64;
}

void HttpDeviceCodec::encodeVerify(const char* challengeResponseHex, JsonObject& obj) {
    obj["challenge-response"] = challengeResponseHex;
}

void HttpDeviceCodec::encodeMode(DeviceMode mode, JsonObject& obj) {
    obj["mode"] = deviceModeName(mode);
}

void HttpDeviceCodec::encodeDeviceInfo(const DeviceInfo& info, JsonObject& obj) {
    obj["product_name"] = info.productName;
    obj["hardware_version"] = info.hardwareVersion;
    obj["bytes_per_led"] = info.bytesPerLed;
    obj["hw_id"] = info.hwId;
    obj["flash_size"] = info.flashSize;
    obj["led_type"] = info.ledType;
    obj["product_code"] = info.productCode;
    obj["fw_family"] = info.fwFamily;
    obj["device_name"] = info.deviceName;
    obj["uptime"] = std::to_string(info.uptimeMs);
    obj["mac"] = info.mac;
    obj["uuid"] = info.uuid;
    obj["max_supported_led"] = info.maxSupportedLed;
    obj["number_of_led"] = info.numberOfLed;
    obj["led_profile"] = (info.ledProfile == LedProfile::RGBW) ? "RGBW" : "RGB";
    obj["frame_rate"] = info.frameRate;
    obj["measured_frame_rate"] = info.measuredFrameRate;
    obj["movie_capacity"] = info.movieCapacity;
    obj["max_movies"] = info.maxMovies;
    obj["wire_type"] = info.wireType;
    obj["copyright"] = info.copyright;
}

std::string HttpDeviceCodec::toBody(const JsonDocument& doc) {
    std::string body;
    serializeJson(doc, body);
    return body;
}

bool HttpDeviceCodec::parseBody(const std::string& body, JsonDocument& doc, char* errorMsg) {
    DeserializationError err = deserializeJson(doc, body);
    if (err) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Invalid JSON: %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Expected JSON object");
        return false;
    }
    return true;
}

// ============================================================================
// Decode Functions
// ============================================================================

LoginDecodeResult HttpDeviceCodec::decodeLogin(JsonObjectConst root) {
    LoginDecodeResult result;

    if (!root["authentication_token"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'authentication_token'");
        return result;
    }
    result.response.authenticationToken = root["authentication_token"].as<const char*>();

    if (!root["challenge-response"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'challenge-response'");
        return result;
    }
    result.response.challengeResponse = root["challenge-response"].as<const char*>();

    readUint(root, "authentication_token_expires_in", result.response.expiresIn);
    result.response.code = readCode(root);

    result.success = true;
    return result;
}

CodeDecodeResult HttpDeviceCodec::decodeCode(JsonObjectConst root) {
    CodeDecodeResult result;

    if (!root["code"].is<int64_t>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'code'");
        return result;
    }
    int64_t raw = root["code"].as<int64_t>();
    result.code = responseCodeFromInt(raw);

    if (!isOk(result.code)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Device responded %lld (%s)",
                 static_cast<long long>(raw), responseCodeName(result.code));
        return result;
    }

    result.success = true;
    return result;
}

DeviceInfoDecodeResult HttpDeviceCodec::decodeDeviceInfo(JsonObjectConst root) {
    DeviceInfoDecodeResult result;
    DeviceInfo& info = result.info;

    // Extract mac (required, used for key derivation)
    if (!root["mac"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'mac'");
        return result;
    }
    info.mac = root["mac"].as<const char*>();

    // Extract number_of_led (required)
    if (!root["number_of_led"].is<uint32_t>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'number_of_led'");
        return result;
    }
    info.numberOfLed = root["number_of_led"].as<uint32_t>();

    // Extract led_profile (optional, default: RGB)
    if (root["led_profile"].is<const char*>()) {
        const char* profile = root["led_profile"].as<const char*>();
        if (strcmp(profile, "RGB") == 0) {
            info.ledProfile = LedProfile::RGB;
        } else if (strcmp(profile, "RGBW") == 0) {
            info.ledProfile = LedProfile::RGBW;
        } else {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown led_profile: %s", profile);
            return result;
        }
    }

    // Extract uptime (optional, milliseconds sent as a decimal string)
    if (root["uptime"].is<const char*>()) {
        const char* text = root["uptime"].as<const char*>();
        char* end = nullptr;
        unsigned long long ms = strtoull(text, &end, 10);
        if (end == text || *end != '\0') {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid uptime: %s", text);
            return result;
        }
        info.uptimeMs = ms;
    } else if (root["uptime"].is<uint64_t>()) {
        info.uptimeMs = root["uptime"].as<uint64_t>();
    }

    readString(root, "product_name", info.productName);
    readString(root, "hardware_version", info.hardwareVersion);
    readUint(root, "bytes_per_led", info.bytesPerLed);
    readString(root, "hw_id", info.hwId);
    readUint(root, "flash_size", info.flashSize);
    readUint(root, "led_type", info.ledType);
    readString(root, "product_code", info.productCode);
    readString(root, "fw_family", info.fwFamily);
    readString(root, "device_name", info.deviceName);
    readString(root, "uuid", info.uuid);
    readUint(root, "max_supported_led", info.maxSupportedLed);
    readUint(root, "movie_capacity", info.movieCapacity);
    readUint(root, "max_movies", info.maxMovies);
    readUint(root, "wire_type", info.wireType);
    readString(root, "copyright", info.copyright);

    if (root["frame_rate"].is<double>()) {
        info.frameRate = root["frame_rate"].as<double>();
    }
    if (root["measured_frame_rate"].is<double>()) {
        info.measuredFrameRate = root["measured_frame_rate"].as<double>();
    }

    info.code = readCode(root);
    if (!isOk(info.code)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Device responded %u (%s)",
                 static_cast<unsigned>(info.code), responseCodeName(info.code));
        return result;
    }

    result.success = true;
    return result;
}

GestaltIdentityDecodeResult HttpDeviceCodec::decodeGestaltIdentity(JsonObjectConst root) {
    GestaltIdentityDecodeResult result;

    if (!root["mac"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'mac'");
        return result;
    }
    result.identity.mac = root["mac"].as<const char*>();
    readString(root, "device_name", result.identity.deviceName);

    result.success = true;
    return result;
}

ModeDecodeResult HttpDeviceCodec::decodeMode(JsonObjectConst root) {
    ModeDecodeResult result;

    if (!root["mode"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'mode'");
        return result;
    }
    const char* name = root["mode"].as<const char*>();
    if (!parseDeviceMode(name, result.mode)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown mode: %s", name);
        return result;
    }

    result.code = readCode(root);
    if (!isOk(result.code)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Device responded %u (%s)",
                 static_cast<unsigned>(result.code), responseCodeName(result.code));
        return result;
    }

    result.success = true;
    return result;
}

CapacityDecodeResult HttpDeviceCodec::decodeCapacity(JsonObjectConst root) {
    CapacityDecodeResult result;

    if (!root["available_frames"].is<uint32_t>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'available_frames'");
        return result;
    }
    result.availableFrames = root["available_frames"].as<uint32_t>();

    result.success = true;
    return result;
}

MovieIdDecodeResult HttpDeviceCodec::decodeMovieId(JsonObjectConst root) {
    MovieIdDecodeResult result;

    if (!root["id"].is<uint32_t>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'id'");
        return result;
    }
    result.id = root["id"].as<uint32_t>();

    result.success = true;
    return result;
}

} // namespace codec
} // namespace glowlink
