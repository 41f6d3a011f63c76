// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_http_device_codec.cpp
 * @brief Unit tests for device JSON bodies, response codes and movie bodies
 */

#include <unity.h>
#include <ArduinoJson.h>
#include <cstring>
#include <string>
#include <vector>

#include "codec/HttpDeviceCodec.h"
#include "codec/MovieCodec.h"
#include "codec/ResponseCode.h"

using namespace glowlink;
using namespace glowlink::codec;

void setUp(void) {}
void tearDown(void) {}

static const char* kGestalt =
    "{\"product_name\":\"Twinkly\",\"hardware_version\":\"100\",\"bytes_per_led\":3,"
    "\"hw_id\":\"0012ab\",\"flash_size\":64,\"led_type\":14,\"product_code\":\"TWS250STP\","
    "\"fw_family\":\"G\",\"device_name\":\"Tree\",\"uptime\":\"123456\","
    "\"mac\":\"98:84:e3:12:34:56\",\"uuid\":\"E1A4-00\",\"max_supported_led\":1020,"
    "\"number_of_led\":250,\"led_profile\":\"RGB\",\"frame_rate\":23.5,"
    "\"measured_frame_rate\":22.1,\"movie_capacity\":992,\"max_movies\":55,"
    "\"wire_type\":1,\"copyright\":\"LEDWORKS 2021\",\"code\":1000}";

static JsonObjectConst parse(JsonDocument& doc, const char* body) {
    char errorMsg[MAX_ERROR_MSG] = {0};
    TEST_ASSERT_TRUE_MESSAGE(HttpDeviceCodec::parseBody(body, doc, errorMsg), errorMsg);
    return doc.as<JsonObjectConst>();
}

// ============================================================================
// Response codes
// ============================================================================

void test_response_code_table() {
    TEST_ASSERT_EQUAL(ResponseCode::Ok, responseCodeFromInt(1000));
    TEST_ASSERT_EQUAL(ResponseCode::MalformedJson, responseCodeFromInt(1104));
    TEST_ASSERT_EQUAL(ResponseCode::FirmwareUpgradeSha1Mismatch, responseCodeFromInt(1205));
    TEST_ASSERT_EQUAL(ResponseCode::Error, responseCodeFromInt(4242));
    TEST_ASSERT_EQUAL(ResponseCode::Error, responseCodeFromInt(-1));
}

void test_only_1000_is_ok() {
    TEST_ASSERT_TRUE(isOk(ResponseCode::Ok));
    TEST_ASSERT_FALSE(isOk(ResponseCode::Ok2));
    TEST_ASSERT_FALSE(isOk(ResponseCode::Ok3));
    TEST_ASSERT_FALSE(isOk(ResponseCode::Error));
}

void test_decode_code_rejects_ambiguous_ok() {
    JsonDocument doc;
    CodeDecodeResult result = HttpDeviceCodec::decodeCode(parse(doc, "{\"code\":1107}"));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQUAL(ResponseCode::Ok2, result.code);

    JsonDocument ok;
    TEST_ASSERT_TRUE(HttpDeviceCodec::decodeCode(parse(ok, "{\"code\":1000}")).success);

    JsonDocument missing;
    TEST_ASSERT_FALSE(HttpDeviceCodec::decodeCode(parse(missing, "{}")).success);
}

// ============================================================================
// Login / verify bodies
// ============================================================================

void test_encode_challenge_and_verify() {
    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();
    HttpDeviceCodec::encodeChallenge("AAECAw==", obj);
    TEST_ASSERT_EQUAL_STRING("{\"challenge\":\"AAECAw==\"}", HttpDeviceCodec::toBody(doc).c_str());

    JsonDocument verify;
    JsonObject v = verify.to<JsonObject>();
    HttpDeviceCodec::encodeVerify("abc123", v);
    TEST_ASSERT_EQUAL_STRING("{\"challenge-response\":\"abc123\"}",
                             HttpDeviceCodec::toBody(verify).c_str());
}

void test_decode_login() {
    JsonDocument doc;
    LoginDecodeResult result = HttpDeviceCodec::decodeLogin(parse(doc,
        "{\"authentication_token\":\"AAECAwQFBgc=\",\"authentication_token_expires_in\":14400,"
        "\"challenge-response\":\"00ff\",\"code\":1000}"));

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL_STRING("AAECAwQFBgc=", result.response.authenticationToken.c_str());
    TEST_ASSERT_EQUAL_STRING("00ff", result.response.challengeResponse.c_str());
    TEST_ASSERT_EQUAL_UINT32(14400, result.response.expiresIn);
}

void test_decode_login_requires_token() {
    JsonDocument doc;
    LoginDecodeResult result = HttpDeviceCodec::decodeLogin(parse(doc,
        "{\"challenge-response\":\"00ff\",\"code\":1000}"));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_NOT_NULL(strstr(result.errorMsg, "authentication_token"));
}

void test_parse_body_rejects_malformed_json() {
    JsonDocument doc;
    char errorMsg[MAX_ERROR_MSG] = {0};
    TEST_ASSERT_FALSE(HttpDeviceCodec::parseBody("{\"code\":", doc, errorMsg));
    TEST_ASSERT_TRUE(strlen(errorMsg) > 0);
}

// ============================================================================
// Gestalt
// ============================================================================

void test_decode_device_info() {
    JsonDocument doc;
    DeviceInfoDecodeResult result = HttpDeviceCodec::decodeDeviceInfo(parse(doc, kGestalt));

    TEST_ASSERT_TRUE(result.success);
    const DeviceInfo& info = result.info;
    TEST_ASSERT_EQUAL_STRING("Tree", info.deviceName.c_str());
    TEST_ASSERT_EQUAL_STRING("98:84:e3:12:34:56", info.mac.c_str());
    TEST_ASSERT_EQUAL_UINT32(250, info.numberOfLed);
    TEST_ASSERT_EQUAL(LedProfile::RGB, info.ledProfile);
    TEST_ASSERT_EQUAL_UINT64(123456, info.uptimeMs);
    TEST_ASSERT_EQUAL_UINT32(992, info.movieCapacity);
    TEST_ASSERT_EQUAL_UINT32(1020, info.maxSupportedLed);
    TEST_ASSERT_DOUBLE_WITHIN(1e-9, 23.5, info.frameRate);
    TEST_ASSERT_EQUAL_STRING("TWS250STP", info.productCode.c_str());
}

void test_decode_device_info_requires_mac_and_led_count() {
    JsonDocument doc;
    TEST_ASSERT_FALSE(HttpDeviceCodec::decodeDeviceInfo(
        parse(doc, "{\"number_of_led\":10}")).success);

    JsonDocument doc2;
    TEST_ASSERT_FALSE(HttpDeviceCodec::decodeDeviceInfo(
        parse(doc2, "{\"mac\":\"98:84:e3:12:34:56\"}")).success);
}

void test_decode_device_info_rejects_unknown_profile() {
    JsonDocument doc;
    TEST_ASSERT_FALSE(HttpDeviceCodec::decodeDeviceInfo(parse(doc,
        "{\"mac\":\"98:84:e3:12:34:56\",\"number_of_led\":10,\"led_profile\":\"CMYK\"}")).success);
}

void test_decode_gestalt_identity_needs_only_mac() {
    JsonDocument doc;
    GestaltIdentityDecodeResult result = HttpDeviceCodec::decodeGestaltIdentity(
        parse(doc, "{\"mac\":\"98:84:e3:12:34:56\",\"device_name\":\"Tree\"}"));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL_STRING("98:84:e3:12:34:56", result.identity.mac.c_str());
    TEST_ASSERT_EQUAL_STRING("Tree", result.identity.deviceName.c_str());

    // Profiles the full decoder rejects do not matter here
    JsonDocument doc2;
    result = HttpDeviceCodec::decodeGestaltIdentity(
        parse(doc2, "{\"mac\":\"98:84:e3:12:34:56\",\"led_profile\":\"CMYK\"}"));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_TRUE(result.identity.deviceName.empty());

    JsonDocument doc3;
    TEST_ASSERT_FALSE(HttpDeviceCodec::decodeGestaltIdentity(
        parse(doc3, "{\"device_name\":\"Tree\"}")).success);
}

void test_device_identity_ignores_volatile_fields() {
    JsonDocument doc;
    DeviceInfo a = HttpDeviceCodec::decodeDeviceInfo(parse(doc, kGestalt)).info;
    DeviceInfo b = a;
    b.uptimeMs += 5000;
    b.measuredFrameRate = 11.0;
    TEST_ASSERT_TRUE(a.sameIdentity(b));

    b.numberOfLed = 100;
    TEST_ASSERT_FALSE(a.sameIdentity(b));
}

void test_device_info_encode_decode_keeps_identity() {
    JsonDocument doc;
    DeviceInfo info = HttpDeviceCodec::decodeDeviceInfo(parse(doc, kGestalt)).info;

    JsonDocument out;
    JsonObject obj = out.to<JsonObject>();
    HttpDeviceCodec::encodeDeviceInfo(info, obj);

    JsonDocument reparsed;
    DeviceInfoDecodeResult again =
        HttpDeviceCodec::decodeDeviceInfo(parse(reparsed, HttpDeviceCodec::toBody(out).c_str()));
    TEST_ASSERT_TRUE(again.success);
    TEST_ASSERT_TRUE(info.sameIdentity(again.info));
}

// ============================================================================
// Mode / capacity / movie id
// ============================================================================

void test_device_mode_names() {
    DeviceMode mode;
    TEST_ASSERT_TRUE(parseDeviceMode("rt", mode));
    TEST_ASSERT_EQUAL(DeviceMode::RealTime, mode);
    TEST_ASSERT_EQUAL_STRING("playlist", deviceModeName(DeviceMode::Playlist));
    TEST_ASSERT_FALSE(parseDeviceMode("disco", mode));
}

void test_encode_and_decode_mode() {
    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();
    HttpDeviceCodec::encodeMode(DeviceMode::RealTime, obj);
    TEST_ASSERT_EQUAL_STRING("{\"mode\":\"rt\"}", HttpDeviceCodec::toBody(doc).c_str());

    JsonDocument reply;
    ModeDecodeResult result = HttpDeviceCodec::decodeMode(parse(reply, "{\"mode\":\"movie\",\"code\":1000}"));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL(DeviceMode::Movie, result.mode);
}

void test_decode_capacity_and_movie_id() {
    JsonDocument doc;
    CapacityDecodeResult cap = HttpDeviceCodec::decodeCapacity(
        parse(doc, "{\"movies\":[],\"available_frames\":992,\"max_capacity\":992,\"code\":1000}"));
    TEST_ASSERT_TRUE(cap.success);
    TEST_ASSERT_EQUAL_UINT32(992, cap.availableFrames);

    JsonDocument idDoc;
    MovieIdDecodeResult id = HttpDeviceCodec::decodeMovieId(parse(idDoc, "{\"id\":3,\"code\":1000}"));
    TEST_ASSERT_TRUE(id.success);
    TEST_ASSERT_EQUAL_UINT32(3, id.id);
}

// ============================================================================
// Movie body
// ============================================================================

void test_movie_rgb_body_concatenates_frames() {
    std::vector<Frame> frames = {
        {RGB(1, 2, 3), RGB(4, 5, 6)},
        {RGB(7, 8, 9), RGB(10, 11, 12)},
    };
    std::vector<uint8_t> body;
    TEST_ASSERT_TRUE(MovieCodec::encode(frames, LedProfile::RGB, body).success);

    const uint8_t expected[] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    TEST_ASSERT_EQUAL_size_t(sizeof(expected), body.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, body.data(), sizeof(expected));
}

void test_movie_rgbw_extracts_white() {
    std::vector<Frame> frames = {{RGB(200, 100, 50), RGB(0, 0, 0)}};
    std::vector<uint8_t> body;
    TEST_ASSERT_TRUE(MovieCodec::encode(frames, LedProfile::RGBW, body).success);

    const uint8_t expected[] = {150, 50, 0, 50, 0, 0, 0, 0};
    TEST_ASSERT_EQUAL_size_t(sizeof(expected), body.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, body.data(), sizeof(expected));
}

void test_movie_rejects_ragged_frames() {
    std::vector<Frame> frames = {{RGB(1, 2, 3)}, {RGB(1, 2, 3), RGB(4, 5, 6)}};
    std::vector<uint8_t> body;
    Status status = MovieCodec::encode(frames, LedProfile::RGB, body);
    TEST_ASSERT_FALSE(status.success);
    TEST_ASSERT_EQUAL(ErrorKind::VALIDATION, status.kind);

    std::vector<Frame> none;
    TEST_ASSERT_FALSE(MovieCodec::encode(none, LedProfile::RGB, body).success);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_response_code_table);
    RUN_TEST(test_only_1000_is_ok);
    RUN_TEST(test_decode_code_rejects_ambiguous_ok);
    RUN_TEST(test_encode_challenge_and_verify);
    RUN_TEST(test_decode_login);
    RUN_TEST(test_decode_login_requires_token);
    RUN_TEST(test_parse_body_rejects_malformed_json);
    RUN_TEST(test_decode_device_info);
    RUN_TEST(test_decode_device_info_requires_mac_and_led_count);
    RUN_TEST(test_decode_device_info_rejects_unknown_profile);
    RUN_TEST(test_decode_gestalt_identity_needs_only_mac);
    RUN_TEST(test_device_identity_ignores_volatile_fields);
    RUN_TEST(test_device_info_encode_decode_keeps_identity);
    RUN_TEST(test_device_mode_names);
    RUN_TEST(test_encode_and_decode_mode);
    RUN_TEST(test_decode_capacity_and_movie_id);
    RUN_TEST(test_movie_rgb_body_concatenates_frames);
    RUN_TEST(test_movie_rgbw_extracts_white);
    RUN_TEST(test_movie_rejects_ragged_frames);

    return UNITY_END();
}
