// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_auth_crypto.cpp
 * @brief Unit tests for the MAC-keyed challenge-response primitives
 */

#include <unity.h>
#include <cstring>
#include <string>
#include <vector>

#include <mbedtls/sha1.h>

#include "config/network_config.h"
#include "crypto/AuthCrypto.h"
#include "crypto/Rc4.h"

using namespace glowlink;
using namespace glowlink::crypto;
using config::NetworkConfig::SHARED_SECRET;
using config::NetworkConfig::SHARED_SECRET_LEN;

void setUp(void) {}
void tearDown(void) {}

static const uint8_t kMac[6] = {0x98, 0x84, 0xe3, 0x12, 0x34, 0x56};

// ============================================================================
// RC4
// ============================================================================

void test_rc4_known_vector_key_plaintext() {
    // Classic vector: key "Key", plaintext "Plaintext"
    const uint8_t expected[] = {0xBB, 0xF3, 0x16, 0xE8, 0xD9, 0x40, 0xAF, 0x0A, 0xD3};
    uint8_t data[9];
    memcpy(data, "Plaintext", 9);

    Rc4 rc4;
    TEST_ASSERT_TRUE(rc4.init(reinterpret_cast<const uint8_t*>("Key"), 3));
    rc4.apply(data, sizeof(data));

    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, data, sizeof(expected));
}

void test_rc4_known_vector_wiki_pedia() {
    const uint8_t expected[] = {0x10, 0x21, 0xBF, 0x04, 0x20};
    uint8_t data[5];
    memcpy(data, "pedia", 5);

    Rc4 rc4;
    TEST_ASSERT_TRUE(rc4.init(reinterpret_cast<const uint8_t*>("Wiki"), 4));
    rc4.apply(data, sizeof(data));

    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, data, sizeof(expected));
}

void test_rc4_is_symmetric() {
    uint8_t data[32];
    for (size_t i = 0; i < sizeof(data); i++) data[i] = static_cast<uint8_t>(i * 7);
    uint8_t original[32];
    memcpy(original, data, sizeof(data));

    const uint8_t key[] = {1, 2, 3, 4, 5};
    Rc4 enc;
    Rc4 dec;
    TEST_ASSERT_TRUE(enc.init(key, sizeof(key)));
    TEST_ASSERT_TRUE(dec.init(key, sizeof(key)));
    enc.apply(data, sizeof(data));
    TEST_ASSERT_FALSE(memcmp(original, data, sizeof(data)) == 0);
    dec.apply(data, sizeof(data));

    TEST_ASSERT_EQUAL_HEX8_ARRAY(original, data, sizeof(data));
}

void test_rc4_rejects_empty_key() {
    Rc4 rc4;
    TEST_ASSERT_FALSE(rc4.init(nullptr, 0));
}

// ============================================================================
// MAC parsing and key derivation
// ============================================================================

void test_parse_mac_accepts_mixed_case() {
    uint8_t mac[6];
    TEST_ASSERT_TRUE(parseMac("98:84:E3:12:34:56", mac));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(kMac, mac, 6);
}

void test_parse_mac_rejects_malformed() {
    uint8_t mac[6];
    TEST_ASSERT_FALSE(parseMac("98:84:e3:12:34", mac));
    TEST_ASSERT_FALSE(parseMac("98:84:e3:12:34:56:78", mac));
    TEST_ASSERT_FALSE(parseMac("98-84-e3-12-34-56", mac));
    TEST_ASSERT_FALSE(parseMac("zz:84:e3:12:34:56", mac));
    TEST_ASSERT_FALSE(parseMac("", mac));
}

void test_derive_key_xor_mac_restores_secret() {
    const uint8_t* secret = reinterpret_cast<const uint8_t*>(SHARED_SECRET);
    uint8_t key[SHARED_SECRET_LEN];
    deriveKey(secret, SHARED_SECRET_LEN, kMac, key);

    for (size_t i = 0; i < SHARED_SECRET_LEN; i++) {
        TEST_ASSERT_EQUAL_HEX8(secret[i], key[i] ^ kMac[i % 6]);
    }
}

// ============================================================================
// Challenge-response
// ============================================================================

void test_challenge_response_matches_rc4_then_sha1() {
    uint8_t challenge[32];
    for (size_t i = 0; i < sizeof(challenge); i++) challenge[i] = static_cast<uint8_t>(i);

    char hex[CHALLENGE_RESPONSE_HEX_LEN + 1];
    TEST_ASSERT_TRUE(makeChallengeResponse(challenge, sizeof(challenge), kMac, hex));
    TEST_ASSERT_EQUAL_size_t(CHALLENGE_RESPONSE_HEX_LEN, strlen(hex));

    // Recompute from the primitives
    uint8_t key[SHARED_SECRET_LEN];
    deriveKey(reinterpret_cast<const uint8_t*>(SHARED_SECRET), SHARED_SECRET_LEN, kMac, key);
    uint8_t cipher[32];
    memcpy(cipher, challenge, sizeof(cipher));
    Rc4 rc4;
    TEST_ASSERT_TRUE(rc4.init(key, sizeof(key)));
    rc4.apply(cipher, sizeof(cipher));

    uint8_t digest[SHA1_DIGEST_LEN];
    TEST_ASSERT_EQUAL_INT(0, mbedtls_sha1(cipher, sizeof(cipher), digest));
    char expected[CHALLENGE_RESPONSE_HEX_LEN + 1];
    toHex(digest, sizeof(digest), expected);

    TEST_ASSERT_EQUAL_STRING(expected, hex);
}

void test_challenge_response_is_deterministic_and_lowercase() {
    uint8_t challenge[32];
    memset(challenge, 0xA5, sizeof(challenge));

    char a[CHALLENGE_RESPONSE_HEX_LEN + 1];
    char b[CHALLENGE_RESPONSE_HEX_LEN + 1];
    TEST_ASSERT_TRUE(makeChallengeResponse(challenge, sizeof(challenge), kMac, a));
    TEST_ASSERT_TRUE(makeChallengeResponse(challenge, sizeof(challenge), kMac, b));
    TEST_ASSERT_EQUAL_STRING(a, b);

    for (size_t i = 0; i < CHALLENGE_RESPONSE_HEX_LEN; i++) {
        TEST_ASSERT_TRUE((a[i] >= '0' && a[i] <= '9') || (a[i] >= 'a' && a[i] <= 'f'));
    }
}

void test_challenge_response_depends_on_challenge_and_mac() {
    uint8_t challenge[32];
    memset(challenge, 0x11, sizeof(challenge));
    char base[CHALLENGE_RESPONSE_HEX_LEN + 1];
    TEST_ASSERT_TRUE(makeChallengeResponse(challenge, sizeof(challenge), kMac, base));

    uint8_t otherChallenge[32];
    memcpy(otherChallenge, challenge, sizeof(challenge));
    otherChallenge[31] ^= 0x01;
    char byChallenge[CHALLENGE_RESPONSE_HEX_LEN + 1];
    TEST_ASSERT_TRUE(makeChallengeResponse(otherChallenge, sizeof(otherChallenge), kMac, byChallenge));
    TEST_ASSERT_TRUE(strcmp(base, byChallenge) != 0);

    uint8_t otherMac[6];
    memcpy(otherMac, kMac, 6);
    otherMac[5] ^= 0x01;
    char byMac[CHALLENGE_RESPONSE_HEX_LEN + 1];
    TEST_ASSERT_TRUE(makeChallengeResponse(challenge, sizeof(challenge), otherMac, byMac));
    TEST_ASSERT_TRUE(strcmp(base, byMac) != 0);
}

// ============================================================================
// Random challenge and base64
// ============================================================================

void test_generate_challenge_differs_between_calls() {
    uint8_t a[32];
    uint8_t b[32];
    TEST_ASSERT_TRUE(generateChallenge(a, sizeof(a)));
    TEST_ASSERT_TRUE(generateChallenge(b, sizeof(b)));
    TEST_ASSERT_FALSE(memcmp(a, b, sizeof(a)) == 0);
}

void test_base64_token_decodes_to_eight_bytes() {
    std::vector<uint8_t> raw;
    TEST_ASSERT_TRUE(base64Decode("AAECAwQFBgc=", raw));
    TEST_ASSERT_EQUAL_size_t(8, raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        TEST_ASSERT_EQUAL_UINT8(i, raw[i]);
    }

    std::string text;
    TEST_ASSERT_TRUE(base64Encode(raw.data(), raw.size(), text));
    TEST_ASSERT_EQUAL_STRING("AAECAwQFBgc=", text.c_str());
}

void test_base64_rejects_garbage() {
    std::vector<uint8_t> raw;
    TEST_ASSERT_FALSE(base64Decode("not base64!", raw));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_rc4_known_vector_key_plaintext);
    RUN_TEST(test_rc4_known_vector_wiki_pedia);
    RUN_TEST(test_rc4_is_symmetric);
    RUN_TEST(test_rc4_rejects_empty_key);
    RUN_TEST(test_parse_mac_accepts_mixed_case);
    RUN_TEST(test_parse_mac_rejects_malformed);
    RUN_TEST(test_derive_key_xor_mac_restores_secret);
    RUN_TEST(test_challenge_response_matches_rc4_then_sha1);
    RUN_TEST(test_challenge_response_is_deterministic_and_lowercase);
    RUN_TEST(test_challenge_response_depends_on_challenge_and_mac);
    RUN_TEST(test_generate_challenge_differs_between_calls);
    RUN_TEST(test_base64_token_decodes_to_eight_bytes);
    RUN_TEST(test_base64_rejects_garbage);

    return UNITY_END();
}
