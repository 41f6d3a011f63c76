// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AuthCrypto.cpp
 * @brief Handshake key derivation and digest, backed by mbedTLS
 */

#include "AuthCrypto.h"
#include "Rc4.h"
#include "../config/network_config.h"

#include <mbedtls/base64.h>
#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/sha1.h>

#include <cstring>

#define GL_LOG_TAG "AuthCrypto"
#include "../utils/Log.h"

namespace glowlink {
namespace crypto {

namespace {

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool parseMac(const char* text, uint8_t out[6]) {
    if (text == nullptr) return false;

    const char* p = text;
    for (int octet = 0; octet < 6; octet++) {
        int hi = hexNibble(p[0]);
        int lo = (hi >= 0) ? hexNibble(p[1]) : -1;
        if (hi < 0 || lo < 0) return false;
        out[octet] = static_cast<uint8_t>((hi << 4) | lo);
        p += 2;
        if (octet < 5) {
            if (*p != ':') return false;
            p++;
        }
    }
    return *p == '\0';
}

void deriveKey(const uint8_t* secret, size_t secretLen,
               const uint8_t mac[6], uint8_t* outKey) {
    for (size_t i = 0; i < secretLen; i++) {
        outKey[i] = secret[i] ^ mac[i % 6];
    }
}

void toHex(const uint8_t* data, size_t len, char* out) {
    static const char kDigits[] = "0123456789abcdef";
    for (size_t i = 0; i < len; i++) {
        out[i * 2] = kDigits[data[i] >> 4];
        out[i * 2 + 1] = kDigits[data[i] & 0x0F];
    }
    out[len * 2] = '\0';
}

bool makeChallengeResponse(const uint8_t* challenge, size_t challengeLen,
                           const uint8_t mac[6],
                           char outHex[CHALLENGE_RESPONSE_HEX_LEN + 1]) {
    using namespace config::NetworkConfig;

    uint8_t key[SHARED_SECRET_LEN];
    deriveKey(reinterpret_cast<const uint8_t*>(SHARED_SECRET), SHARED_SECRET_LEN, mac, key);

    std::vector<uint8_t> cipher(challenge, challenge + challengeLen);
    Rc4 rc4;
    if (!rc4.init(key, sizeof(key))) {
        return false;
    }
    rc4.apply(cipher.data(), cipher.size());
    memset(key, 0, sizeof(key));

    uint8_t digest[SHA1_DIGEST_LEN];
    mbedtls_sha1_context ctx;
    mbedtls_sha1_init(&ctx);
    int ret = mbedtls_sha1_starts(&ctx);
    if (ret == 0) ret = mbedtls_sha1_update(&ctx, cipher.data(), cipher.size());
    if (ret == 0) ret = mbedtls_sha1_finish(&ctx, digest);
    mbedtls_sha1_free(&ctx);

    if (ret != 0) {
        GL_LOGE("SHA-1 failed: -0x%04x", static_cast<unsigned>(-ret));
        return false;
    }

    toHex(digest, SHA1_DIGEST_LEN, outHex);
    return true;
}

bool generateChallenge(uint8_t* out, size_t len) {
    static const char kPersonalization[] = "glowlink-challenge";

    mbedtls_entropy_context entropy;
    mbedtls_ctr_drbg_context drbg;
    mbedtls_entropy_init(&entropy);
    mbedtls_ctr_drbg_init(&drbg);

    int ret = mbedtls_ctr_drbg_seed(&drbg, mbedtls_entropy_func, &entropy,
                                    reinterpret_cast<const unsigned char*>(kPersonalization),
                                    sizeof(kPersonalization) - 1);
    if (ret == 0) {
        ret = mbedtls_ctr_drbg_random(&drbg, out, len);
    }

    mbedtls_ctr_drbg_free(&drbg);
    mbedtls_entropy_free(&entropy);

    if (ret != 0) {
        GL_LOGE("Challenge generation failed: -0x%04x", static_cast<unsigned>(-ret));
        return false;
    }
    return true;
}

bool base64Encode(const uint8_t* data, size_t len, std::string& out) {
    size_t needed = 0;
    mbedtls_base64_encode(nullptr, 0, &needed, data, len);

    std::vector<unsigned char> buf(needed + 1);
    size_t written = 0;
    if (mbedtls_base64_encode(buf.data(), buf.size(), &written, data, len) != 0) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(buf.data()), written);
    return true;
}

bool base64Decode(const std::string& text, std::vector<uint8_t>& out) {
    const unsigned char* src = reinterpret_cast<const unsigned char*>(text.data());
    size_t needed = 0;
    int ret = mbedtls_base64_decode(nullptr, 0, &needed, src, text.size());
    if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        return false;
    }

    out.assign(needed, 0);
    size_t written = 0;
    if (needed > 0 &&
        mbedtls_base64_decode(out.data(), out.size(), &written, src, text.size()) != 0) {
        out.clear();
        return false;
    }
    out.resize(written);
    return true;
}

} // namespace crypto
} // namespace glowlink
