// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AuthCrypto.h
 * @brief Primitives for the MAC-keyed device handshake
 *
 * Key derivation: shared secret XOR MAC (MAC repeated cyclically).
 * Challenge response: hex(SHA-1(RC4(key, challenge))).
 *
 * SHA-1, base64 and the random challenge come from mbedTLS.
 *
 * @author GlowLink Team
 * @version 1.0.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace glowlink {
namespace crypto {

static constexpr size_t SHA1_DIGEST_LEN = 20;
static constexpr size_t CHALLENGE_RESPONSE_HEX_LEN = SHA1_DIGEST_LEN * 2;

/**
 * @brief Parse "aa:bb:cc:dd:ee:ff" (case-insensitive) into 6 bytes
 * @return false unless the text is exactly 6 colon-separated hex octets
 */
bool parseMac(const char* text, uint8_t out[6]);

/**
 * @brief XOR secret with the MAC bytes repeated to the secret length
 * @param outKey Receives secretLen bytes
 */
void deriveKey(const uint8_t* secret, size_t secretLen,
               const uint8_t mac[6], uint8_t* outKey);

/**
 * @brief Compute the lowercase hex challenge-response for a device
 *
 * Deterministic in (challenge, mac). Uses the configured shared secret.
 *
 * @param outHex Receives CHALLENGE_RESPONSE_HEX_LEN chars plus NUL
 * @return false if the SHA-1 backend fails
 */
bool makeChallengeResponse(const uint8_t* challenge, size_t challengeLen,
                           const uint8_t mac[6],
                           char outHex[CHALLENGE_RESPONSE_HEX_LEN + 1]);

/**
 * @brief Fill out with cryptographically random bytes (CTR-DRBG)
 */
bool generateChallenge(uint8_t* out, size_t len);

bool base64Encode(const uint8_t* data, size_t len, std::string& out);

/**
 * @brief Decode standard base64
 * @return false on invalid characters or padding
 */
bool base64Decode(const std::string& text, std::vector<uint8_t>& out);

void toHex(const uint8_t* data, size_t len, char* out);

} // namespace crypto
} // namespace glowlink
