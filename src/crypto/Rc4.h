// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Rc4.h
 * @brief RC4 stream cipher used by the device challenge-response handshake
 *
 * The device firmware derives its challenge-response from an RC4 ciphertext,
 * so this exists for interoperability only. It is not a general-purpose cipher.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace glowlink {
namespace crypto {

class Rc4 {
public:
    Rc4() : m_i(0), m_j(0), m_ready(false) {}

    /**
     * @brief Run the key-scheduling algorithm
     * @param key Key bytes
     * @param keyLen Key length, 1..256
     * @return false if the key length is out of range
     */
    bool init(const uint8_t* key, size_t keyLen);

    /**
     * @brief XOR the keystream into data in place
     *
     * Consecutive calls continue the same keystream.
     */
    void apply(uint8_t* data, size_t len);

    bool isReady() const { return m_ready; }

private:
    uint8_t m_state[256];
    uint8_t m_i;
    uint8_t m_j;
    bool m_ready;
};

} // namespace crypto
} // namespace glowlink
