// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Rc4.cpp
 * @brief RC4 key scheduling and keystream generation
 */

#include "Rc4.h"

#include <utility>

namespace glowlink {
namespace crypto {

bool Rc4::init(const uint8_t* key, size_t keyLen) {
    if (key == nullptr || keyLen == 0 || keyLen > 256) {
        m_ready = false;
        return false;
    }

    for (int i = 0; i < 256; i++) {
        m_state[i] = static_cast<uint8_t>(i);
    }

    uint8_t j = 0;
    for (int i = 0; i < 256; i++) {
        j = static_cast<uint8_t>(j + m_state[i] + key[i % keyLen]);
        std::swap(m_state[i], m_state[j]);
    }

    m_i = 0;
    m_j = 0;
    m_ready = true;
    return true;
}

void Rc4::apply(uint8_t* data, size_t len) {
    if (!m_ready) return;

    for (size_t n = 0; n < len; n++) {
        m_i = static_cast<uint8_t>(m_i + 1);
        m_j = static_cast<uint8_t>(m_j + m_state[m_i]);
        std::swap(m_state[m_i], m_state[m_j]);
        uint8_t k = m_state[static_cast<uint8_t>(m_state[m_i] + m_state[m_j])];
        data[n] ^= k;
    }
}

} // namespace crypto
} // namespace glowlink
