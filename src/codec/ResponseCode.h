// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ResponseCode.h
 * @brief Numeric `code` field returned in every device JSON response
 */

#pragma once

#include <stdint.h>

namespace glowlink {
namespace codec {

enum class ResponseCode : uint16_t {
    Ok = 1000,
    Error = 1001,
    InvalidArgumentValue = 1101,
    Error2 = 1102,
    ValueTooLong = 1103,
    MalformedJson = 1104,
    InvalidArgumentKey = 1105,
    Ok2 = 1107,
    Ok3 = 1108,
    FirmwareUpgradeSha1Mismatch = 1205
};

/**
 * @brief Map a raw code to the enum; unknown values become Error
 */
ResponseCode responseCodeFromInt(int64_t raw);

const char* responseCodeName(ResponseCode code);

/**
 * @brief Only 1000 counts as success. 1107/1108 are treated as failures.
 */
inline bool isOk(ResponseCode code) { return code == ResponseCode::Ok; }

} // namespace codec
} // namespace glowlink
