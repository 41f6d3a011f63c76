// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ResponseCode.cpp
 * @brief Device response code table
 */

#include "ResponseCode.h"

namespace glowlink {
namespace codec {

ResponseCode responseCodeFromInt(int64_t raw) {
    switch (raw) {
        case 1000: return ResponseCode::Ok;
        case 1001: return ResponseCode::Error;
        case 1101: return ResponseCode::InvalidArgumentValue;
        case 1102: return ResponseCode::Error2;
        case 1103: return ResponseCode::ValueTooLong;
        case 1104: return ResponseCode::MalformedJson;
        case 1105: return ResponseCode::InvalidArgumentKey;
        case 1107: return ResponseCode::Ok2;
        case 1108: return ResponseCode::Ok3;
        case 1205: return ResponseCode::FirmwareUpgradeSha1Mismatch;
        default:   return ResponseCode::Error;
    }
}

const char* responseCodeName(ResponseCode code) {
    switch (code) {
        case ResponseCode::Ok:                          return "Ok";
        case ResponseCode::Error:                       return "Error";
        case ResponseCode::InvalidArgumentValue:        return "Invalid argument value";
        case ResponseCode::Error2:                      return "Error";
        case ResponseCode::ValueTooLong:                return "Value too long or missing key";
        case ResponseCode::MalformedJson:               return "Malformed JSON";
        case ResponseCode::InvalidArgumentKey:          return "Invalid argument key";
        case ResponseCode::Ok2:                         return "OK?";
        case ResponseCode::Ok3:                         return "OK?";
        case ResponseCode::FirmwareUpgradeSha1Mismatch: return "Firmware upgrade SHA1 mismatch";
    }
    return "Unknown";
}

} // namespace codec
} // namespace glowlink
