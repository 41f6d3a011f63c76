// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file version.h
 * @brief Version constants for GlowLink
 *
 * Single source of truth for the client version. Reported by `glowctl --version`
 * and sent as the HTTP User-Agent.
 */

#pragma once

#include <stdint.h>

// ============================================================================
// Version Components
// ============================================================================

#define GLOWLINK_VERSION_MAJOR  1
#define GLOWLINK_VERSION_MINOR  0
#define GLOWLINK_VERSION_PATCH  0

// ============================================================================
// Derived Version Identifiers
// ============================================================================

/**
 * @brief Human-readable version string (e.g., "1.0.0")
 *
 * Overridable via build flag: -D GLOWLINK_VERSION_STRING=\"1.0.1-beta\"
 */
#ifndef GLOWLINK_VERSION_STRING
#define GLOWLINK_VERSION_STRING "1.0.0"
#endif

/**
 * @brief Numeric version for comparison (MAJOR*10000 + MINOR*100 + PATCH)
 */
#define GLOWLINK_VERSION_NUMBER \
    ((uint32_t)(GLOWLINK_VERSION_MAJOR * 10000 + GLOWLINK_VERSION_MINOR * 100 + GLOWLINK_VERSION_PATCH))

#define GLOWLINK_USER_AGENT "glowctl/" GLOWLINK_VERSION_STRING
