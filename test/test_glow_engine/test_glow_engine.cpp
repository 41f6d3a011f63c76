// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_glow_engine.cpp
 * @brief Unit tests for the per-LED glow animation
 */

#include <unity.h>
#include <vector>

#include "effects/GlowEngine.h"

using namespace glowlink;
using namespace glowlink::effects;

void setUp(void) {}
void tearDown(void) {}

static GlowConfig singleColor(uint32_t rise, uint32_t fade, uint32_t interval) {
    GlowConfig config;
    config.riseMs = rise;
    config.fadeMs = fade;
    config.timeBetweenGlowStartMs = interval;
    config.numStartSimultaneous = 1;
    config.palette.push_back(RGB(200, 100, 50));
    return config;
}

// ============================================================================
// Validation
// ============================================================================

void test_rejects_empty_palette() {
    GlowEngine engine(1);
    GlowConfig config = singleColor(100, 100, 10);
    config.palette.clear();

    Status status = engine.configure(5, config, 0);
    TEST_ASSERT_FALSE(status.success);
    TEST_ASSERT_EQUAL(ErrorKind::VALIDATION, status.kind);
    TEST_ASSERT_FALSE(engine.isConfigured());
}

void test_rejects_out_of_range_simultaneous_count() {
    GlowEngine engine(1);
    GlowConfig config = singleColor(100, 100, 10);

    config.numStartSimultaneous = 0;
    TEST_ASSERT_EQUAL(ErrorKind::VALIDATION, engine.configure(5, config, 0).kind);

    config.numStartSimultaneous = 6;
    TEST_ASSERT_EQUAL(ErrorKind::VALIDATION, engine.configure(5, config, 0).kind);

    config.numStartSimultaneous = 5;
    TEST_ASSERT_TRUE(engine.configure(5, config, 0).success);
}

// ============================================================================
// Brightness envelope
// ============================================================================

void test_single_led_envelope() {
    const uint32_t t0 = 5000;
    GlowEngine engine(7);
    TEST_ASSERT_TRUE(engine.configure(1, singleColor(400, 600, 50), t0).success);

    // All LEDs start idle and dark
    TEST_ASSERT_TRUE(engine.isIdle(0, t0));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.0, engine.brightness(0, t0));

    Frame frame;
    engine.tick(t0, frame);
    TEST_ASSERT_EQUAL_UINT32(t0, engine.cycleStart(0));

    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.0, engine.brightness(0, t0));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.5, engine.brightness(0, t0 + 200));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 1.0, engine.brightness(0, t0 + 400));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.5, engine.brightness(0, t0 + 700));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.0, engine.brightness(0, t0 + 1000));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.0, engine.brightness(0, t0 + 5000));
}

void test_frame_scales_color_with_rounding() {
    GlowEngine engine(3);
    TEST_ASSERT_TRUE(engine.configure(1, singleColor(400, 600, 50), 0).success);

    Frame frame;
    engine.tick(0, frame);
    TEST_ASSERT_EQUAL_size_t(1, frame.size());
    TEST_ASSERT_EQUAL_UINT8(0, frame[0].r);

    engine.tick(200, frame);   // brightness 0.5
    TEST_ASSERT_EQUAL_UINT8(100, frame[0].r);
    TEST_ASSERT_EQUAL_UINT8(50, frame[0].g);
    TEST_ASSERT_EQUAL_UINT8(25, frame[0].b);

    engine.tick(300, frame);   // brightness 0.75: 37.5 rounds up
    TEST_ASSERT_EQUAL_UINT8(150, frame[0].r);
    TEST_ASSERT_EQUAL_UINT8(38, frame[0].b);

    engine.tick(400, frame);
    TEST_ASSERT_EQUAL_UINT8(200, frame[0].r);
}

void test_led_not_restarted_before_cycle_completes() {
    GlowEngine engine(11);
    TEST_ASSERT_TRUE(engine.configure(1, singleColor(300, 700, 10), 0).success);

    Frame frame;
    engine.tick(0, frame);
    TEST_ASSERT_EQUAL_UINT32(0, engine.cycleStart(0));

    // Batches are due every 10 ms, but the LED is busy for 1000 ms
    for (uint32_t t = 10; t < 1000; t += 10) {
        engine.tick(t, frame);
        TEST_ASSERT_EQUAL_UINT32(0, engine.cycleStart(0));
        TEST_ASSERT_FALSE(engine.isIdle(0, t));
    }

    engine.tick(1000, frame);
    TEST_ASSERT_EQUAL_UINT32(1000, engine.cycleStart(0));
}

// ============================================================================
// Batches
// ============================================================================

void test_batch_starts_at_most_simultaneous_count() {
    GlowEngine engine(42);
    GlowConfig config = singleColor(500, 500, 100);
    config.numStartSimultaneous = 3;
    TEST_ASSERT_TRUE(engine.configure(10, config, 0).success);

    Frame frame;
    engine.tick(0, frame);

    size_t started = 0;
    for (size_t i = 0; i < engine.ledCount(); i++) {
        if (!engine.isIdle(i, 0)) started++;
    }
    TEST_ASSERT_EQUAL_size_t(3, started);

    // Too early for the next batch
    engine.tick(50, frame);
    started = 0;
    for (size_t i = 0; i < engine.ledCount(); i++) {
        if (!engine.isIdle(i, 50)) started++;
    }
    TEST_ASSERT_EQUAL_size_t(3, started);

    engine.tick(100, frame);
    started = 0;
    for (size_t i = 0; i < engine.ledCount(); i++) {
        if (!engine.isIdle(i, 100)) started++;
    }
    TEST_ASSERT_EQUAL_size_t(6, started);
}

void test_colors_come_from_palette() {
    GlowEngine engine(5);
    GlowConfig config = singleColor(100, 100, 1);
    config.palette = {RGB(255, 0, 0), RGB(0, 0, 255)};
    config.numStartSimultaneous = 8;
    TEST_ASSERT_TRUE(engine.configure(8, config, 0).success);

    Frame frame;
    engine.tick(0, frame);
    for (size_t i = 0; i < 8; i++) {
        const RGB& c = engine.ledColor(i);
        TEST_ASSERT_TRUE(c == RGB(255, 0, 0) || c == RGB(0, 0, 255));
    }
}

void test_same_seed_same_animation() {
    GlowConfig config = singleColor(200, 300, 20);
    config.palette = {RGB(255, 0, 0), RGB(0, 255, 0), RGB(0, 0, 255)};
    config.numStartSimultaneous = 2;

    GlowEngine a(99);
    GlowEngine b(99);
    TEST_ASSERT_TRUE(a.configure(16, config, 0).success);
    TEST_ASSERT_TRUE(b.configure(16, config, 0).success);

    Frame fa;
    Frame fb;
    for (uint32_t t = 0; t < 2000; t += 40) {
        a.tick(t, fa);
        b.tick(t, fb);
        TEST_ASSERT_TRUE(fa == fb);
    }
}

void test_elapsed_time_survives_clock_wrap() {
    const uint32_t t0 = 0xFFFFFF00u;
    GlowEngine engine(1);
    TEST_ASSERT_TRUE(engine.configure(1, singleColor(400, 600, 50), t0).success);

    Frame frame;
    engine.tick(t0, frame);
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 1.0, engine.brightness(0, t0 + 400));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_rejects_empty_palette);
    RUN_TEST(test_rejects_out_of_range_simultaneous_count);
    RUN_TEST(test_single_led_envelope);
    RUN_TEST(test_frame_scales_color_with_rounding);
    RUN_TEST(test_led_not_restarted_before_cycle_completes);
    RUN_TEST(test_batch_starts_at_most_simultaneous_count);
    RUN_TEST(test_colors_come_from_palette);
    RUN_TEST(test_same_seed_same_animation);
    RUN_TEST(test_elapsed_time_survives_clock_wrap);

    return UNITY_END();
}
