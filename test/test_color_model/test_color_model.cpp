// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_color_model.cpp
 * @brief Unit tests for the device color model and named colors
 */

#include <unity.h>
#include <cmath>

#include "color/ColorModel.h"
#include "color/NamedColors.h"

using namespace glowlink;
using namespace glowlink::color;

void setUp(void) {}
void tearDown(void) {}

static const ColorStyle kStyles[] = {
    ColorStyle::Col3, ColorStyle::Col4, ColorStyle::Col6, ColorStyle::Col8, ColorStyle::Col10
};
static const LightnessPolicy kPolicies[] = {LightnessPolicy::Linear, LightnessPolicy::Equilight};

static ColorModel makeModel(ColorStyle style, LightnessPolicy policy) {
    ColorModelConfig config;
    config.style = style;
    config.policy = policy;
    return ColorModel(config);
}

static void assertRgb(const RGB& expected, const RGB& actual) {
    TEST_ASSERT_EQUAL_UINT8(expected.r, actual.r);
    TEST_ASSERT_EQUAL_UINT8(expected.g, actual.g);
    TEST_ASSERT_EQUAL_UINT8(expected.b, actual.b);
}

// ============================================================================
// rgbColor
// ============================================================================

void test_rgb_color_applies_balance() {
    ColorModel model;
    assertRgb(RGB(115, 128, 77), model.rgbColor(0.5, 0.5, 0.5));
    assertRgb(RGB(230, 255, 153), model.rgbColor(1.0, 1.0, 1.0));
    assertRgb(RGB(0, 0, 0), model.rgbColor(0.0, 0.0, 0.0));
}

void test_rgb_color_clamps_out_of_range() {
    ColorModel model;
    assertRgb(RGB(0, 255, 0), model.rgbColor(-0.5, 2.0, NAN));
}

void test_rgb_color_applies_gamma() {
    ColorModelConfig config;
    config.gamma = 2.0;
    config.balance[0] = config.balance[1] = config.balance[2] = 1.0;
    ColorModel model(config);

    // 255 * 0.5^2 = 63.75
    assertRgb(RGB(64, 64, 64), model.rgbColor(0.5, 0.5, 0.5));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.5, model.invGamma(model.gamma(0.5)));
}

// ============================================================================
// hslColor
// ============================================================================

void test_hsl_zero_saturation_is_hue_independent() {
    const double lightness[] = {-0.75, -0.2, 0.0, 0.4, 0.9};
    for (ColorStyle style : kStyles) {
        for (LightnessPolicy policy : kPolicies) {
            ColorModel model = makeModel(style, policy);
            for (double l : lightness) {
                RGB reference = model.hslColor(0.0, 0.0, l);
                for (int k = 1; k < 20; k++) {
                    assertRgb(reference, model.hslColor(k / 20.0, 0.0, l));
                }
            }
        }
    }
}

void test_hsl_minus_one_lightness_is_black() {
    for (ColorStyle style : kStyles) {
        for (LightnessPolicy policy : kPolicies) {
            ColorModel model = makeModel(style, policy);
            for (int k = 0; k < 20; k++) {
                for (int j = 0; j <= 4; j++) {
                    assertRgb(RGB::Black(), model.hslColor(k / 20.0, j / 4.0, -1.0));
                }
            }
        }
    }
}

void test_hsl_equilight_full_lightness_is_device_white() {
    ColorModel model;
    const RGB white = model.rgbColor(1.0, 1.0, 1.0);
    for (int k = 0; k < 10; k++) {
        assertRgb(white, model.hslColor(k / 10.0, 1.0, 1.0));
    }
}

void test_hsl_equilight_green_anchor_is_pure_green() {
    // 8-col ramp places green at 1/4
    ColorModel model;
    assertRgb(RGB(0, 255, 0), model.hslColor(0.25, 1.0, 0.0));
}

void test_hsl_gray_tracks_lightness() {
    ColorModel model;
    const RGB mid = model.hslColor(0.3, 0.0, 0.0);
    assertRgb(model.rgbColor(0.5, 0.5, 0.5), mid);

    uint8_t lastGreen = 0;
    for (int k = -10; k <= 10; k++) {
        RGB c = model.hslColor(0.3, 0.0, k / 10.0);
        TEST_ASSERT_TRUE(c.g >= lastGreen);
        lastGreen = c.g;
    }
}

void test_hsl_clamps_inputs() {
    ColorModel model;
    assertRgb(model.hslColor(1.0, 1.0, 0.0), model.hslColor(3.0, 1.0, 0.0));
    assertRgb(model.hslColor(0.2, 1.0, 0.0), model.hslColor(0.2, 5.0, 0.0));
    assertRgb(RGB::Black(), model.hslColor(0.2, 1.0, -4.0));
}

// ============================================================================
// sRGB conversion
// ============================================================================

void test_srgb_transfer_is_invertible() {
    for (int k = 0; k <= 100; k++) {
        double x = k / 100.0;
        TEST_ASSERT_DOUBLE_WITHIN(1e-9, x, ColorModel::srgbDecode(ColorModel::srgbEncode(x)));
    }
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.0031308 * 12.92, ColorModel::srgbEncode(0.0031308));
}

void test_image_to_led_and_back() {
    ColorModelConfig config;
    config.balance[0] = config.balance[1] = config.balance[2] = 1.0;
    ColorModel model(config);

    for (int v = 0; v <= 255; v += 15) {
        RGB image(static_cast<uint8_t>(v), static_cast<uint8_t>(255 - v), 128);
        RGB back = model.ledToImageRgb(model.imageToLedRgb(image));
        // Quantization in the dark linear range costs a few steps
        TEST_ASSERT_UINT8_WITHIN(6, image.r, back.r);
        TEST_ASSERT_UINT8_WITHIN(6, image.g, back.g);
        TEST_ASSERT_UINT8_WITHIN(6, image.b, back.b);
    }
    assertRgb(RGB(255, 255, 255), model.imageToLedRgb(RGB(255, 255, 255)));
}

void test_color_brightness_weights() {
    ColorModel model;
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 1.0, model.colorBrightness(1.0, 1.0, 1.0));
    TEST_ASSERT_DOUBLE_WITHIN(1e-12, 0.5, model.colorBrightness(0.0, 1.0, 0.0));
}

// ============================================================================
// Configuration
// ============================================================================

void test_parse_style_names() {
    ColorModelConfig config;
    TEST_ASSERT_TRUE(ColorModelConfig::parseStyle("3col", config));
    TEST_ASSERT_EQUAL(ColorStyle::Col3, config.style);
    TEST_ASSERT_TRUE(ColorModelConfig::parseStyle("linear", config));
    TEST_ASSERT_EQUAL(LightnessPolicy::Linear, config.policy);
    TEST_ASSERT_EQUAL(ColorStyle::Col3, config.style);
    TEST_ASSERT_FALSE(ColorModelConfig::parseStyle("12col", config));
    TEST_ASSERT_EQUAL(ColorStyle::Col3, config.style);
}

void test_named_colors_lookup() {
    RGB c;
    TEST_ASSERT_TRUE(lookupNamedColor("red", c));
    assertRgb(RGB(255, 0, 0), c);
    TEST_ASSERT_TRUE(lookupNamedColor("TeAl", c));
    TEST_ASSERT_FALSE(lookupNamedColor("octarine", c));

    size_t count = 0;
    const NamedColor* table = namedColors(count);
    TEST_ASSERT_NOT_NULL(table);
    TEST_ASSERT_EQUAL_size_t(16, count);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_rgb_color_applies_balance);
    RUN_TEST(test_rgb_color_clamps_out_of_range);
    RUN_TEST(test_rgb_color_applies_gamma);
    RUN_TEST(test_hsl_zero_saturation_is_hue_independent);
    RUN_TEST(test_hsl_minus_one_lightness_is_black);
    RUN_TEST(test_hsl_equilight_full_lightness_is_device_white);
    RUN_TEST(test_hsl_equilight_green_anchor_is_pure_green);
    RUN_TEST(test_hsl_gray_tracks_lightness);
    RUN_TEST(test_hsl_clamps_inputs);
    RUN_TEST(test_srgb_transfer_is_invertible);
    RUN_TEST(test_image_to_led_and_back);
    RUN_TEST(test_color_brightness_weights);
    RUN_TEST(test_parse_style_names);
    RUN_TEST(test_named_colors_lookup);

    return UNITY_END();
}
