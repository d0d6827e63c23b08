#include <gtest/gtest.h>
#include "lightbank/color.h"
#include "lightbank/config.h"

namespace {

int steps_to_converge(Color from, Color to, uint8_t step) {
    int steps = 0;
    while (!colors_match(from, to) && steps < 1000) {
        from = color_shift_towards(from, to, step);
        steps++;
    }
    return steps;
}

}  // namespace

TEST(Color, ShiftStopsExactlyOnTarget) {
    Color current = {250, 10, 128};
    Color target = {255, 0, 128};
    Color shifted = color_shift_towards(current, target, 40);

    EXPECT_EQ(255, shifted.r);
    EXPECT_EQ(0, shifted.g);
    EXPECT_EQ(128, shifted.b);
}

TEST(Color, ShiftDoesNotMutateInput) {
    const Color current = {0, 0, 0};
    Color shifted = color_shift_towards(current, COLOR_PALETTE[7], 85);

    EXPECT_TRUE(colors_match(current, BLACK));
    EXPECT_EQ(85, shifted.r);
}

TEST(Color, ConvergesWithinCeilingOfStepCount) {
    const uint8_t steps[] = {1, 7, 40, 85, 255};
    for (uint8_t step : steps) {
        int bound = (255 + step - 1) / step;
        for (uint8_t a = 0; a < PALETTE_SIZE; a++) {
            for (uint8_t b = 0; b < PALETTE_SIZE; b++) {
                int taken = steps_to_converge(COLOR_PALETTE[a], COLOR_PALETTE[b], step);
                EXPECT_LE(taken, bound) << "step " << (int)step << " from " << (int)a << " to " << (int)b;
            }
        }
        Color black = BLACK;
        Color white = {255, 255, 255};
        EXPECT_EQ(bound, steps_to_converge(black, white, step));
    }
}

TEST(Color, AllBanksSameColorUsesExactEquality) {
    Color colors[NUM_BANKS];
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        colors[i] = COLOR_PALETTE[4];
    }
    EXPECT_TRUE(all_banks_same_color(colors, NUM_BANKS));

    // One channel off by one on the last bank
    colors[NUM_BANKS - 1].b -= 1;
    EXPECT_FALSE(all_banks_same_color(colors, NUM_BANKS));

    colors[NUM_BANKS - 1] = COLOR_PALETTE[4];
    colors[0].r -= 1;
    EXPECT_FALSE(all_banks_same_color(colors, NUM_BANKS));
}

TEST(Color, WheelPrimaries) {
    Color red = {255, 0, 0};
    Color green = {0, 255, 0};
    Color blue = {0, 0, 255};

    EXPECT_EQ(red, color_wheel(0));
    EXPECT_EQ(green, color_wheel(85));
    EXPECT_EQ(blue, color_wheel(170));

    Color last = color_wheel(255);
    EXPECT_EQ(255, last.r);
    EXPECT_EQ(0, last.b);
}

TEST(Color, ScaleAndIndexOf) {
    Color white = {255, 255, 255};
    Color half = color_scale(white, 128);
    EXPECT_EQ(128, half.r);
    EXPECT_EQ(BLACK, color_scale(white, 0));
    EXPECT_EQ(white, color_scale(white, 255));

    EXPECT_EQ(3, color_index_of(COLOR_PALETTE, PALETTE_SIZE, COLOR_PALETTE[3]));
    Color absent = {1, 2, 3};
    EXPECT_EQ(-1, color_index_of(COLOR_PALETTE, PALETTE_SIZE, absent));
}

TEST(Color, PaletteHasTenDistinctColours) {
    for (uint8_t a = 0; a < PALETTE_SIZE; a++) {
        for (uint8_t b = a + 1; b < PALETTE_SIZE; b++) {
            EXPECT_NE(COLOR_PALETTE[a], COLOR_PALETTE[b]);
        }
    }
}
