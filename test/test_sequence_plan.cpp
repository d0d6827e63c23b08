#include <gtest/gtest.h>
#include "fake_hardware.h"
#include "lightbank/config.h"
#include "lightbank/sequence_plan.h"

TEST(SequencePlan, EveryPlanIsAPermutation) {
    fake_hardware_reset(1000, 777);
    SequencePlan plan;

    for (int round = 0; round < 2000; round++) {
        sequence_generate(&plan);
        ASSERT_EQ(0, plan.cursor);

        bool seen[NUM_BANKS] = {};
        for (uint8_t k = 0; k < NUM_BANKS; k++) {
            ASSERT_LT(plan.order[k], NUM_BANKS);
            ASSERT_FALSE(seen[plan.order[k]]) << "bank repeated in round " << round;
            seen[plan.order[k]] = true;
        }
    }
}

TEST(SequencePlan, FirstPositionIsUniform) {
    fake_hardware_reset(1000, 2024);
    SequencePlan plan;
    const int runs = 10000;
    int counts[NUM_BANKS] = {};

    for (int round = 0; round < runs; round++) {
        sequence_generate(&plan);
        counts[plan.order[0]]++;
    }

    double expected = (double)runs / NUM_BANKS;
    double chi_square = 0.0;
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        double diff = counts[i] - expected;
        chi_square += diff * diff / expected;
    }

    // 9 degrees of freedom, p = 0.001
    EXPECT_LT(chi_square, 27.88);
}

TEST(SequencePlan, FixedPointsAreAllowed) {
    fake_hardware_reset(1000, 99);
    SequencePlan plan;
    bool saw_fixed_point = false;

    for (int round = 0; round < 200 && !saw_fixed_point; round++) {
        sequence_generate(&plan);
        saw_fixed_point = plan.order[0] == 0;
    }
    EXPECT_TRUE(saw_fixed_point);
}

TEST(SequencePlan, CursorOnlyAdvancesOnTheExpectedBank) {
    SequencePlan plan = {{4, 0, 7, 1, 2, 3, 5, 6, 8, 9}, 0};

    EXPECT_EQ(4, sequence_expected(&plan));
    EXPECT_FALSE(sequence_accept(&plan, 0));
    EXPECT_EQ(0, plan.cursor);

    EXPECT_TRUE(sequence_accept(&plan, 4));
    EXPECT_EQ(1, plan.cursor);
    EXPECT_EQ(0, sequence_expected(&plan));
}

TEST(SequencePlan, CompletesAfterEveryBank) {
    SequencePlan plan = {{9, 8, 7, 6, 5, 4, 3, 2, 1, 0}, 0};

    for (uint8_t k = 0; k < NUM_BANKS; k++) {
        EXPECT_FALSE(sequence_complete(&plan));
        EXPECT_TRUE(sequence_accept(&plan, plan.order[k]));
    }

    EXPECT_TRUE(sequence_complete(&plan));
    EXPECT_EQ(NUM_BANKS, plan.cursor);
    EXPECT_EQ(-1, sequence_expected(&plan));
    EXPECT_FALSE(sequence_accept(&plan, 0));
    EXPECT_FALSE(sequence_accept(&plan, 255));
}

TEST(SequencePlan, ShuffleUsesTheRandomSource) {
    fake_hardware_reset();
    // Draws for i = 10..2: always pick index 0
    fake_queue_random({0, 0, 0, 0, 0, 0, 0, 0, 0});

    SequencePlan plan;
    sequence_generate(&plan);

    // Swapping slot i-1 with slot 0 each step rotates the identity
    const uint8_t expected[NUM_BANKS] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 0};
    for (uint8_t k = 0; k < NUM_BANKS; k++) {
        EXPECT_EQ(expected[k], plan.order[k]) << "slot " << (int)k;
    }
}
