#include <gtest/gtest.h>
#include "fake_hardware.h"
#include "lightbank/config.h"
#include "lightbank/input_sampler.h"

class InputSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake_hardware_reset();
        input_init(&input, fake_now());
    }

    ButtonEvent poll() {
        return input_poll(&input, fake_now());
    }

    // Press edge on `bank`, returning what the sampler makes of it
    ButtonEvent press(uint8_t bank) {
        fake_set_button(bank, true);
        return poll();
    }

    void release(uint8_t bank) {
        fake_set_button(bank, false);
        poll();
    }

    InputSampler input;
};

TEST_F(InputSamplerTest, NothingPressedYieldsNoEvent) {
    EXPECT_EQ(EVENT_NONE, poll().type);
}

TEST_F(InputSamplerTest, FirstPressAfterBootIsAccepted) {
    ButtonEvent event = press(4);
    EXPECT_EQ(EVENT_PRESSED, event.type);
    EXPECT_EQ(4, event.index);
}

TEST_F(InputSamplerTest, HeldButtonFiresOnce) {
    EXPECT_EQ(EVENT_PRESSED, press(1).type);
    for (int i = 0; i < 20; i++) {
        fake_advance(LOOP_IDLE_MS);
        EXPECT_EQ(EVENT_NONE, poll().type);
    }
}

TEST_F(InputSamplerTest, PressInsideDebounceWindowIsSuppressed) {
    ASSERT_EQ(EVENT_PRESSED, press(2).type);

    fake_advance(30);
    release(2);
    fake_advance(DEBOUNCE_MS - 31);
    EXPECT_EQ(EVENT_NONE, press(2).type);   // 119ms after the accepted press

    // The bounce still recorded the edge, so the release is seen
    fake_advance(1);
    release(2);
    EXPECT_FALSE(input.buttons[2].was_pressed);
}

TEST_F(InputSamplerTest, PressAtDebounceBoundaryIsAccepted) {
    ASSERT_EQ(EVENT_PRESSED, press(2).type);
    fake_advance(40);
    release(2);
    fake_advance(DEBOUNCE_MS - 40);

    ButtonEvent event = press(2);
    EXPECT_EQ(EVENT_PRESSED, event.type);
    EXPECT_EQ(2, event.index);
}

TEST_F(InputSamplerTest, DebounceIsPerButton) {
    ASSERT_EQ(EVENT_PRESSED, press(0).type);
    release(0);
    fake_advance(10);
    EXPECT_EQ(EVENT_PRESSED, press(1).type);
}

TEST_F(InputSamplerTest, SimultaneousPressesYieldLowestIndexOnly) {
    fake_set_button(2, true);
    fake_set_button(5, true);

    ButtonEvent event = poll();
    EXPECT_EQ(EVENT_PRESSED, event.type);
    EXPECT_EQ(2, event.index);

    // Button 5 was consumed in the same scan and must not fire later
    fake_advance(LOOP_IDLE_MS);
    EXPECT_EQ(EVENT_NONE, poll().type);
    fake_advance(DEBOUNCE_MS);
    EXPECT_EQ(EVENT_NONE, poll().type);
}

TEST_F(InputSamplerTest, ReleaseIsNeverAnEvent) {
    ASSERT_EQ(EVENT_PRESSED, press(7).type);
    fake_advance(200);
    fake_set_button(7, false);
    EXPECT_EQ(EVENT_NONE, poll().type);
}

TEST_F(InputSamplerTest, ButtonHeldAtInitDoesNotFire) {
    fake_set_button(3, true);
    input_init(&input, fake_now());
    EXPECT_EQ(EVENT_NONE, poll().type);

    release(3);
    EXPECT_EQ(EVENT_PRESSED, press(3).type);
}

TEST_F(InputSamplerTest, ResyncSwallowsHeldButtons) {
    fake_set_button(6, true);
    input_resync(&input);
    EXPECT_EQ(EVENT_NONE, poll().type);
}

TEST_F(InputSamplerTest, LockoutTurnsPressIntoLockedPress) {
    input_set_lockout(&input, 3, fake_now(), 500);
    EXPECT_TRUE(input_is_locked(&input, 3, fake_now()));

    ButtonEvent event = press(3);
    EXPECT_EQ(EVENT_LOCKED_PRESS, event.type);
    EXPECT_EQ(3, event.index);

    release(3);
    fake_advance(500);
    EXPECT_FALSE(input_is_locked(&input, 3, fake_now()));
    EXPECT_EQ(EVENT_PRESSED, press(3).type);
}

TEST_F(InputSamplerTest, LockedPressStillRespectsDebounce) {
    input_set_lockout(&input, 1, fake_now(), 2000);
    ASSERT_EQ(EVENT_LOCKED_PRESS, press(1).type);
    release(1);
    fake_advance(20);
    EXPECT_EQ(EVENT_NONE, press(1).type);
}

TEST_F(InputSamplerTest, ExpiredLockoutIsReportedOnce) {
    input_set_lockout(&input, 8, fake_now(), 500);
    input_set_lockout(&input, 4, fake_now(), 800);

    EXPECT_EQ(-1, input_take_expired_lockout(&input, fake_now()));
    fake_advance(500);
    EXPECT_EQ(8, input_take_expired_lockout(&input, fake_now()));
    EXPECT_EQ(-1, input_take_expired_lockout(&input, fake_now()));
    fake_advance(300);
    EXPECT_EQ(4, input_take_expired_lockout(&input, fake_now()));
}

TEST_F(InputSamplerTest, LockoutCanBeExtended) {
    input_set_lockout(&input, 0, fake_now(), 500);
    fake_advance(400);
    input_set_lockout(&input, 0, fake_now(), 2000);
    fake_advance(1000);
    EXPECT_TRUE(input_is_locked(&input, 0, fake_now()));
    EXPECT_EQ(-1, input_take_expired_lockout(&input, fake_now()));
}

TEST(InputSamplerWrap, DebounceSurvivesCounterWrap) {
    fake_hardware_reset(0xFFFFFFC0u);
    InputSampler input;
    input_init(&input, fake_now());

    fake_set_button(0, true);
    ASSERT_EQ(EVENT_PRESSED, input_poll(&input, fake_now()).type);
    fake_set_button(0, false);
    input_poll(&input, fake_now());

    // 100ms later the counter has wrapped past zero
    fake_advance(100);
    ASSERT_LT(fake_now(), 0xFFFFFFC0u);
    fake_set_button(0, true);
    EXPECT_EQ(EVENT_NONE, input_poll(&input, fake_now()).type);
    fake_set_button(0, false);
    input_poll(&input, fake_now());

    fake_advance(30);
    fake_set_button(0, true);
    EXPECT_EQ(EVENT_PRESSED, input_poll(&input, fake_now()).type);
}

TEST(InputSamplerWrap, LockoutSurvivesCounterWrap) {
    fake_hardware_reset(0xFFFFFF00u);
    InputSampler input;
    input_init(&input, fake_now());

    input_set_lockout(&input, 5, fake_now(), 500);
    fake_advance(0x100);   // counter reads 0
    EXPECT_TRUE(input_is_locked(&input, 5, fake_now()));
    fake_advance(244);
    EXPECT_FALSE(input_is_locked(&input, 5, fake_now()));
    EXPECT_EQ(5, input_take_expired_lockout(&input, fake_now()));
}
