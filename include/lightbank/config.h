#ifndef LIGHTBANK_CONFIG_H
#define LIGHTBANK_CONFIG_H

#include <stdint.h>

// Bank layout
const uint8_t NUM_BANKS = 10;
const uint8_t LEDS_PER_BANK = 12;
const uint16_t TOTAL_LEDS = (uint16_t)NUM_BANKS * LEDS_PER_BANK;

// Pin definitions (Arduino Mega 2560)
// Button i and strip i form bank i. Buttons are wired to GND (active-low).
const uint8_t BUTTON_PINS[NUM_BANKS] = {22, 23, 24, 25, 26, 27, 28, 29, 30, 31};
const uint8_t STRIP_PINS[NUM_BANKS]  = {2, 3, 4, 5, 6, 7, 8, 9, 10, 11};

// Sound trigger lines, indexed by SoundCue
const uint8_t SOUND_START_PIN = 40;
const uint8_t SOUND_FAIL_PIN = 41;
const uint8_t SOUND_SUCCESS_PIN = 42;
const uint8_t SOUND_WIN_PIN = 43;

// Floating analogue pin used to seed random()
const uint8_t RANDOM_SEED_PIN = 0;  // A0

// Timing constants (milliseconds)
const uint16_t DEBOUNCE_MS = 120;
const uint16_t LOOP_IDLE_MS = 10;
const uint16_t SOUND_PULSE_MS = 100;
const uint16_t FAULT_RECOVERY_MS = 1000;
const uint16_t WATCHDOG_FEED_SLICE_MS = 250;

// Fire flicker
const uint8_t FLICKER_MIN_LEVEL = 90;      // brightness out of 255
const uint8_t FLICKER_MAX_LEVEL = 255;
const uint16_t FLICKER_MIN_INTERVAL_MS = 70;
const uint16_t FLICKER_MAX_INTERVAL_MS = 160;
const uint8_t FLICKER_EASE_SHIFT = 3;      // level moves 1/8 of the way per frame
const uint8_t FLICKER_JITTER = 12;         // +/- per channel

// Serial console
const uint32_t CONSOLE_BAUD = 115200;
const uint8_t LOG_LINE_MAX = 96;

// Active game, see games.h for the ids
#ifndef LIGHTBANK_GAME
#define LIGHTBANK_GAME 3
#endif
const uint8_t ACTIVE_GAME_ID = LIGHTBANK_GAME;

#endif // LIGHTBANK_CONFIG_H
