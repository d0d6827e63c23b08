#include <Arduino.h>
#include <avr/wdt.h>
#include <Adafruit_NeoPixel.h>
#include "lightbank/hardware.h"
#include "lightbank/config.h"

// One strip object per bank. Pixel buffers are allocated by begin().
static Adafruit_NeoPixel strips[NUM_BANKS] = {
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[0], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[1], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[2], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[3], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[4], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[5], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[6], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[7], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[8], NEO_GRB + NEO_KHZ800),
    Adafruit_NeoPixel(LEDS_PER_BANK, STRIP_PINS[9], NEO_GRB + NEO_KHZ800)
};

static const uint8_t SOUND_PINS[SOUND_CUE_COUNT] = {
    SOUND_START_PIN, SOUND_FAIL_PIN, SOUND_SUCCESS_PIN, SOUND_WIN_PIN
};

void hardware_init(void) {
    Serial.begin(CONSOLE_BAUD);

    // Buttons use the internal pull-up (active-low)
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        pinMode(BUTTON_PINS[i], INPUT_PULLUP);
    }

    // Strips start dark
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        strips[i].begin();
        strips[i].clear();
        strips[i].show();
    }

    // Sound lines idle high before they become outputs, so nothing triggers
    for (uint8_t cue = 0; cue < SOUND_CUE_COUNT; cue++) {
        digitalWrite(SOUND_PINS[cue], HIGH);
        pinMode(SOUND_PINS[cue], OUTPUT);
    }

    randomSeed(analogRead(RANDOM_SEED_PIN));
}

uint32_t hardware_millis(void) {
    return millis();
}

void hardware_delay(uint32_t ms) {
    // Sleep in slices so a long celebration cannot trip the watchdog
    while (ms > WATCHDOG_FEED_SLICE_MS) {
        delay(WATCHDOG_FEED_SLICE_MS);
        hardware_watchdog_feed();
        ms -= WATCHDOG_FEED_SLICE_MS;
    }
    delay(ms);
    hardware_watchdog_feed();
}

void hardware_watchdog_feed(void) {
    wdt_reset();
}

bool button_read_pressed(uint8_t bank) {
    if (bank >= NUM_BANKS) {
        return false;
    }
    // Pull-up wiring: LOW means pressed
    return digitalRead(BUTTON_PINS[bank]) == LOW;
}

void strip_set_pixel(uint8_t bank, uint8_t pixel, Color color) {
    if (bank >= NUM_BANKS || pixel >= LEDS_PER_BANK) {
        return;
    }
    strips[bank].setPixelColor(pixel, color.r, color.g, color.b);
}

void strip_show(uint8_t bank) {
    if (bank >= NUM_BANKS) {
        return;
    }
    strips[bank].show();
}

void sound_line_write(SoundCue cue, bool high) {
    if (cue >= SOUND_CUE_COUNT) {
        return;
    }
    digitalWrite(SOUND_PINS[cue], high ? HIGH : LOW);
}

uint32_t random_below(uint32_t upper) {
    if (upper == 0) {
        return 0;
    }
    return (uint32_t)random((long)upper);
}

void console_write(const char *line) {
    Serial.println(line);
}
