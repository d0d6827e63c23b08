#ifndef LIGHTBANK_HARDWARE_H
#define LIGHTBANK_HARDWARE_H

#include <stdint.h>
#include "lightbank/color.h"
#include "lightbank/sound_trigger.h"

// Hardware abstraction layer. The engine and the games only ever talk to the
// board through these functions; src/hardware.cpp implements them on top of
// the Arduino core and Adafruit_NeoPixel, the test suite links a fake.

// Initialise pins, strips, serial console and the random seed
void hardware_init(void);

// Monotonic millisecond counter (wraps, see timing.h)
uint32_t hardware_millis(void);

// Blocking wait. Keeps the watchdog fed for long pauses.
void hardware_delay(uint32_t ms);

void hardware_watchdog_feed(void);

// Raw button level, already inverted for the pull-up wiring
bool button_read_pressed(uint8_t bank);

// LED strips: buffered pixel writes, committed by strip_show()
void strip_set_pixel(uint8_t bank, uint8_t pixel, Color color);
void strip_show(uint8_t bank);

// Drive a sound trigger line (idle high, active low)
void sound_line_write(SoundCue cue, bool high);

// Uniform integer in [0, upper)
uint32_t random_below(uint32_t upper);

// Write one finished log line to the console
void console_write(const char *line);

#endif // LIGHTBANK_HARDWARE_H
