#include "fake_hardware.h"
#include "lightbank/config.h"
#include "lightbank/hardware.h"
#include <deque>
#include <random>

namespace {

struct FakeBoard {
    uint32_t now_ms = 0;
    bool buttons[NUM_BANKS] = {};
    Color buffer[NUM_BANKS][LEDS_PER_BANK] = {};
    Color latched[NUM_BANKS][LEDS_PER_BANK] = {};
    uint32_t shows[NUM_BANKS] = {};
    bool sound_high[SOUND_CUE_COUNT] = {};
    uint32_t sound_low_since[SOUND_CUE_COUNT] = {};
    std::vector<SoundPulse> pulses;
    std::vector<std::string> log_lines;
    std::mt19937 rng;
    std::deque<uint32_t> queued_random;
    uint32_t total_delay_ms = 0;
    uint32_t watchdog_feeds = 0;
};

FakeBoard board;

}  // namespace

void fake_hardware_reset(uint32_t start_ms, uint32_t seed) {
    board = FakeBoard();
    board.now_ms = start_ms;
    board.rng.seed(seed);
    for (uint8_t cue = 0; cue < SOUND_CUE_COUNT; cue++) {
        board.sound_high[cue] = true;
    }
}

void fake_advance(uint32_t ms) {
    board.now_ms += ms;
}

uint32_t fake_now(void) {
    return board.now_ms;
}

void fake_set_button(uint8_t bank, bool pressed) {
    board.buttons[bank] = pressed;
}

Color fake_latched_pixel(uint8_t bank, uint8_t pixel) {
    return board.latched[bank][pixel];
}

bool fake_bank_uniform(uint8_t bank) {
    for (uint8_t p = 1; p < LEDS_PER_BANK; p++) {
        if (board.latched[bank][p] != board.latched[bank][0]) {
            return false;
        }
    }
    return true;
}

Color fake_bank_color(uint8_t bank) {
    return board.latched[bank][0];
}

uint32_t fake_show_count(uint8_t bank) {
    return board.shows[bank];
}

const std::vector<SoundPulse> &fake_sound_pulses(void) {
    return board.pulses;
}

bool fake_sound_line_high(SoundCue cue) {
    return board.sound_high[cue];
}

size_t fake_sound_count(SoundCue cue) {
    size_t count = 0;
    for (const SoundPulse &pulse : board.pulses) {
        if (pulse.cue == cue) {
            count++;
        }
    }
    return count;
}

const std::vector<std::string> &fake_log_lines(void) {
    return board.log_lines;
}

bool fake_log_contains(const std::string &needle) {
    for (const std::string &line : board.log_lines) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void fake_queue_random(const std::vector<uint32_t> &values) {
    board.queued_random.insert(board.queued_random.end(), values.begin(), values.end());
}

uint32_t fake_total_delay_ms(void) {
    return board.total_delay_ms;
}

uint32_t fake_watchdog_feeds(void) {
    return board.watchdog_feeds;
}

// ========== hardware.h ==========

void hardware_init(void) {
}

uint32_t hardware_millis(void) {
    return board.now_ms;
}

void hardware_delay(uint32_t ms) {
    board.now_ms += ms;
    board.total_delay_ms += ms;
    hardware_watchdog_feed();
}

void hardware_watchdog_feed(void) {
    board.watchdog_feeds++;
}

bool button_read_pressed(uint8_t bank) {
    if (bank >= NUM_BANKS) {
        return false;
    }
    return board.buttons[bank];
}

void strip_set_pixel(uint8_t bank, uint8_t pixel, Color color) {
    if (bank >= NUM_BANKS || pixel >= LEDS_PER_BANK) {
        return;
    }
    board.buffer[bank][pixel] = color;
}

void strip_show(uint8_t bank) {
    if (bank >= NUM_BANKS) {
        return;
    }
    for (uint8_t p = 0; p < LEDS_PER_BANK; p++) {
        board.latched[bank][p] = board.buffer[bank][p];
    }
    board.shows[bank]++;
}

void sound_line_write(SoundCue cue, bool high) {
    if (cue >= SOUND_CUE_COUNT) {
        return;
    }
    if (!high && board.sound_high[cue]) {
        board.sound_low_since[cue] = board.now_ms;
    } else if (high && !board.sound_high[cue]) {
        SoundPulse pulse = {cue, board.sound_low_since[cue], board.now_ms};
        board.pulses.push_back(pulse);
    }
    board.sound_high[cue] = high;
}

uint32_t random_below(uint32_t upper) {
    if (upper == 0) {
        return 0;
    }
    if (!board.queued_random.empty()) {
        uint32_t value = board.queued_random.front();
        board.queued_random.pop_front();
        return value % upper;
    }
    std::uniform_int_distribution<uint32_t> dist(0, upper - 1);
    return dist(board.rng);
}

void console_write(const char *line) {
    board.log_lines.push_back(line);
}
