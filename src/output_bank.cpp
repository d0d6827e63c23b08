#include "lightbank/output_bank.h"
#include "lightbank/hardware.h"
#include "lightbank/timing.h"

void output_init(OutputBank *output) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        output->shown[i] = BLACK;
        output->flicker[i].level = (uint16_t)FLICKER_MIN_LEVEL << 8;
        output->flicker[i].target = FLICKER_MIN_LEVEL;
        output->flicker[i].next_pick_ms = hardware_millis();
    }
}

// ========== Immediate fills ==========

static void write_bank(uint8_t bank, Color color) {
    for (uint8_t pixel = 0; pixel < LEDS_PER_BANK; pixel++) {
        strip_set_pixel(bank, pixel, color);
    }
    strip_show(bank);
}

void output_fill(OutputBank *output, uint8_t bank, Color color) {
    // Bounds checking
    if (bank >= NUM_BANKS) {
        return;
    }

    write_bank(bank, color);
    output->shown[bank] = color;
}

void output_fill_all(OutputBank *output, Color color) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        output_fill(output, i, color);
    }
}

void output_show_colors(OutputBank *output, const Color *colors) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        output_fill(output, i, colors[i]);
    }
}

Color output_shown(const OutputBank *output, uint8_t bank) {
    if (bank >= NUM_BANKS) {
        return BLACK;
    }
    return output->shown[bank];
}

// ========== Blocking cues ==========

void output_blink(OutputBank *output, uint8_t bank, Color color, uint8_t times,
                  uint16_t on_ms, uint16_t off_ms) {
    if (bank >= NUM_BANKS) {
        return;
    }

    Color original = output->shown[bank];
    for (uint8_t i = 0; i < times; i++) {
        output_fill(output, bank, color);
        hardware_delay(on_ms);
        output_fill(output, bank, BLACK);
        hardware_delay(off_ms);
    }
    output_fill(output, bank, original);
}

void output_blink_all(OutputBank *output, Color color, uint8_t times,
                      uint16_t on_ms, uint16_t off_ms) {
    for (uint8_t i = 0; i < times; i++) {
        output_fill_all(output, color);
        hardware_delay(on_ms);
        output_fill_all(output, BLACK);
        hardware_delay(off_ms);
    }
}

void output_chase(OutputBank *output, uint8_t cycles, uint8_t speed,
                  uint16_t step_delay_ms, ChaseMapping mapping) {
    ChaseAnimation anim;
    chase_begin(&anim, cycles, speed, mapping);

    while (chase_render_frame(&anim, output)) {
        // A zero delay still feeds the watchdog
        hardware_delay(step_delay_ms);
    }
}

// ========== Chase frame generator ==========

void chase_begin(ChaseAnimation *anim, uint8_t cycles, uint8_t speed, ChaseMapping mapping) {
    anim->phase = 0;
    anim->end_phase = (uint16_t)cycles * 256;
    anim->speed = speed > 0 ? speed : 1;
    anim->mapping = mapping;
}

uint16_t chase_frame_count(const ChaseAnimation *anim) {
    return (uint16_t)((anim->end_phase + anim->speed - 1) / anim->speed);
}

Color chase_pixel_color(ChaseMapping mapping, uint16_t phase, uint8_t bank, uint8_t pixel) {
    uint16_t pos;

    switch (mapping) {
        case CHASE_BANK_OFFSET:
            pos = (uint16_t)(pixel * 256 / LEDS_PER_BANK) + (uint16_t)(bank * 256 / NUM_BANKS) + phase;
            break;
        case CHASE_GLOBAL_INDEX: {
            uint16_t global = (uint16_t)bank * LEDS_PER_BANK + pixel;
            pos = (uint16_t)((uint32_t)global * 256 / TOTAL_LEDS) + phase;
            break;
        }
        case CHASE_PIXEL_ONLY:
        default:
            pos = (uint16_t)(pixel * 256 / LEDS_PER_BANK) + phase;
            break;
    }

    return color_wheel((uint8_t)(pos & 255));
}

bool chase_render_frame(ChaseAnimation *anim, OutputBank *output) {
    if (anim->phase >= anim->end_phase) {
        return false;
    }

    for (uint8_t bank = 0; bank < NUM_BANKS; bank++) {
        for (uint8_t pixel = 0; pixel < LEDS_PER_BANK; pixel++) {
            strip_set_pixel(bank, pixel, chase_pixel_color(anim->mapping, anim->phase, bank, pixel));
        }
        strip_show(bank);
    }

    // The rainbow owns the strips now; nothing is a solid fill any more
    for (uint8_t bank = 0; bank < NUM_BANKS; bank++) {
        output->shown[bank] = BLACK;
    }

    anim->phase += anim->speed;
    return true;
}

// ========== Fire flicker ==========

static uint8_t jitter_channel(uint8_t value) {
    int16_t jittered = (int16_t)value + (int16_t)random_below(2 * FLICKER_JITTER + 1) - FLICKER_JITTER;
    if (jittered < 0) {
        return 0;
    }
    if (jittered > 255) {
        return 255;
    }
    return (uint8_t)jittered;
}

void output_flicker(OutputBank *output, uint8_t bank, Color base, uint32_t now) {
    if (bank >= NUM_BANKS) {
        return;
    }

    FlickerState &fire = output->flicker[bank];

    // Pick a new brightness target at a random 70-160ms interval
    if (time_reached(now, fire.next_pick_ms)) {
        fire.target = FLICKER_MIN_LEVEL +
            (uint8_t)random_below((uint32_t)(FLICKER_MAX_LEVEL - FLICKER_MIN_LEVEL) + 1);
        fire.next_pick_ms = now + FLICKER_MIN_INTERVAL_MS +
            random_below((uint32_t)(FLICKER_MAX_INTERVAL_MS - FLICKER_MIN_INTERVAL_MS) + 1);
    }

    // Exponential ease toward the target
    int32_t diff = ((int32_t)fire.target << 8) - (int32_t)fire.level;
    fire.level = (uint16_t)((int32_t)fire.level + diff / (1 << FLICKER_EASE_SHIFT));

    Color scaled = color_scale(base, (uint8_t)(fire.level >> 8));

    // Every pixel gets its own jitter
    for (uint8_t pixel = 0; pixel < LEDS_PER_BANK; pixel++) {
        Color ember = {
            jitter_channel(scaled.r),
            jitter_channel(scaled.g),
            jitter_channel(scaled.b)
        };
        strip_set_pixel(bank, pixel, ember);
    }
    strip_show(bank);
}
