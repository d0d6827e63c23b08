#ifndef LIGHTBANK_OUTPUT_BANK_H
#define LIGHTBANK_OUTPUT_BANK_H

#include <stdint.h>
#include "lightbank/config.h"
#include "lightbank/color.h"

// How a chase maps (phase, bank, pixel) onto the colour wheel
enum ChaseMapping {
    CHASE_PIXEL_ONLY,     // every bank shows the same rainbow
    CHASE_BANK_OFFSET,    // rainbow also rotates from bank to bank
    CHASE_GLOBAL_INDEX    // one rainbow stretched over all 120 pixels
};

struct FlickerState {
    uint16_t level;           // 8.8 fixed point brightness
    uint8_t target;
    uint32_t next_pick_ms;
};

struct OutputBank {
    Color shown[NUM_BANKS];   // colour of the last fill on each bank
    FlickerState flicker[NUM_BANKS];
};

// Steppable chase: one call to chase_render_frame() draws one frame.
// Finite, and restartable with chase_begin().
struct ChaseAnimation {
    uint16_t phase;
    uint16_t end_phase;
    uint8_t speed;
    ChaseMapping mapping;
};

void output_init(OutputBank *output);

// ========== Immediate fills ==========
// Each bank is latched once, after all its pixels are written.
void output_fill(OutputBank *output, uint8_t bank, Color color);
void output_fill_all(OutputBank *output, Color color);
void output_show_colors(OutputBank *output, const Color *colors);
Color output_shown(const OutputBank *output, uint8_t bank);

// ========== Blocking cues ==========
// Short on/off alternation; the bank is left showing what it showed before.
void output_blink(OutputBank *output, uint8_t bank, Color color, uint8_t times,
                  uint16_t on_ms, uint16_t off_ms);

// Whole-cabinet blink, ends dark
void output_blink_all(OutputBank *output, Color color, uint8_t times,
                      uint16_t on_ms, uint16_t off_ms);

// Rainbow over 256 * cycles phase steps of `speed`, step_delay_ms per frame
void output_chase(OutputBank *output, uint8_t cycles, uint8_t speed,
                  uint16_t step_delay_ms, ChaseMapping mapping);

void chase_begin(ChaseAnimation *anim, uint8_t cycles, uint8_t speed, ChaseMapping mapping);
bool chase_render_frame(ChaseAnimation *anim, OutputBank *output);
uint16_t chase_frame_count(const ChaseAnimation *anim);
Color chase_pixel_color(ChaseMapping mapping, uint16_t phase, uint8_t bank, uint8_t pixel);

// ========== Non-blocking effects ==========
// One fire frame on `bank` around `base`. Call every tick.
void output_flicker(OutputBank *output, uint8_t bank, Color base, uint32_t now);

#endif // LIGHTBANK_OUTPUT_BANK_H
