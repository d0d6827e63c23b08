#ifndef LIGHTBANK_COLOR_H
#define LIGHTBANK_COLOR_H

#include <stdint.h>

struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

inline bool operator==(const Color &a, const Color &b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color &a, const Color &b) {
    return !(a == b);
}

const Color BLACK = {0, 0, 0};
const Color GREEN_FLASH = {0, 255, 0};
const Color RED_FLASH = {255, 0, 0};

const uint8_t PALETTE_SIZE = 10;

// Ten distinct colours, one per bank
const Color COLOR_PALETTE[PALETTE_SIZE] = {
    {255, 0, 0},   {0, 255, 0},   {0, 0, 255},
    {255, 255, 0}, {255, 0, 255}, {0, 255, 255},
    {255, 128, 0}, {255, 255, 255}, {128, 0, 128},
    {0, 128, 255}
};

// Exact channel equality, never a distance check
bool colors_match(Color a, Color b);

// True when every entry equals colors[0]
bool all_banks_same_color(const Color *colors, uint8_t count);

// Move each channel up to `step` toward `target` without overshooting
Color color_shift_towards(Color current, Color target, uint8_t step);

// Classic 0-255 colour wheel: red -> green -> blue -> red
Color color_wheel(uint8_t pos);

// Scale every channel by level/255
Color color_scale(Color color, uint8_t level);

// Index of `color` in `colors`, or -1 if absent
int8_t color_index_of(const Color *colors, uint8_t count, Color color);

#endif // LIGHTBANK_COLOR_H
