#include "lightbank/color.h"

bool colors_match(Color a, Color b) {
    return a == b;
}

bool all_banks_same_color(const Color *colors, uint8_t count) {
    for (uint8_t i = 1; i < count; i++) {
        if (!colors_match(colors[0], colors[i])) {
            return false;
        }
    }
    return true;
}

static uint8_t shift_channel(uint8_t current, uint8_t target, uint8_t step) {
    if (current < target) {
        return (target - current > step) ? (uint8_t)(current + step) : target;
    }
    if (current > target) {
        return (current - target > step) ? (uint8_t)(current - step) : target;
    }
    return current;
}

Color color_shift_towards(Color current, Color target, uint8_t step) {
    Color shifted = {
        shift_channel(current.r, target.r, step),
        shift_channel(current.g, target.g, step),
        shift_channel(current.b, target.b, step)
    };
    return shifted;
}

Color color_wheel(uint8_t pos) {
    Color c;
    if (pos < 85) {
        c.r = 255 - pos * 3;
        c.g = pos * 3;
        c.b = 0;
    } else if (pos < 170) {
        pos -= 85;
        c.r = 0;
        c.g = 255 - pos * 3;
        c.b = pos * 3;
    } else {
        pos -= 170;
        c.r = pos * 3;
        c.g = 0;
        c.b = 255 - pos * 3;
    }
    return c;
}

Color color_scale(Color color, uint8_t level) {
    Color scaled = {
        (uint8_t)(((uint16_t)color.r * level) / 255),
        (uint8_t)(((uint16_t)color.g * level) / 255),
        (uint8_t)(((uint16_t)color.b * level) / 255)
    };
    return scaled;
}

int8_t color_index_of(const Color *colors, uint8_t count, Color color) {
    for (uint8_t i = 0; i < count; i++) {
        if (colors_match(colors[i], color)) {
            return (int8_t)i;
        }
    }
    return -1;
}
