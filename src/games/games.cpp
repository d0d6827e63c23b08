#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/sequence_plan.h"
#include <stddef.h>

const GameDefinition *game_by_id(uint8_t id) {
    switch (id) {
        case GAME_MATCH:           return &MATCH_GAME;
        case GAME_LANDSLIDE:       return &LANDSLIDE_GAME;
        case GAME_CATCH_THE_COLOR: return &CATCH_THE_COLOR_GAME;
        case GAME_COLOR_FILL:      return &COLOR_FILL_GAME;
        case GAME_COLOR_HUNT:      return &COLOR_HUNT_GAME;
        case GAME_COLOR_HUNT_FIRE: return &COLOR_HUNT_FIRE_GAME;
        case GAME_SEQUENCE:        return &SEQUENCE_GAME;
        case GAME_SEQUENCE_STRICT: return &SEQUENCE_STRICT_GAME;
        default:                   return NULL;
    }
}

void random_bank_colors(Color *colors) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        colors[i] = COLOR_PALETTE[random_below(PALETTE_SIZE)];
    }
}

void shuffled_palette(Color *colors) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        colors[i] = COLOR_PALETTE[i % PALETTE_SIZE];
    }
    shuffle_items(colors, NUM_BANKS);
}

void play_win_chase(GameContext *ctx) {
    const GameRules *rules = ctx->rules;
    output_chase(ctx->output, rules->chase_cycles, rules->chase_speed,
                 rules->chase_step_ms, rules->chase_mapping);
}

bool is_bank(int8_t index) {
    return index >= 0 && index < (int8_t)NUM_BANKS;
}
