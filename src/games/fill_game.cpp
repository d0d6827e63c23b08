#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/sound_trigger.h"

// The palette is laid out across the banks. The first press picks the
// target colour, then every other bank must be pressed once to fill it.

const uint16_t WIN_PAUSE_MS = 1500;
const uint16_t RESET_PAUSE_MS = 200;

static void select_enter(GameContext *ctx);
static StateId select_press(GameContext *ctx, uint8_t bank);

static void fill_enter(GameContext *ctx);
static StateId fill_tick(GameContext *ctx);
static StateId fill_press(GameContext *ctx, uint8_t bank);

static void win_enter(GameContext *ctx);
static StateId win_tick(GameContext *ctx);

static const StateHandler fill_states[FILL_STATE_COUNT] = {
    {"WAITING_FOR_COLOR_SELECT", select_enter, NULL,      select_press, NULL, NULL, 0, NULL},
    {"COLOR_FILL_GAME",          fill_enter,   fill_tick, fill_press,   NULL, NULL, 0, NULL},
    {"WIN",                      win_enter,    win_tick,  NULL,         NULL, NULL, 0, NULL}
};

static const GameRules fill_rules = {
    0, 0, 0,
    false,
    100,
    RETRY_KEEP_ROUND,
    false,
    5, 19, 0,
    CHASE_GLOBAL_INDEX
};

const GameDefinition COLOR_FILL_GAME = {
    "ColorFill", fill_states, FILL_STATE_COUNT, FILL_SELECT, &fill_rules
};

// ========== COLOR SELECT STATE ==========
static void select_enter(GameContext *ctx) {
    RoundData &round = ctx->round;

    // Distinct colours to choose from, in palette order
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        round.bank_colors[i] = COLOR_PALETTE[i % PALETTE_SIZE];
        round.filled[i] = false;
    }
    round.target = BLACK;
    round.target_index = -1;

    output_show_colors(ctx->output, round.bank_colors);
    log_message(LOG_INFO, "ready: press any bank to pick the colour");
}

static StateId select_press(GameContext *ctx, uint8_t bank) {
    ctx->round.target = ctx->round.bank_colors[bank];
    ctx->round.target_index = (int8_t)bank;
    return FILL_GAME;
}

// ========== COLOR FILL STATE ==========
static void fill_enter(GameContext *ctx) {
    RoundData &round = ctx->round;

    output_fill_all(ctx->output, BLACK);
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        round.bank_colors[i] = BLACK;
        round.filled[i] = false;
    }

    if (!is_bank(round.target_index)) {
        return;  // fill_tick sends us back to selection
    }

    // The picking bank keeps the target colour
    round.bank_colors[round.target_index] = round.target;
    round.filled[round.target_index] = true;
    output_fill(ctx->output, (uint8_t)round.target_index, round.target);

    log_message(LOG_INFO, "target set on bank %d, fill the rest", round.target_index);
}

static StateId fill_tick(GameContext *ctx) {
    if (!is_bank(ctx->round.target_index)) {
        log_message(LOG_CRITICAL, "fill round without a target");
        return FILL_SELECT;
    }
    return STATE_STAY;
}

static StateId fill_press(GameContext *ctx, uint8_t bank) {
    RoundData &round = ctx->round;

    if (round.filled[bank]) {
        return STATE_STAY;  // Already lit, nothing to do
    }

    round.bank_colors[bank] = round.target;
    round.filled[bank] = true;
    output_fill(ctx->output, bank, round.target);

    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        if (!round.filled[i]) {
            return STATE_STAY;
        }
    }
    return FILL_WIN;
}

// ========== WIN STATE ==========
static void win_enter(GameContext *ctx) {
    log_message(LOG_INFO, "all banks filled");
    sound_fire(SOUND_WIN);
    play_win_chase(ctx);
    hardware_delay(WIN_PAUSE_MS);

    output_fill_all(ctx->output, BLACK);
    hardware_delay(RESET_PAUSE_MS);
}

static StateId win_tick(GameContext *ctx) {
    (void)ctx;
    return FILL_SELECT;
}
