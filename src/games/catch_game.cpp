#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/sound_trigger.h"
#include "lightbank/timing.h"

// Banks blink one at a time in a shuffled order. Pressing the bank while it
// blinks wins the round and floods the cabinet with its colour.

const uint8_t HIGHLIGHT_BLINKS = 4;
const uint16_t HIGHLIGHT_HALF_PERIOD_MS = 100;
const uint16_t BANK_GAP_MS = 10;
const uint16_t CYCLE_GAP_MS = 50;
const uint16_t FLOOD_HOLD_MS = 1700;    // flood shown 1.2 s, then 0.5 s before the win cue

static void setup_enter(GameContext *ctx);
static StateId setup_tick(GameContext *ctx);

static void shuffle_enter(GameContext *ctx);
static StateId shuffle_tick(GameContext *ctx);

static void highlight_enter(GameContext *ctx);
static StateId highlight_tick(GameContext *ctx);
static StateId highlight_press(GameContext *ctx, uint8_t bank);

static void win_enter(GameContext *ctx);
static StateId win_tick(GameContext *ctx);

static const StateHandler catch_states[CATCH_STATE_COUNT] = {
    {"SETUP",     setup_enter,     setup_tick,     NULL,            NULL, NULL, 0, NULL},
    {"SHUFFLE",   shuffle_enter,   shuffle_tick,   NULL,            NULL, NULL, 0, NULL},
    {"HIGHLIGHT", highlight_enter, highlight_tick, highlight_press, NULL, NULL, 0, NULL},
    {"WIN",       win_enter,       win_tick,       NULL,            NULL, NULL, 0, NULL}
};

static const GameRules catch_rules = {
    0, 0, 0,
    false,
    100,
    RETRY_KEEP_ROUND,
    false,
    8, 19, 0,
    CHASE_PIXEL_ONLY
};

const GameDefinition CATCH_THE_COLOR_GAME = {
    "CatchTheColor", catch_states, CATCH_STATE_COUNT, CATCH_SETUP, &catch_rules
};

static int8_t highlighted_bank(const GameContext *ctx) {
    return sequence_expected(&ctx->round.plan);
}

// ========== SETUP STATE ==========
static void setup_enter(GameContext *ctx) {
    random_bank_colors(ctx->round.bank_colors);
    ctx->round.target_index = -1;
    output_fill_all(ctx->output, BLACK);
    log_message(LOG_INFO, "ready: press a bank while it blinks");
}

static StateId setup_tick(GameContext *ctx) {
    (void)ctx;
    return CATCH_SHUFFLE;
}

// ========== SHUFFLE STATE ==========
static void shuffle_enter(GameContext *ctx) {
    // New visiting order, same colours
    sequence_generate(&ctx->round.plan);
    hardware_delay(CYCLE_GAP_MS);
}

static StateId shuffle_tick(GameContext *ctx) {
    (void)ctx;
    return CATCH_HIGHLIGHT;
}

// ========== HIGHLIGHT STATE ==========
static void highlight_enter(GameContext *ctx) {
    int8_t bank = highlighted_bank(ctx);
    ctx->round.step = 0;
    ctx->round.step_ms = ctx->now;
    if (is_bank(bank)) {
        output_fill(ctx->output, (uint8_t)bank, ctx->round.bank_colors[bank]);
    }
}

static StateId highlight_tick(GameContext *ctx) {
    int8_t bank = highlighted_bank(ctx);
    if (!is_bank(bank)) {
        return CATCH_SHUFFLE;
    }

    RoundData &round = ctx->round;
    if (time_elapsed(ctx->now, round.step_ms) < HIGHLIGHT_HALF_PERIOD_MS) {
        return STATE_STAY;
    }

    round.step++;
    round.step_ms = ctx->now;

    // Even steps are "on", odd steps "off"
    if (round.step < HIGHLIGHT_BLINKS * 2) {
        output_fill(ctx->output, (uint8_t)bank,
                    (round.step % 2 == 0) ? round.bank_colors[bank] : BLACK);
        return STATE_STAY;
    }

    // Missed it, move on to the next bank
    output_fill(ctx->output, (uint8_t)bank, BLACK);
    hardware_delay(BANK_GAP_MS);
    round.plan.cursor++;
    return sequence_complete(&round.plan) ? CATCH_SHUFFLE : CATCH_HIGHLIGHT;
}

static StateId highlight_press(GameContext *ctx, uint8_t bank) {
    if (highlighted_bank(ctx) != (int8_t)bank) {
        return STATE_STAY;  // Only the blinking bank counts
    }
    ctx->round.target_index = (int8_t)bank;
    return CATCH_WIN;
}

// ========== WIN STATE ==========
static void win_enter(GameContext *ctx) {
    RoundData &round = ctx->round;
    if (!is_bank(round.target_index)) {
        log_message(LOG_CRITICAL, "win without a caught bank");
        return;
    }

    log_message(LOG_INFO, "bank %d caught", round.target_index);
    sound_fire(SOUND_SUCCESS);

    // All banks turn the caught colour
    round.target = round.bank_colors[round.target_index];
    output_fill_all(ctx->output, round.target);
    hardware_delay(FLOOD_HOLD_MS);

    sound_fire(SOUND_WIN);
    play_win_chase(ctx);
}

static StateId win_tick(GameContext *ctx) {
    (void)ctx;
    return CATCH_SETUP;
}
