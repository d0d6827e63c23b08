#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/sound_trigger.h"

// All ten banks light up one after another in a random order; the player
// presses them back in the same order. The first bank stays lit as a hint.

const uint16_t START_PAUSE_MS = 500;
const uint16_t SHOW_STEP_MS = 300;
const uint8_t FAIL_BLINKS = 2;
const uint8_t WIN_FRAMES = 3;
const uint16_t WIN_FRAME_MS = 3000;

static void setup_enter(GameContext *ctx);
static StateId setup_tick(GameContext *ctx);

static void show_enter(GameContext *ctx);
static StateId show_tick(GameContext *ctx);

static void turn_enter(GameContext *ctx);
static StateId turn_press(GameContext *ctx, uint8_t bank);

static void fail_enter(GameContext *ctx);
static StateId fail_tick(GameContext *ctx);

static void win_enter(GameContext *ctx);
static StateId win_tick(GameContext *ctx);

static const StateHandler sequence_states[SEQUENCE_STATE_COUNT] = {
    {"SETUP",         setup_enter, setup_tick, NULL,       NULL, NULL, 0, NULL},
    {"SHOW_SEQUENCE", show_enter,  show_tick,  NULL,       NULL, NULL, 0, NULL},
    {"PLAYER_TURN",   turn_enter,  NULL,       turn_press, NULL, NULL, 0, NULL},
    {"FAIL",          fail_enter,  fail_tick,  NULL,       NULL, NULL, 0, NULL},
    {"WIN",           win_enter,   win_tick,   NULL,       NULL, NULL, 0, NULL}
};

static const GameRules sequence_rules = {
    0, 0, 0,
    true,
    100,
    RETRY_KEEP_ROUND,
    false,
    0, 1, 0,
    CHASE_PIXEL_ONLY
};

static const GameRules sequence_strict_rules = {
    0, 0, 0,
    true,
    100,
    RETRY_RESTART_ROUND,
    false,
    0, 1, 0,
    CHASE_PIXEL_ONLY
};

const GameDefinition SEQUENCE_GAME = {
    "Sequence", sequence_states, SEQUENCE_STATE_COUNT, SEQUENCE_SETUP, &sequence_rules
};

const GameDefinition SEQUENCE_STRICT_GAME = {
    "SequenceStrict", sequence_states, SEQUENCE_STATE_COUNT, SEQUENCE_SETUP, &sequence_strict_rules
};

// Banks already pressed stay lit; before the first press the first bank
// is lit as a hint.
static void draw_progress(GameContext *ctx) {
    const RoundData &round = ctx->round;
    output_fill_all(ctx->output, BLACK);

    uint8_t lit = round.plan.cursor > 0 ? round.plan.cursor : 1;
    for (uint8_t k = 0; k < lit && k < NUM_BANKS; k++) {
        output_fill(ctx->output, round.plan.order[k], round.target);
    }
}

// ========== SETUP STATE ==========
static void setup_enter(GameContext *ctx) {
    RoundData &round = ctx->round;

    output_fill_all(ctx->output, BLACK);
    round.target = COLOR_PALETTE[random_below(PALETTE_SIZE)];
    sequence_generate(&round.plan);

    sound_fire(SOUND_START);
    hardware_delay(START_PAUSE_MS);
}

static StateId setup_tick(GameContext *ctx) {
    (void)ctx;
    return SEQUENCE_SHOW;
}

// ========== SHOW SEQUENCE STATE ==========
static void show_enter(GameContext *ctx) {
    const RoundData &round = ctx->round;

    output_fill_all(ctx->output, BLACK);
    for (uint8_t k = 0; k < NUM_BANKS; k++) {
        output_fill(ctx->output, round.plan.order[k], round.target);
        hardware_delay(SHOW_STEP_MS);
    }
}

static StateId show_tick(GameContext *ctx) {
    (void)ctx;
    return SEQUENCE_PLAYER_TURN;
}

// ========== PLAYER TURN STATE ==========
static void turn_enter(GameContext *ctx) {
    draw_progress(ctx);
}

static StateId turn_press(GameContext *ctx, uint8_t bank) {
    RoundData &round = ctx->round;

    if (sequence_complete(&round.plan)) {
        log_message(LOG_WARN, "press after the round was complete");
        return SEQUENCE_SETUP;
    }

    if (!sequence_accept(&round.plan, bank)) {
        round.last_press = (int8_t)bank;
        return SEQUENCE_FAIL;
    }

    output_blink(ctx->output, bank, GREEN_FLASH, 1, ctx->rules->blink_ms, ctx->rules->blink_ms);
    sound_fire(SOUND_SUCCESS);
    output_fill(ctx->output, bank, round.target);

    if (sequence_complete(&round.plan)) {
        return SEQUENCE_WIN;
    }
    return STATE_STAY;
}

// ========== FAIL STATE ==========
static void fail_enter(GameContext *ctx) {
    const RoundData &round = ctx->round;
    log_message(LOG_INFO, "wrong bank %d, expected %d",
                round.last_press, sequence_expected(&round.plan));

    if (is_bank(round.last_press)) {
        output_blink(ctx->output, (uint8_t)round.last_press, RED_FLASH, FAIL_BLINKS,
                     ctx->rules->blink_ms, ctx->rules->blink_ms);
    }
    if (ctx->rules->miss_plays_fail_sound) {
        sound_fire(SOUND_FAIL);
    }
}

static StateId fail_tick(GameContext *ctx) {
    if (ctx->rules->retry_policy == RETRY_RESTART_ROUND) {
        return SEQUENCE_SETUP;
    }
    return SEQUENCE_PLAYER_TURN;  // Cursor unchanged
}

// ========== WIN STATE ==========
static void win_enter(GameContext *ctx) {
    log_message(LOG_INFO, "sequence complete");
    sound_fire(SOUND_WIN);

    Color frame[NUM_BANKS];
    for (uint8_t j = 0; j < WIN_FRAMES; j++) {
        random_bank_colors(frame);
        output_show_colors(ctx->output, frame);
        hardware_delay(WIN_FRAME_MS);
    }
    output_fill_all(ctx->output, BLACK);
}

static StateId win_tick(GameContext *ctx) {
    (void)ctx;
    return SEQUENCE_SETUP;
}
