#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/sound_trigger.h"

// Every bank starts with a random colour. Pressing bank i (i > 0) shifts it
// one step toward bank 0's colour; the round is won when all ten match.
// Landslide adds a per-press lockout and punishes presses during it.

const uint8_t BLINK_TIMES = 2;
const uint16_t WIN_PAUSE_MS = 1500;

// Forward declarations for enter/update/exit functions
static void setup_enter(GameContext *ctx);
static StateId setup_tick(GameContext *ctx);

static StateId play_press(GameContext *ctx, uint8_t bank);
static StateId play_locked_press(GameContext *ctx, uint8_t bank);
static StateId play_tick(GameContext *ctx);

static void win_enter(GameContext *ctx);
static StateId win_tick(GameContext *ctx);

// State handler table
static const StateHandler converge_states[CONVERGE_STATE_COUNT] = {
    // name     enter        tick        press       locked press       frame interval exit
    {"SETUP",   setup_enter, setup_tick, NULL,       NULL,              NULL, 0,       NULL},
    {"PLAY",    NULL,        play_tick,  play_press, play_locked_press, NULL, 0,       NULL},
    {"WIN",     win_enter,   win_tick,   NULL,       NULL,              NULL, 0,       NULL}
};

static const GameRules match_rules = {
    85,                 // shift_step
    0,                  // press_lockout_ms
    0,                  // penalty_lockout_ms
    false,              // miss_plays_fail_sound
    10,                 // blink_ms
    RETRY_KEEP_ROUND,
    false,              // attract_flicker
    5, 19, 0,           // chase cycles, speed, step ms
    CHASE_PIXEL_ONLY
};

static const GameRules landslide_rules = {
    40,
    500,
    2000,
    true,
    100,
    RETRY_KEEP_ROUND,
    false,
    1, 1, 2,
    CHASE_PIXEL_ONLY
};

const GameDefinition MATCH_GAME = {
    "Match", converge_states, CONVERGE_STATE_COUNT, CONVERGE_SETUP, &match_rules
};

const GameDefinition LANDSLIDE_GAME = {
    "Landslide", converge_states, CONVERGE_STATE_COUNT, CONVERGE_SETUP, &landslide_rules
};

// ========== SETUP STATE ==========
static void setup_enter(GameContext *ctx) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        input_clear_lockout(ctx->input, i);
    }
    random_bank_colors(ctx->round.bank_colors);
    output_show_colors(ctx->output, ctx->round.bank_colors);
    sound_fire(SOUND_START);
    log_message(LOG_INFO, "ready: match every bank to bank 0");
}

static StateId setup_tick(GameContext *ctx) {
    (void)ctx;
    return CONVERGE_PLAY;
}

// ========== PLAY STATE ==========
static StateId play_press(GameContext *ctx, uint8_t bank) {
    const GameRules *rules = ctx->rules;
    RoundData &round = ctx->round;

    // Short lockout so one bank cannot be hammered
    if (rules->press_lockout_ms > 0) {
        input_set_lockout(ctx->input, bank, ctx->now, rules->press_lockout_ms);
    }

    Color target = round.bank_colors[0];

    if (bank == 0) {
        // Target bank never changes
        sound_fire(SOUND_SUCCESS);
        output_blink(ctx->output, bank, GREEN_FLASH, BLINK_TIMES, rules->blink_ms, rules->blink_ms);
        return STATE_STAY;
    }

    round.bank_colors[bank] = color_shift_towards(round.bank_colors[bank], target, rules->shift_step);

    if (colors_match(round.bank_colors[bank], target)) {
        log_message(LOG_INFO, "bank %u matched", (unsigned)bank);
        sound_fire(SOUND_SUCCESS);
        output_blink(ctx->output, bank, GREEN_FLASH, BLINK_TIMES, rules->blink_ms, rules->blink_ms);
    } else {
        if (rules->miss_plays_fail_sound) {
            sound_fire(SOUND_FAIL);
        }
        output_blink(ctx->output, bank, RED_FLASH, BLINK_TIMES, rules->blink_ms, rules->blink_ms);
    }

    output_show_colors(ctx->output, round.bank_colors);

    if (all_banks_same_color(round.bank_colors, NUM_BANKS)) {
        return CONVERGE_WIN;
    }
    return STATE_STAY;
}

static StateId play_locked_press(GameContext *ctx, uint8_t bank) {
    if (ctx->rules->penalty_lockout_ms == 0) {
        return STATE_STAY;
    }

    // Penalty: bank goes dark and the lockout is extended
    log_message(LOG_WARN, "bank %u pressed during lockout", (unsigned)bank);
    output_fill(ctx->output, bank, BLACK);
    input_set_lockout(ctx->input, bank, ctx->now, ctx->rules->penalty_lockout_ms);
    return STATE_STAY;
}

static StateId play_tick(GameContext *ctx) {
    // Expired lockouts get their colour back
    int8_t expired = input_take_expired_lockout(ctx->input, ctx->now);
    if (is_bank(expired)) {
        output_fill(ctx->output, (uint8_t)expired, ctx->round.bank_colors[expired]);
    }
    return STATE_STAY;
}

// ========== WIN STATE ==========
static void win_enter(GameContext *ctx) {
    log_message(LOG_INFO, "all banks match");
    sound_fire(SOUND_WIN);
    play_win_chase(ctx);
    hardware_delay(WIN_PAUSE_MS);
}

static StateId win_tick(GameContext *ctx) {
    (void)ctx;
    return CONVERGE_SETUP;
}
