#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/sound_trigger.h"

// Pick a colour, watch the palette reshuffle, then find where the colour
// went once the lights are out. The fire variant flickers the selection
// screen and throws the round away on a wrong guess.

const uint16_t SELECT_PAUSE_MS = 200;
const uint16_t BLACKOUT_MS = 500;
const uint16_t MEMORIZE_MS = 900;
const uint16_t WRONG_SHOW_MS = 500;
const uint8_t WIN_BLINKS = 11;
const uint16_t WIN_BLINK_MS = 200;
const uint16_t WIN_PAUSE_MS = 1000;

static void select_enter(GameContext *ctx);
static void select_frame(GameContext *ctx);
static StateId select_press(GameContext *ctx, uint8_t bank);

static void memorize_enter(GameContext *ctx);
static StateId memorize_tick(GameContext *ctx);

static StateId guess_press(GameContext *ctx, uint8_t bank);

static void fail_enter(GameContext *ctx);
static StateId fail_tick(GameContext *ctx);

static void win_enter(GameContext *ctx);
static StateId win_tick(GameContext *ctx);

static const StateHandler hunt_states[HUNT_STATE_COUNT] = {
    // name               enter           tick           press         locked frame         interval exit
    {"WAITING_FOR_START", select_enter,   NULL,          select_press, NULL,  select_frame, 0,       NULL},
    {"MEMORIZE",          memorize_enter, memorize_tick, NULL,         NULL,  NULL,         0,       NULL},
    {"WAITING_FOR_GUESS", NULL,           NULL,          guess_press,  NULL,  NULL,         0,       NULL},
    {"FAIL",              fail_enter,     fail_tick,     NULL,         NULL,  NULL,         0,       NULL},
    {"WIN",               win_enter,      win_tick,      NULL,         NULL,  NULL,         0,       NULL}
};

static const GameRules hunt_rules = {
    0, 0, 0,
    true,
    100,
    RETRY_KEEP_ROUND,
    false,
    1, 2, 10,
    CHASE_BANK_OFFSET
};

static const GameRules hunt_fire_rules = {
    0, 0, 0,
    true,
    100,
    RETRY_RESTART_ROUND,
    true,
    1, 2, 10,
    CHASE_BANK_OFFSET
};

const GameDefinition COLOR_HUNT_GAME = {
    "ColorHunt", hunt_states, HUNT_STATE_COUNT, HUNT_SELECT, &hunt_rules
};

const GameDefinition COLOR_HUNT_FIRE_GAME = {
    "ColorHuntFire", hunt_states, HUNT_STATE_COUNT, HUNT_SELECT, &hunt_fire_rules
};

// ========== WAITING FOR START ==========
static void select_enter(GameContext *ctx) {
    RoundData &round = ctx->round;
    shuffled_palette(round.bank_colors);
    round.target = BLACK;
    round.target_index = -1;
    round.last_press = -1;

    output_show_colors(ctx->output, round.bank_colors);
    log_message(LOG_INFO, "ready: press any bank to pick the colour");
}

static void select_frame(GameContext *ctx) {
    if (!ctx->rules->attract_flicker) {
        return;
    }
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        output_flicker(ctx->output, i, ctx->round.bank_colors[i], ctx->now);
    }
}

static StateId select_press(GameContext *ctx, uint8_t bank) {
    ctx->round.target = ctx->round.bank_colors[bank];
    log_message(LOG_INFO, "target picked on bank %u", (unsigned)bank);
    hardware_delay(SELECT_PAUSE_MS);
    return HUNT_MEMORIZE;
}

// ========== MEMORIZE ==========
static void memorize_enter(GameContext *ctx) {
    RoundData &round = ctx->round;

    // Distraction flash, then blackout
    play_win_chase(ctx);
    output_fill_all(ctx->output, BLACK);
    hardware_delay(BLACKOUT_MS);

    // Same colours, new places
    shuffled_palette(round.bank_colors);
    round.target_index = color_index_of(round.bank_colors, NUM_BANKS, round.target);
    if (round.target_index < 0) {
        // No bank can be right; every guess fails and the pattern is redrawn
        log_message(LOG_CRITICAL, "target colour missing after shuffle");
    }

    output_show_colors(ctx->output, round.bank_colors);
    hardware_delay(MEMORIZE_MS);
    output_fill_all(ctx->output, BLACK);
}

static StateId memorize_tick(GameContext *ctx) {
    (void)ctx;
    return HUNT_GUESS;
}

// ========== WAITING FOR GUESS ==========
static StateId guess_press(GameContext *ctx, uint8_t bank) {
    if ((int8_t)bank == ctx->round.target_index) {
        return HUNT_WIN;
    }
    ctx->round.last_press = (int8_t)bank;
    return HUNT_FAIL;
}

// ========== FAIL ==========
static void fail_enter(GameContext *ctx) {
    log_message(LOG_INFO, "wrong bank %d, target was %d",
                ctx->round.last_press, ctx->round.target_index);
    if (ctx->rules->miss_plays_fail_sound) {
        sound_fire(SOUND_FAIL);
    }

    if (is_bank(ctx->round.last_press)) {
        output_fill(ctx->output, (uint8_t)ctx->round.last_press, RED_FLASH);
    }
    hardware_delay(WRONG_SHOW_MS);
    output_fill_all(ctx->output, BLACK);
}

static StateId fail_tick(GameContext *ctx) {
    if (ctx->rules->retry_policy == RETRY_RESTART_ROUND) {
        return HUNT_SELECT;
    }
    return HUNT_MEMORIZE;  // Same target, new pattern
}

// ========== WIN ==========
static void win_enter(GameContext *ctx) {
    log_message(LOG_INFO, "found it");
    sound_fire(SOUND_WIN);
    output_blink_all(ctx->output, ctx->round.target, WIN_BLINKS, WIN_BLINK_MS, WIN_BLINK_MS);
    hardware_delay(WIN_PAUSE_MS);
}

static StateId win_tick(GameContext *ctx) {
    (void)ctx;
    return HUNT_SELECT;
}
