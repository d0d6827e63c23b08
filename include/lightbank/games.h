#ifndef LIGHTBANK_GAMES_H
#define LIGHTBANK_GAMES_H

#include <stdint.h>
#include "lightbank/game_machine.h"

// Build with -DLIGHTBANK_GAME=<id> to pick the cabinet's game
enum GameId {
    GAME_MATCH,
    GAME_LANDSLIDE,
    GAME_CATCH_THE_COLOR,
    GAME_COLOR_FILL,
    GAME_COLOR_HUNT,
    GAME_COLOR_HUNT_FIRE,
    GAME_SEQUENCE,
    GAME_SEQUENCE_STRICT,
    GAME_COUNT
};

// ========== State ids, one enum per state table ==========

// Match / Landslide: press a bank to shift it toward bank 0's colour
enum ConvergeState {
    CONVERGE_SETUP,
    CONVERGE_PLAY,
    CONVERGE_WIN,
    CONVERGE_STATE_COUNT
};

// CatchTheColor: hit the bank while it blinks
enum CatchState {
    CATCH_SETUP,
    CATCH_SHUFFLE,
    CATCH_HIGHLIGHT,
    CATCH_WIN,
    CATCH_STATE_COUNT
};

// ColorFill: pick a colour, then light every bank with it
enum FillState {
    FILL_SELECT,
    FILL_GAME,
    FILL_WIN,
    FILL_STATE_COUNT
};

// ColorHunt: pick a colour, memorise where it moved, find it in the dark
enum HuntState {
    HUNT_SELECT,
    HUNT_MEMORIZE,
    HUNT_GUESS,
    HUNT_FAIL,
    HUNT_WIN,
    HUNT_STATE_COUNT
};

// Sequence: repeat the shown order
enum SequenceState {
    SEQUENCE_SETUP,
    SEQUENCE_SHOW,
    SEQUENCE_PLAYER_TURN,
    SEQUENCE_FAIL,
    SEQUENCE_WIN,
    SEQUENCE_STATE_COUNT
};

extern const GameDefinition MATCH_GAME;
extern const GameDefinition LANDSLIDE_GAME;
extern const GameDefinition CATCH_THE_COLOR_GAME;
extern const GameDefinition COLOR_FILL_GAME;
extern const GameDefinition COLOR_HUNT_GAME;
extern const GameDefinition COLOR_HUNT_FIRE_GAME;
extern const GameDefinition SEQUENCE_GAME;
extern const GameDefinition SEQUENCE_STRICT_GAME;

// NULL for an unknown id
const GameDefinition *game_by_id(uint8_t id);

// ========== Helpers shared by the games ==========

// Independent random palette pick per bank (repeats allowed)
void random_bank_colors(Color *colors);

// The palette in a fresh random order, one colour per bank
void shuffled_palette(Color *colors);

// Win chase with the game's configured parameters
void play_win_chase(GameContext *ctx);

bool is_bank(int8_t index);

#endif // LIGHTBANK_GAMES_H
