#ifndef LIGHTBANK_GAME_LOOP_H
#define LIGHTBANK_GAME_LOOP_H

#include <stdint.h>
#include "lightbank/game_machine.h"
#include "lightbank/input_sampler.h"
#include "lightbank/output_bank.h"

// Owns every piece of engine state for the life of the firmware
struct GameLoop {
    InputSampler input;
    OutputBank output;
    GameMachine machine;
    uint16_t fault_count;
};

// Initialise components and enter the game's initial state
void game_loop_init(GameLoop *loop, const GameDefinition *game);

// One cooperative iteration:
//   1. time-gated frame effect of the current state
//   2. poll the buttons
//   3. deliver zero or one button event
//   4. deliver the implicit tick
// A fault in any step is logged here, followed by a FAULT_RECOVERY_MS pause
// and a restart of the game. The caller sleeps LOOP_IDLE_MS between calls.
StepStatus game_loop_tick(GameLoop *loop);

#endif // LIGHTBANK_GAME_LOOP_H
