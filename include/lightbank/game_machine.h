#ifndef LIGHTBANK_GAME_MACHINE_H
#define LIGHTBANK_GAME_MACHINE_H

#include <stddef.h>
#include <stdint.h>
#include "lightbank/config.h"
#include "lightbank/color.h"
#include "lightbank/input_sampler.h"
#include "lightbank/output_bank.h"
#include "lightbank/sequence_plan.h"

typedef uint8_t StateId;

// Handler results that are not state ids
const StateId STATE_STAY = 0xFF;    // no transition
const StateId STATE_FAULT = 0xFE;   // unrecoverable, let the loop restart the game

// What happens to the round after a wrong answer
enum RetryPolicy {
    RETRY_KEEP_ROUND,      // same target / cursor, show it again
    RETRY_RESTART_ROUND    // discard and go back to setup
};

// Per-game knobs. The handlers are shared between games, the rules differ.
struct GameRules {
    uint8_t shift_step;            // colour step per press (convergence games)
    uint16_t press_lockout_ms;     // 0 disables lockouts
    uint16_t penalty_lockout_ms;
    bool miss_plays_fail_sound;
    uint16_t blink_ms;             // on and off time of feedback blinks
    RetryPolicy retry_policy;
    bool attract_flicker;
    uint8_t chase_cycles;
    uint8_t chase_speed;
    uint16_t chase_step_ms;
    ChaseMapping chase_mapping;
};

// Everything a round needs. Reset by each game's setup state.
struct RoundData {
    Color bank_colors[NUM_BANKS];  // logical colour per bank
    Color target;
    int8_t target_index;           // -1 = no bank matches
    int8_t last_press;             // bank of the last wrong answer
    bool filled[NUM_BANKS];
    SequencePlan plan;
    uint8_t step;                  // progress through a multi-tick phase
    uint32_t step_ms;              // when `step` last advanced
};

// What state handlers act on
struct GameContext {
    InputSampler *input;
    OutputBank *output;
    const GameRules *rules;
    RoundData round;
    uint32_t now;                  // time of the event being handled
    uint32_t state_entry_ms;
};

typedef void (*StateHook)(GameContext *ctx);
typedef StateId (*TickHandler)(GameContext *ctx);
typedef StateId (*PressHandler)(GameContext *ctx, uint8_t bank);

// One row of a game's transition table. A NULL handler means the event is
// ignored in that state.
struct StateHandler {
    const char *name;
    StateHook enter;              // once, on entry (may block for scripted cues)
    TickHandler on_tick;          // every loop iteration
    PressHandler on_press;        // debounced press
    PressHandler on_locked_press; // press during a lockout
    StateHook frame;              // time-gated animation frame, runs before polling
    uint16_t frame_interval_ms;
    StateHook exit;               // once, on exit
};

struct GameDefinition {
    const char *name;
    const StateHandler *states;
    uint8_t state_count;
    StateId initial_state;
    const GameRules *rules;
};

struct GameMachine {
    const GameDefinition *game;
    StateId current;
    GameContext ctx;
    uint32_t last_frame_ms;
};

enum StepStatus {
    STEP_OK,
    STEP_FAULT
};

// Bind the machine to a game and enter its initial state
void machine_init(GameMachine *machine, const GameDefinition *game,
                  InputSampler *input, OutputBank *output, uint32_t now);

// Abandon the current state and re-enter the initial one (fault recovery)
void machine_reset(GameMachine *machine, uint32_t now);

// Deliver one event (button event or EVENT_TICK) to the current state
StepStatus machine_step(GameMachine *machine, const ButtonEvent *event, uint32_t now);

// Centralised transition: exit -> switch -> enter -> input resync
StepStatus machine_transition_to(GameMachine *machine, StateId next);

// Run the current state's frame effect if its interval has elapsed
void machine_run_frame(GameMachine *machine, uint32_t now);

StateId machine_state(const GameMachine *machine);
const char *machine_state_name(const GameMachine *machine);

#endif // LIGHTBANK_GAME_MACHINE_H
