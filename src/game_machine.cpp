#include "lightbank/game_machine.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/timing.h"
#include <string.h>

static const StateHandler *current_handler(const GameMachine *machine) {
    return &machine->game->states[machine->current];
}

static void clear_round(RoundData *round) {
    memset(round, 0, sizeof(*round));
    round->target_index = -1;
}

static void enter_current(GameMachine *machine) {
    uint32_t now = hardware_millis();
    machine->ctx.now = now;
    machine->ctx.state_entry_ms = now;

    const StateHandler *handler = current_handler(machine);
    if (handler->enter != NULL) {
        handler->enter(&machine->ctx);
    }

    // Enter handlers may block; drop anything pressed meanwhile
    input_resync(machine->ctx.input);
    machine->last_frame_ms = hardware_millis();
}

void machine_init(GameMachine *machine, const GameDefinition *game,
                  InputSampler *input, OutputBank *output, uint32_t now) {
    machine->game = game;
    machine->ctx.input = input;
    machine->ctx.output = output;
    machine->ctx.rules = game->rules;
    machine->ctx.now = now;
    clear_round(&machine->ctx.round);

    machine->current = game->initial_state;
    log_message(LOG_INFO, "game: %s", game->name);
    enter_current(machine);
}

void machine_reset(GameMachine *machine, uint32_t now) {
    clear_round(&machine->ctx.round);
    input_init(machine->ctx.input, now);
    machine->current = machine->game->initial_state;
    enter_current(machine);
}

StepStatus machine_transition_to(GameMachine *machine, StateId next) {
    if (next >= machine->game->state_count) {
        log_message(LOG_CRITICAL, "invalid transition %s -> %u",
                    machine_state_name(machine), (unsigned)next);
        return STEP_FAULT;
    }

    log_message(LOG_INFO, "state: %s -> %s", machine_state_name(machine),
                machine->game->states[next].name);

    // Call current state's exit function
    const StateHandler *handler = current_handler(machine);
    if (handler->exit != NULL) {
        handler->exit(&machine->ctx);
    }

    machine->current = next;
    enter_current(machine);
    return STEP_OK;
}

StepStatus machine_step(GameMachine *machine, const ButtonEvent *event, uint32_t now) {
    const StateHandler *handler = current_handler(machine);
    machine->ctx.now = now;

    StateId next = STATE_STAY;
    switch (event->type) {
        case EVENT_TICK:
            if (handler->on_tick != NULL) {
                next = handler->on_tick(&machine->ctx);
            }
            break;
        case EVENT_PRESSED:
            if (handler->on_press != NULL && event->index >= 0) {
                next = handler->on_press(&machine->ctx, (uint8_t)event->index);
            }
            break;
        case EVENT_LOCKED_PRESS:
            if (handler->on_locked_press != NULL && event->index >= 0) {
                next = handler->on_locked_press(&machine->ctx, (uint8_t)event->index);
            }
            break;
        case EVENT_NONE:
        default:
            break;
    }

    if (next == STATE_STAY) {
        return STEP_OK;
    }
    if (next == STATE_FAULT) {
        log_message(LOG_CRITICAL, "fault reported in %s", machine_state_name(machine));
        return STEP_FAULT;
    }
    return machine_transition_to(machine, next);
}

void machine_run_frame(GameMachine *machine, uint32_t now) {
    const StateHandler *handler = current_handler(machine);
    if (handler->frame == NULL) {
        return;
    }

    if (time_elapsed(now, machine->last_frame_ms) >= handler->frame_interval_ms) {
        machine->last_frame_ms = now;
        machine->ctx.now = now;
        handler->frame(&machine->ctx);
    }
}

StateId machine_state(const GameMachine *machine) {
    return machine->current;
}

const char *machine_state_name(const GameMachine *machine) {
    return current_handler(machine)->name;
}
