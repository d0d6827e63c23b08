#include "lightbank/game_loop.h"
#include "lightbank/config.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"
#include "lightbank/sound_trigger.h"

void game_loop_init(GameLoop *loop, const GameDefinition *game) {
    uint32_t now = hardware_millis();

    loop->fault_count = 0;
    sound_init();
    input_init(&loop->input, now);
    output_init(&loop->output);
    output_fill_all(&loop->output, BLACK);
    machine_init(&loop->machine, game, &loop->input, &loop->output, now);
}

static void recover_from_fault(GameLoop *loop) {
    loop->fault_count++;
    log_message(LOG_CRITICAL, "tick fault #%u in %s, restarting %s",
                (unsigned)loop->fault_count, machine_state_name(&loop->machine),
                loop->machine.game->name);

    hardware_delay(FAULT_RECOVERY_MS);
    machine_reset(&loop->machine, hardware_millis());
}

StepStatus game_loop_tick(GameLoop *loop) {
    uint32_t now = hardware_millis();

    machine_run_frame(&loop->machine, now);

    ButtonEvent event = input_poll(&loop->input, now);
    if (event.type != EVENT_NONE) {
        if (machine_step(&loop->machine, &event, now) == STEP_FAULT) {
            recover_from_fault(loop);
            return STEP_FAULT;
        }
    }

    ButtonEvent tick = {EVENT_TICK, -1};
    if (machine_step(&loop->machine, &tick, hardware_millis()) == STEP_FAULT) {
        recover_from_fault(loop);
        return STEP_FAULT;
    }

    return STEP_OK;
}
