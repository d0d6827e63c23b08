#include "lightbank/input_sampler.h"
#include "lightbank/hardware.h"
#include "lightbank/timing.h"

void input_init(InputSampler *input, uint32_t now) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        ButtonState &button = input->buttons[i];
        button.was_pressed = button_read_pressed(i);
        button.ever_accepted = false;
        button.last_accept_ms = now;
        button.lockout_active = false;
        button.lockout_end_ms = now;
    }
}

ButtonEvent input_poll(InputSampler *input, uint32_t now) {
    ButtonEvent event = {EVENT_NONE, -1};

    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        ButtonState &button = input->buttons[i];
        bool pressed_now = button_read_pressed(i);

        if (!pressed_now) {
            // Release resets edge detection, never an event
            button.was_pressed = false;
            continue;
        }

        if (button.was_pressed) {
            continue;  // Still held
        }

        // Rising edge. Record it either way so a bounce does not re-trigger.
        button.was_pressed = true;

        if (button.ever_accepted &&
            time_elapsed(now, button.last_accept_ms) < DEBOUNCE_MS) {
            continue;  // Bounce
        }

        button.ever_accepted = true;
        button.last_accept_ms = now;

        if (event.type != EVENT_NONE) {
            continue;  // First match wins, this press is consumed
        }

        event.index = (int8_t)i;
        event.type = input_is_locked(input, i, now) ? EVENT_LOCKED_PRESS : EVENT_PRESSED;
    }

    return event;
}

void input_resync(InputSampler *input) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        input->buttons[i].was_pressed = button_read_pressed(i);
    }
}

void input_set_lockout(InputSampler *input, uint8_t index, uint32_t now, uint32_t duration_ms) {
    if (index >= NUM_BANKS) {
        return;
    }
    input->buttons[index].lockout_active = true;
    input->buttons[index].lockout_end_ms = now + duration_ms;
}

void input_clear_lockout(InputSampler *input, uint8_t index) {
    if (index >= NUM_BANKS) {
        return;
    }
    input->buttons[index].lockout_active = false;
}

bool input_is_locked(const InputSampler *input, uint8_t index, uint32_t now) {
    if (index >= NUM_BANKS) {
        return false;
    }
    const ButtonState &button = input->buttons[index];
    return button.lockout_active && !time_reached(now, button.lockout_end_ms);
}

int8_t input_take_expired_lockout(InputSampler *input, uint32_t now) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        ButtonState &button = input->buttons[i];
        if (button.lockout_active && time_reached(now, button.lockout_end_ms)) {
            button.lockout_active = false;
            return (int8_t)i;
        }
    }
    return -1;
}
