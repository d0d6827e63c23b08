#ifndef LIGHTBANK_INPUT_SAMPLER_H
#define LIGHTBANK_INPUT_SAMPLER_H

#include <stdint.h>
#include "lightbank/config.h"

enum EventType {
    EVENT_NONE,
    EVENT_TICK,
    EVENT_PRESSED,
    EVENT_LOCKED_PRESS
};

struct ButtonEvent {
    EventType type;
    int8_t index;   // -1 for EVENT_NONE / EVENT_TICK
};

struct ButtonState {
    bool was_pressed;           // raw level seen on the previous poll
    bool ever_accepted;
    uint32_t last_accept_ms;
    bool lockout_active;
    uint32_t lockout_end_ms;
};

struct InputSampler {
    ButtonState buttons[NUM_BANKS];
};

// Clear all history and sync edge state to the current raw levels
void input_init(InputSampler *input, uint32_t now);

// Scan every button once. Returns at most one event: the lowest-index
// accepted press. Other presses accepted in the same scan are dropped.
ButtonEvent input_poll(InputSampler *input, uint32_t now);

// Forget pending edges (e.g. a button held through a blocking animation).
// Debounce timestamps and lockouts are kept.
void input_resync(InputSampler *input);

// Arm or extend a lockout on one button
void input_set_lockout(InputSampler *input, uint8_t index, uint32_t now, uint32_t duration_ms);
void input_clear_lockout(InputSampler *input, uint8_t index);
bool input_is_locked(const InputSampler *input, uint8_t index, uint32_t now);

// Disarm and return the lowest button whose lockout has run out, or -1
int8_t input_take_expired_lockout(InputSampler *input, uint32_t now);

#endif // LIGHTBANK_INPUT_SAMPLER_H
