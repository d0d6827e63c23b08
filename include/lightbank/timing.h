#ifndef LIGHTBANK_TIMING_H
#define LIGHTBANK_TIMING_H

#include <stdint.h>

// millis() wraps every ~49.7 days. Unsigned subtraction gives the right
// answer across the wrap, so every duration check goes through these.

// Milliseconds elapsed from `since` to `now`
inline uint32_t time_elapsed(uint32_t now, uint32_t since) {
    return (uint32_t)(now - since);
}

// True once `now` is at or past `deadline` (deadline less than 2^31 ms away)
inline bool time_reached(uint32_t now, uint32_t deadline) {
    return (int32_t)(now - deadline) >= 0;
}

#endif // LIGHTBANK_TIMING_H
