#ifndef LIGHTBANK_SEQUENCE_PLAN_H
#define LIGHTBANK_SEQUENCE_PLAN_H

#include <stdint.h>
#include "lightbank/config.h"
#include "lightbank/hardware.h"

// Every bank exactly once, in the order the player must press them.
// cursor == NUM_BANKS means the round is complete.
struct SequencePlan {
    uint8_t order[NUM_BANKS];
    uint8_t cursor;
};

// In-place Fisher-Yates. Every permutation is equally likely and fixed
// points are allowed (no filtering).
template <typename T>
void shuffle_items(T *items, uint8_t count) {
    for (uint8_t i = count; i > 1; i--) {
        uint8_t j = (uint8_t)random_below(i);
        T tmp = items[i - 1];
        items[i - 1] = items[j];
        items[j] = tmp;
    }
}

// Fresh shuffled order, cursor at 0
void sequence_generate(SequencePlan *plan);

bool sequence_complete(const SequencePlan *plan);

// Bank expected next, or -1 once complete
int8_t sequence_expected(const SequencePlan *plan);

// Advance if `bank` is the expected one. The cursor never moves on a miss.
bool sequence_accept(SequencePlan *plan, uint8_t bank);

#endif // LIGHTBANK_SEQUENCE_PLAN_H
