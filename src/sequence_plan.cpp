#include "lightbank/sequence_plan.h"

void sequence_generate(SequencePlan *plan) {
    for (uint8_t i = 0; i < NUM_BANKS; i++) {
        plan->order[i] = i;
    }
    shuffle_items(plan->order, NUM_BANKS);
    plan->cursor = 0;
}

bool sequence_complete(const SequencePlan *plan) {
    return plan->cursor >= NUM_BANKS;
}

int8_t sequence_expected(const SequencePlan *plan) {
    if (sequence_complete(plan)) {
        return -1;
    }
    return (int8_t)plan->order[plan->cursor];
}

bool sequence_accept(SequencePlan *plan, uint8_t bank) {
    if (bank >= NUM_BANKS || sequence_expected(plan) != (int8_t)bank) {
        return false;
    }
    plan->cursor++;
    return true;
}
