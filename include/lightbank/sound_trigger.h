#ifndef LIGHTBANK_SOUND_TRIGGER_H
#define LIGHTBANK_SOUND_TRIGGER_H

#include <stdint.h>

// One active-low trigger line per cue on the sound board
enum SoundCue {
    SOUND_START,
    SOUND_FAIL,
    SOUND_SUCCESS,
    SOUND_WIN,
    SOUND_CUE_COUNT
};

// Park every line high (idle)
void sound_init(void);

// Pulse the cue's line low for SOUND_PULSE_MS. Blocks for the pulse, so two
// cues never overlap.
void sound_fire(SoundCue cue);

const char *sound_cue_name(SoundCue cue);

#endif // LIGHTBANK_SOUND_TRIGGER_H
