#include "lightbank/sound_trigger.h"
#include "lightbank/config.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"

static const char *const CUE_NAMES[SOUND_CUE_COUNT] = {
    "start", "fail", "success", "win"
};

void sound_init(void) {
    for (uint8_t cue = 0; cue < SOUND_CUE_COUNT; cue++) {
        sound_line_write((SoundCue)cue, true);
    }
}

void sound_fire(SoundCue cue) {
    if (cue >= SOUND_CUE_COUNT) {
        return;
    }

    log_message(LOG_INFO, "sound: %s", CUE_NAMES[cue]);
    sound_line_write(cue, false);
    hardware_delay(SOUND_PULSE_MS);
    sound_line_write(cue, true);
}

const char *sound_cue_name(SoundCue cue) {
    if (cue >= SOUND_CUE_COUNT) {
        return "?";
    }
    return CUE_NAMES[cue];
}
