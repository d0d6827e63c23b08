#include <Arduino.h>
#include <avr/wdt.h>
#include "lightbank/config.h"
#include "lightbank/game_loop.h"
#include "lightbank/games.h"
#include "lightbank/hardware.h"
#include "lightbank/log.h"

static GameLoop game_loop;

void setup() {
    hardware_init();

    const GameDefinition *game = game_by_id(ACTIVE_GAME_ID);
    if (game == NULL) {
        log_message(LOG_CRITICAL, "unknown game id %u, using %s",
                    (unsigned)ACTIVE_GAME_ID, COLOR_FILL_GAME.name);
        game = &COLOR_FILL_GAME;
    }

    // Enable watchdog timer (4 second timeout). Every blocking wait goes
    // through hardware_delay(), which keeps it fed.
    wdt_enable(WDTO_4S);

    game_loop_init(&game_loop, game);
}

void loop() {
    game_loop_tick(&game_loop);
    hardware_delay(LOOP_IDLE_MS);
}
