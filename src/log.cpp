#include "lightbank/log.h"
#include "lightbank/config.h"
#include "lightbank/hardware.h"
#include <stdarg.h>
#include <stdio.h>

const char *log_level_name(LogLevel level) {
    switch (level) {
        case LOG_INFO:     return "INFO";
        case LOG_WARN:     return "WARN";
        case LOG_CRITICAL: return "CRIT";
    }
    return "????";
}

void log_message(LogLevel level, const char *format, ...) {
    char line[LOG_LINE_MAX];

    int used = snprintf(line, sizeof(line), "[%7lu] %-4s ",
                        (unsigned long)hardware_millis(), log_level_name(level));
    if (used < 0) {
        return;
    }
    if ((size_t)used >= sizeof(line)) {
        used = sizeof(line) - 1;
    }

    va_list args;
    va_start(args, format);
    vsnprintf(line + used, sizeof(line) - used, format, args);
    va_end(args);

    console_write(line);
}
