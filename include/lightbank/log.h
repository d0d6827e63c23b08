#ifndef LIGHTBANK_LOG_H
#define LIGHTBANK_LOG_H

#include <stdint.h>

enum LogLevel {
    LOG_INFO,
    LOG_WARN,
    LOG_CRITICAL
};

// printf-style console logging: "[  12345] WARN  message"
// Lines longer than LOG_LINE_MAX are truncated.
void log_message(LogLevel level, const char *format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

const char *log_level_name(LogLevel level);

#endif // LIGHTBANK_LOG_H
