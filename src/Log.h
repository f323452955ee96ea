#pragma once

#include <stdint.h>

// Every component logs "[Tag] message" lines through one sink.
// The firmware routes them to Serial; the default sink is stdout.
using LogSink = void (*)(const char* line);

void log_set_sink(LogSink sink);

void panel_log(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;
