#include "Log.h"

#include <stdarg.h>
#include <stdio.h>
#include <atomic>

static void stdout_sink(const char* line)
{
    fputs(line, stdout);
    fputc('\n', stdout);
}

static std::atomic<LogSink> g_sink{stdout_sink};

void log_set_sink(LogSink sink)
{
    g_sink.store(sink ? sink : stdout_sink);
}

void panel_log(const char* tag, const char* fmt, ...)
{
    // Long enough for a URL path plus an error string; longer lines are cut.
    char line[256];

    int n = snprintf(line, sizeof(line), "[%s] ", tag ? tag : "-");
    if (n < 0) return;
    if ((size_t)n >= sizeof(line)) n = sizeof(line) - 1;

    va_list args;
    va_start(args, fmt);
    vsnprintf(line + n, sizeof(line) - (size_t)n, fmt, args);
    va_end(args);

    g_sink.load()(line);
}
