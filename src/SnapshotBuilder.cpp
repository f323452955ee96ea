#include "SnapshotBuilder.h"

#include <stdio.h>

SnapshotBuilder::SnapshotBuilder(SnapshotSources sources, PollerClock& clock)
: src_(sources), clock_(clock) {}

static std::string fmt_float(bool ok, float v, const char* fmt)
{
    if (!ok) return "-";
    char buf[16];
    snprintf(buf, sizeof(buf), fmt, (double)v);
    return buf;
}

std::string format_uptime(uint32_t seconds)
{
    const uint32_t days = seconds / 86400;
    const uint32_t h = (seconds / 3600) % 24;
    const uint32_t m = (seconds / 60) % 60;
    const uint32_t s = seconds % 60;

    char buf[24];
    if (days > 0) {
        snprintf(buf, sizeof(buf), "%lud %02lu:%02lu",
                 (unsigned long)days, (unsigned long)h, (unsigned long)m);
    } else {
        snprintf(buf, sizeof(buf), "%02lu:%02lu:%02lu",
                 (unsigned long)h, (unsigned long)m, (unsigned long)s);
    }
    return buf;
}

Snapshot SnapshotBuilder::build() const
{
    Snapshot s;
    s.now = clock_.epochNow();

    if (src_.network) s.network = src_.network->snapshot();
    if (src_.weather) s.weather = src_.weather->snapshot();
    if (src_.lunar) s.lunar = src_.lunar->snapshot();
    if (src_.quote) s.quote = src_.quote->snapshot();
    if (src_.timeSync) s.timeSync = src_.timeSync->snapshot();

    if (src_.metrics) {
        float v = 0.0f;
        bool ok = src_.metrics->cpuTempC(v);
        s.cpuTemp = fmt_float(ok, v, "%.1f");
        ok = src_.metrics->gpuTempC(v);
        s.gpuTemp = fmt_float(ok, v, "%.1f");
        ok = src_.metrics->load1(v);
        s.load = fmt_float(ok, v, "%.2f");
        ok = src_.metrics->memPercent(v);
        s.memPercent = fmt_float(ok, v, "%.0f");
        ok = src_.metrics->diskPercent(v);
        s.diskPercent = fmt_float(ok, v, "%.0f");

        uint32_t up = 0;
        if (src_.metrics->uptimeSeconds(up)) s.uptime = format_uptime(up);
    }

    if (src_.cache) {
        s.cacheFailures = src_.cache->writeFailures();
        if (s.cacheFailures) s.cacheError = src_.cache->lastError();
    }
    return s;
}
