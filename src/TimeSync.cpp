#include "TimeSync.h"

#include "Log.h"

static constexpr const char* TAG = "TimeSync";

TimeSyncService::TimeSyncService(TimeSource& source, RetryPolicy policy, PollerClock& clock, StopSignal& stop)
: source_(source),
  poller_("time", [this]() { return syncOnce(); }, policy, clock, stop)
{
}

FetchResult<time_t> TimeSyncService::syncOnce()
{
    FetchResult<time_t> r = source_.syncNow();
    if (!r.ok()) return r;

    if (r.value < TIME_VALID_AFTER) {
        return FetchResult<time_t>::failure(FetchError::Protocol,
                                            "implausible time " + std::to_string((long)r.value));
    }

    char buf[32];
    const time_t t = r.value;
    struct tm lt;
    localtime_r(&t, &lt);
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt);
    panel_log(TAG, "clock set to %s", buf);
    return r;
}
