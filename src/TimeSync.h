#pragma once

#include <time.h>
#include <string>

#include "CachedValue.h"
#include "FetchResult.h"
#include "Poller.h"

// Sets the system wall clock from somewhere authoritative (NTP on the board).
class TimeSource {
public:
    virtual ~TimeSource() {}

    // On success the system clock has been set and the epoch is returned.
    virtual FetchResult<time_t> syncNow() = 0;
};

// Any wall clock before this is an unset RTC, not a real time.
static constexpr time_t TIME_VALID_AFTER = 1704067200;   // 2024-01-01 UTC

// Time sync on the shared poller engine. ok=false on the snapshot means the
// clock page is showing an unsynchronised time.
class TimeSyncService {
public:
    TimeSyncService(TimeSource& source, RetryPolicy policy, PollerClock& clock, StopSignal& stop);

    void run() { poller_.run(); }
    CachedValue<time_t> snapshot() const { return poller_.snapshot(); }
    Poller<time_t>& poller() { return poller_; }

    FetchResult<time_t> syncOnce();

private:
    TimeSource& source_;
    Poller<time_t> poller_;
};
