#pragma once

#include <stdint.h>
#include <time.h>
#include <string>

// Latest known result of a poller.
//  - ok stays false until the first success (disk preload counts).
//  - once ok, it stays ok; failures only flip stale and set error.
template <typename T>
struct CachedValue {
    T value{};
    bool ok = false;
    bool stale = true;
    time_t lastSuccessTime = 0;   // wall clock, 0 = never
    std::string error;
};

struct RetryPolicy {
    uint32_t refreshMs = 600000;
    uint32_t backoffFloorMs = 5000;
    uint32_t backoffCeilingMs = 300000;
};

// Owned by one poller loop, never shared.
struct RetryState {
    uint32_t backoffMs = 0;
    uint32_t consecutiveFailures = 0;

    void reset(const RetryPolicy& p)
    {
        backoffMs = p.backoffFloorMs;
        consecutiveFailures = 0;
    }

    // Returns the delay to wait now, then advances to the next one.
    uint32_t takeBackoff(const RetryPolicy& p)
    {
        const uint32_t wait = backoffMs;
        ++consecutiveFailures;
        uint64_t next = (uint64_t)backoffMs * 2;
        if (next > p.backoffCeilingMs) next = p.backoffCeilingMs;
        backoffMs = (uint32_t)next;
        return wait;
    }
};
