#pragma once

#include <string>

#include "CachedValue.h"
#include "DiskCache.h"
#include "MessageQueue.h"
#include "PanelData.h"
#include "Poller.h"
#include "TextClient.h"

struct QuoteServiceConfig {
    int quoteType = 5;
    int priority = 20;
    RetryPolicy policy;
};

// Quote poller. Every new quote goes onto the ticker queue with a TTL of one
// refresh interval, replacing the previous quote item. Quotes are not
// persisted.
class QuoteService {
public:
    QuoteService(TextClient& client,
                 MessageQueue& queue,
                 QuoteServiceConfig cfg,
                 PollerClock& clock,
                 StopSignal& stop);

    void run() { poller_.run(); }
    CachedValue<std::string> snapshot() const { return poller_.snapshot(); }
    Poller<std::string>& poller() { return poller_; }

    FetchResult<std::string> fetchOnce();

private:
    TextClient& client_;
    MessageQueue& queue_;
    const QuoteServiceConfig cfg_;

    std::string lastPushed_;

    Poller<std::string> poller_;
};

// Lunar calendar poller, persisted to lunar_cache.json so the clock page has a
// lunar line straight after boot.
class LunarService {
public:
    LunarService(TextClient& client,
                 DiskCache& cache,
                 RetryPolicy policy,
                 PollerClock& clock,
                 StopSignal& stop);

    void run() { poller_.run(); }
    CachedValue<LunarInfo> snapshot() const { return poller_.snapshot(); }
    Poller<LunarInfo>& poller() { return poller_; }

private:
    TextClient& client_;
    DiskCache& cache_;
    PollerClock& clock_;

    Poller<LunarInfo> poller_;
};
