#include "TextServices.h"

#include <utility>

#include "Log.h"

static constexpr const char* TAG = "QuoteService";

// ---- quotes ----

QuoteService::QuoteService(TextClient& client,
                           MessageQueue& queue,
                           QuoteServiceConfig cfg,
                           PollerClock& clock,
                           StopSignal& stop)
: client_(client),
  queue_(queue),
  cfg_(std::move(cfg)),
  poller_("quote", [this]() { return fetchOnce(); }, cfg_.policy, clock, stop)
{
}

FetchResult<std::string> QuoteService::fetchOnce()
{
    FetchResult<std::string> r = client_.fetchShortText(cfg_.quoteType);
    if (!r.ok()) return r;

    if (!lastPushed_.empty()) queue_.remove(lastPushed_);
    queue_.push(r.value, cfg_.policy.refreshMs, cfg_.priority);
    lastPushed_ = r.value;

    panel_log(TAG, "queued quote (%u bytes, priority %d)", (unsigned)r.value.size(), cfg_.priority);
    return r;
}

// ---- lunar ----

LunarService::LunarService(TextClient& client,
                           DiskCache& cache,
                           RetryPolicy policy,
                           PollerClock& clock,
                           StopSignal& stop)
: client_(client),
  cache_(cache),
  clock_(clock),
  poller_("lunar",
          [this]() { return client_.fetchLunar(); },
          policy,
          clock,
          stop,
          [this](const LunarInfo& info) { return cache_.saveLunar(info, clock_.epochNow()); },
          [this](LunarInfo& info, time_t& savedAt) { return cache_.loadLunar(info, savedAt); })
{
}
