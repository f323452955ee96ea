#pragma once

#include <string>
#include <vector>

#include "CachedValue.h"
#include "DiskCache.h"
#include "PanelData.h"
#include "Poller.h"
#include "WeatherClient.h"

struct WeatherServiceConfig {
    std::string locationId;     // pinned id, skips the lookup entirely
    std::string locationText;   // lookup query ("Beijing", "101010100")
    RetryPolicy policy;
};

// Weather poller plus the location it depends on.
//
// Location order: configured id, then geo_cache.json, then a live lookup
// (saved back to geo_cache.json). A lookup failure is an ordinary fetch
// failure and goes through the normal backoff.
//
// When the 7-day call fails the last good forecast is carried over.
class WeatherService {
public:
    WeatherService(WeatherClient& client,
                   DiskCache& cache,
                   WeatherServiceConfig cfg,
                   PollerClock& clock,
                   StopSignal& stop);

    // Blocks until stop; run it on its own task.
    void run() { poller_.run(); }

    CachedValue<WeatherReport> snapshot() const { return poller_.snapshot(); }

    Poller<WeatherReport>& poller() { return poller_; }

    // One fetch cycle without the loop around it.
    FetchResult<WeatherReport> fetchOnce();

private:
    FetchResult<GeoLocation> location_();
    bool persist_(const WeatherReport& report);
    bool preload_(WeatherReport& report, time_t& savedAt);

    WeatherClient& client_;
    DiskCache& cache_;
    const WeatherServiceConfig cfg_;
    PollerClock& clock_;

    // Touched only from the poller task.
    GeoLocation geo_;
    std::vector<DailyForecast> lastDaily_;

    Poller<WeatherReport> poller_;
};
