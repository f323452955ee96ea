#pragma once

#include <stdint.h>
#include <time.h>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "PanelData.h"
#include "StateStore.h"

struct CacheFileNames {
    std::string geo = "geo_cache.json";
    std::string weatherNow = "weather_now.json";
    std::string forecast = "forecast_cache.json";
    std::string lunar = "lunar_cache.json";
};

// JSON records that let the panel show the last good data right after boot.
// Anything loaded from here is only ever published as stale.
//
// Loads: a missing or corrupt file is a plain miss (false).
// Saves: never fatal; failures are logged and counted for the status page.
class DiskCache {
public:
    DiskCache(StateStore& store, CacheFileNames names = CacheFileNames());

    bool loadGeo(GeoLocation& out);
    bool saveGeo(const GeoLocation& geo);

    // weather_now.json: current conditions plus location and last_ok_ts.
    bool loadWeatherNow(WeatherReport& out, time_t& lastOk);
    bool saveWeatherNow(const WeatherReport& report, time_t lastOk);

    // forecast_cache.json: only fills report.daily (and the location when the
    // report has none yet).
    bool loadForecast(WeatherReport& out);
    bool saveForecast(const WeatherReport& report);

    bool loadLunar(LunarInfo& out, time_t& lastOk);
    bool saveLunar(const LunarInfo& info, time_t lastOk);

    uint32_t writeFailures() const { return writeFailures_.load(); }
    std::string lastError() const;

private:
    bool readDoc_(const std::string& name, std::string& text);
    bool write_(const std::string& name, const std::string& text);
    void noteFailure_(const std::string& name, const char* why);

    StateStore& store_;
    const CacheFileNames names_;

    std::atomic<uint32_t> writeFailures_{0};
    mutable std::mutex errMutex_;
    std::string lastError_;
};
