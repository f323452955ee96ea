#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "FetchResult.h"
#include "HttpTransport.h"
#include "PanelData.h"

struct WeatherClientConfig {
    std::string host;        // console API host, no scheme
    std::string apiKey;      // sent as X-QW-Api-Key
    uint32_t timeoutMs = 8000;
    std::string lang = "zh";
    std::string unit = "m";
    std::string range = "cn";
    int number = 1;
};

struct WeatherFetch {
    WeatherNow now;
    bool hasForecast = false;
    std::vector<DailyForecast> daily;
};

// QWeather endpoints: city lookup, current conditions, 7-day forecast.
// Every failure comes back as a FetchResult error, never as a crash.
class WeatherClient {
public:
    WeatherClient(HttpTransport& http, WeatherClientConfig cfg);

    FetchResult<GeoLocation> resolveLocation(const std::string& query);

    // Current conditions are required; a failed forecast call only clears
    // hasForecast.
    FetchResult<WeatherFetch> fetchWeather(const std::string& locationId);

private:
    FetchResult<std::string> get_(const char* path, const std::string& query);
    FetchResult<WeatherNow> fetchNow_(const std::string& locationId);
    FetchResult<std::vector<DailyForecast>> fetchDaily_(const std::string& locationId);

    HttpTransport& http_;
    const WeatherClientConfig cfg_;
};
