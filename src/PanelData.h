#pragma once

#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>

// Values published by the pollers. Strings keep the API's own formatting;
// "-" means the field was absent.

struct WeatherNow {
    std::string tempC = "-";
    std::string text = "-";
    std::string icon = "-";
    std::string obsTime = "-";
    std::string updateTime = "-";
};

struct DailyForecast {
    std::string date = "-";
    std::string textDay = "-";
    std::string tempMax = "-";
    std::string tempMin = "-";
    std::string iconDay = "-";
};

struct WeatherReport {
    std::string locationId;
    std::string locationName = "-";
    WeatherNow now;
    std::vector<DailyForecast> daily;
};

struct GeoLocation {
    std::string id;
    std::string name;
    time_t resolvedAt = 0;
};

struct LunarInfo {
    std::string solar = "-";
    std::string lunar = "-";
    std::string week = "-";
    std::string ganzhiYear = "-";
    std::string ganzhiMonth = "-";
    std::string ganzhiDay = "-";
    std::string constellation = "-";
    std::string yi = "-";
    std::string ji = "-";
};

struct NetworkStatus {
    bool online = false;
    std::string ip = "-";
    int8_t rssi = -127;
};
