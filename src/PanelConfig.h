#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "CachedValue.h"
#include "DiskCache.h"
#include "NetworkReachability.h"
#include "TextClient.h"
#include "TextServices.h"
#include "WeatherClient.h"
#include "WeatherService.h"

// Everything /settings.json can set. Defaults are usable as-is except for the
// API keys and the weather host.
struct PanelConfig {
    struct Wifi {
        std::string ssid;
        std::string password;
        uint32_t connectTimeoutSeconds = 20;
    } wifi;

    struct Network {
        std::string connectTestHost = "223.5.5.5";
        uint16_t connectTestPort = 53;
        uint32_t connectTimeoutMs = 1500;
        uint32_t refreshSeconds = 10;
    } network;

    struct QWeather {
        std::string host = "YOUR_HOST.re.qweatherapi.com";
        std::string apiKey;
        uint32_t timeoutSeconds = 8;
        std::string lang = "zh";
        std::string unit = "m";
        uint32_t refreshSeconds = 600;
        std::string locationId;
        std::string locationText = "Beijing";
        std::string range = "cn";
        int number = 1;
    } qweather;

    struct Shwg {
        std::string apiKey;
        int quoteType = 5;
        uint32_t quoteRefreshSeconds = 600;
        int quotePriority = 20;
        uint32_t lunarRefreshSeconds = 6 * 3600;
        uint32_t timeoutSeconds = 4;
    } shwg;

    struct Retry {
        uint32_t backoffFloorSeconds = 5;
        uint32_t backoffCeilingSeconds = 300;
    } retry;

    struct Time {
        std::string ntpServer = "pool.ntp.org";
        std::string tz = "CST-8";
        uint32_t refreshSeconds = 3600;
    } time;

    struct Paths {
        std::string stateDir = "/state";
        CacheFileNames files;
    } paths;

    struct Display {
        uint8_t brightness = 80;   // percent
        uint32_t pageCycleSeconds = 8;
        std::vector<std::string> pages{"clock", "weather", "status", "quotes"};
    } display;

    struct Ui {
        int tickerHeight = 24;
        float tickerSpeedPxPerS = 40.0f;
        std::string tickerFallback = "TIP: set qweather.api_key and shwg.api_key in /settings.json";
    } ui;

    struct Reminders {
        std::vector<std::string> times;   // "HH:MM", local time
        std::string text = "Fish reminder: stand up and move for 3 minutes";
    } reminders;

    // ---- derived settings for the components ----
    RetryPolicy policyFor(uint32_t refreshSeconds) const;

    ReachabilityConfig reachability() const;
    WeatherClientConfig weatherClient() const;
    WeatherServiceConfig weatherService() const;
    TextClientConfig textClient() const;
    QuoteServiceConfig quoteService() const;
};

// Largest "*_seconds" value accepted; anything above is clamped so the
// millisecond form still fits a uint32_t.
static constexpr uint32_t MAX_CONFIG_SECONDS = UINT32_MAX / 1000;

// Saturating seconds -> milliseconds.
uint32_t seconds_to_ms(uint32_t seconds);

// Fills cfg from settings JSON. Keys that are absent keep their defaults;
// values of the wrong type are ignored. Returns false (cfg untouched apart
// from defaults already in it) when the text is not a JSON object.
bool parsePanelConfig(const std::string& text, PanelConfig& cfg, std::string* err = nullptr);

// Defaults as a settings document, written on first boot.
std::string defaultSettingsJson();
