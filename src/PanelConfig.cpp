#include "PanelConfig.h"

#include <ArduinoJson.h>
#include <utility>

static constexpr size_t SETTINGS_DOC_SIZE = 6144;

// ---- typed readers: a missing or mistyped value leaves the default ----

static void read_str(JsonVariantConst v, std::string& out)
{
    if (v.is<const char*>()) out = v.as<const char*>();
}

static void read_u32(JsonVariantConst v, uint32_t& out)
{
    if (v.is<uint32_t>()) {
        out = v.as<uint32_t>();
    } else if (v.is<double>() && v.as<double>() >= 0) {
        const double d = v.as<double>();
        out = d >= (double)UINT32_MAX ? UINT32_MAX : (uint32_t)d;
    }
}

static void read_seconds(JsonVariantConst v, uint32_t& out)
{
    read_u32(v, out);
    if (out > MAX_CONFIG_SECONDS) out = MAX_CONFIG_SECONDS;
}

static void read_u16(JsonVariantConst v, uint16_t& out)
{
    if (v.is<uint16_t>()) out = v.as<uint16_t>();
}

static void read_int(JsonVariantConst v, int& out)
{
    if (v.is<int>()) out = v.as<int>();
}

static void read_float(JsonVariantConst v, float& out)
{
    if (v.is<float>()) out = v.as<float>();
}

static void read_str_list(JsonVariantConst v, std::vector<std::string>& out)
{
    if (!v.is<JsonArrayConst>()) return;
    std::vector<std::string> items;
    for (JsonVariantConst item : v.as<JsonArrayConst>()) {
        if (item.is<const char*>()) items.push_back(item.as<const char*>());
    }
    out = std::move(items);
}

bool parsePanelConfig(const std::string& text, PanelConfig& cfg, std::string* err)
{
    DynamicJsonDocument doc(SETTINGS_DOC_SIZE);
    DeserializationError de = deserializeJson(doc, text);
    if (de) {
        if (err) *err = de.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        if (err) *err = "settings root is not an object";
        return false;
    }

    JsonVariantConst wifi = doc["wifi"];
    read_str(wifi["ssid"], cfg.wifi.ssid);
    read_str(wifi["password"], cfg.wifi.password);
    read_seconds(wifi["connect_timeout_seconds"], cfg.wifi.connectTimeoutSeconds);

    JsonVariantConst net = doc["network"];
    read_str(net["connect_test_host"], cfg.network.connectTestHost);
    read_u16(net["connect_test_port"], cfg.network.connectTestPort);
    read_u32(net["connect_timeout_ms"], cfg.network.connectTimeoutMs);
    read_seconds(net["refresh_seconds"], cfg.network.refreshSeconds);

    JsonVariantConst qw = doc["qweather"];
    read_str(qw["host"], cfg.qweather.host);
    read_str(qw["api_key"], cfg.qweather.apiKey);
    read_seconds(qw["timeout_seconds"], cfg.qweather.timeoutSeconds);
    read_str(qw["lang"], cfg.qweather.lang);
    read_str(qw["unit"], cfg.qweather.unit);
    read_seconds(qw["refresh_seconds"], cfg.qweather.refreshSeconds);
    JsonVariantConst lookup = qw["lookup"];
    read_str(lookup["location_id"], cfg.qweather.locationId);
    read_str(lookup["location_text"], cfg.qweather.locationText);
    read_str(lookup["range"], cfg.qweather.range);
    read_int(lookup["number"], cfg.qweather.number);

    JsonVariantConst sh = doc["shwg"];
    read_str(sh["api_key"], cfg.shwg.apiKey);
    read_int(sh["quote_type"], cfg.shwg.quoteType);
    read_seconds(sh["quote_refresh_seconds"], cfg.shwg.quoteRefreshSeconds);
    read_int(sh["quote_priority"], cfg.shwg.quotePriority);
    read_seconds(sh["lunar_refresh_seconds"], cfg.shwg.lunarRefreshSeconds);
    read_seconds(sh["timeout_seconds"], cfg.shwg.timeoutSeconds);

    JsonVariantConst retry = doc["retry"];
    read_seconds(retry["backoff_floor_seconds"], cfg.retry.backoffFloorSeconds);
    read_seconds(retry["backoff_ceiling_seconds"], cfg.retry.backoffCeilingSeconds);

    JsonVariantConst tm = doc["time"];
    read_str(tm["ntp_server"], cfg.time.ntpServer);
    read_str(tm["tz"], cfg.time.tz);
    read_seconds(tm["refresh_seconds"], cfg.time.refreshSeconds);

    JsonVariantConst paths = doc["paths"];
    read_str(paths["state_dir"], cfg.paths.stateDir);
    read_str(paths["geo_cache"], cfg.paths.files.geo);
    read_str(paths["weather_cache"], cfg.paths.files.weatherNow);
    read_str(paths["forecast_cache"], cfg.paths.files.forecast);
    read_str(paths["lunar_cache"], cfg.paths.files.lunar);

    JsonVariantConst disp = doc["display"];
    int brightness = cfg.display.brightness;
    read_int(disp["brightness"], brightness);
    if (brightness < 0) brightness = 0;
    if (brightness > 100) brightness = 100;
    cfg.display.brightness = (uint8_t)brightness;
    read_seconds(disp["page_cycle_seconds"], cfg.display.pageCycleSeconds);
    read_str_list(disp["pages"], cfg.display.pages);

    JsonVariantConst ui = doc["ui"];
    read_int(ui["ticker_height"], cfg.ui.tickerHeight);
    read_float(ui["ticker_speed_px_per_s"], cfg.ui.tickerSpeedPxPerS);
    read_str(ui["ticker_fallback"], cfg.ui.tickerFallback);

    JsonVariantConst rem = doc["reminders"];
    read_str_list(rem["times"], cfg.reminders.times);
    read_str(rem["text"], cfg.reminders.text);

    // a zero refresh would spin the poller
    if (cfg.qweather.refreshSeconds == 0) cfg.qweather.refreshSeconds = 1;
    if (cfg.shwg.quoteRefreshSeconds == 0) cfg.shwg.quoteRefreshSeconds = 1;
    if (cfg.shwg.lunarRefreshSeconds == 0) cfg.shwg.lunarRefreshSeconds = 1;
    if (cfg.time.refreshSeconds == 0) cfg.time.refreshSeconds = 1;
    if (cfg.network.refreshSeconds == 0) cfg.network.refreshSeconds = 1;
    if (cfg.retry.backoffFloorSeconds == 0) cfg.retry.backoffFloorSeconds = 1;
    if (cfg.retry.backoffCeilingSeconds < cfg.retry.backoffFloorSeconds) {
        cfg.retry.backoffCeilingSeconds = cfg.retry.backoffFloorSeconds;
    }
    return true;
}

std::string defaultSettingsJson()
{
    const PanelConfig d;
    DynamicJsonDocument doc(SETTINGS_DOC_SIZE);

    JsonObject wifi = doc.createNestedObject("wifi");
    wifi["ssid"] = d.wifi.ssid;
    wifi["password"] = d.wifi.password;
    wifi["connect_timeout_seconds"] = d.wifi.connectTimeoutSeconds;

    JsonObject net = doc.createNestedObject("network");
    net["connect_test_host"] = d.network.connectTestHost;
    net["connect_test_port"] = d.network.connectTestPort;
    net["connect_timeout_ms"] = d.network.connectTimeoutMs;
    net["refresh_seconds"] = d.network.refreshSeconds;

    JsonObject qw = doc.createNestedObject("qweather");
    qw["host"] = d.qweather.host;
    qw["api_key"] = d.qweather.apiKey;
    qw["timeout_seconds"] = d.qweather.timeoutSeconds;
    qw["lang"] = d.qweather.lang;
    qw["unit"] = d.qweather.unit;
    qw["refresh_seconds"] = d.qweather.refreshSeconds;
    JsonObject lookup = qw.createNestedObject("lookup");
    lookup["location_id"] = d.qweather.locationId;
    lookup["location_text"] = d.qweather.locationText;
    lookup["range"] = d.qweather.range;
    lookup["number"] = d.qweather.number;

    JsonObject sh = doc.createNestedObject("shwg");
    sh["api_key"] = d.shwg.apiKey;
    sh["quote_type"] = d.shwg.quoteType;
    sh["quote_refresh_seconds"] = d.shwg.quoteRefreshSeconds;
    sh["quote_priority"] = d.shwg.quotePriority;
    sh["lunar_refresh_seconds"] = d.shwg.lunarRefreshSeconds;
    sh["timeout_seconds"] = d.shwg.timeoutSeconds;

    JsonObject retry = doc.createNestedObject("retry");
    retry["backoff_floor_seconds"] = d.retry.backoffFloorSeconds;
    retry["backoff_ceiling_seconds"] = d.retry.backoffCeilingSeconds;

    JsonObject tm = doc.createNestedObject("time");
    tm["ntp_server"] = d.time.ntpServer;
    tm["tz"] = d.time.tz;
    tm["refresh_seconds"] = d.time.refreshSeconds;

    JsonObject paths = doc.createNestedObject("paths");
    paths["state_dir"] = d.paths.stateDir;
    paths["geo_cache"] = d.paths.files.geo;
    paths["weather_cache"] = d.paths.files.weatherNow;
    paths["forecast_cache"] = d.paths.files.forecast;
    paths["lunar_cache"] = d.paths.files.lunar;

    JsonObject disp = doc.createNestedObject("display");
    disp["brightness"] = d.display.brightness;
    disp["page_cycle_seconds"] = d.display.pageCycleSeconds;
    JsonArray pages = disp.createNestedArray("pages");
    for (const std::string& p : d.display.pages) pages.add(p);

    JsonObject ui = doc.createNestedObject("ui");
    ui["ticker_height"] = d.ui.tickerHeight;
    ui["ticker_speed_px_per_s"] = d.ui.tickerSpeedPxPerS;
    ui["ticker_fallback"] = d.ui.tickerFallback;

    JsonObject rem = doc.createNestedObject("reminders");
    rem.createNestedArray("times");
    rem["text"] = d.reminders.text;

    std::string out;
    serializeJsonPretty(doc, out);
    return out;
}

// ---- derived settings ----

uint32_t seconds_to_ms(uint32_t seconds)
{
    if (seconds > MAX_CONFIG_SECONDS) return MAX_CONFIG_SECONDS * 1000;
    return seconds * 1000;
}

RetryPolicy PanelConfig::policyFor(uint32_t refreshSeconds) const
{
    RetryPolicy p;
    p.refreshMs = seconds_to_ms(refreshSeconds);
    p.backoffFloorMs = seconds_to_ms(retry.backoffFloorSeconds);
    p.backoffCeilingMs = seconds_to_ms(retry.backoffCeilingSeconds);
    return p;
}

ReachabilityConfig PanelConfig::reachability() const
{
    ReachabilityConfig c;
    c.host = network.connectTestHost;
    c.port = network.connectTestPort;
    c.connectTimeoutMs = network.connectTimeoutMs;
    c.refreshMs = seconds_to_ms(network.refreshSeconds);
    return c;
}

WeatherClientConfig PanelConfig::weatherClient() const
{
    WeatherClientConfig c;
    c.host = qweather.host;
    c.apiKey = qweather.apiKey;
    c.timeoutMs = seconds_to_ms(qweather.timeoutSeconds);
    c.lang = qweather.lang;
    c.unit = qweather.unit;
    c.range = qweather.range;
    c.number = qweather.number;
    return c;
}

WeatherServiceConfig PanelConfig::weatherService() const
{
    WeatherServiceConfig c;
    c.locationId = qweather.locationId;
    c.locationText = qweather.locationText;
    c.policy = policyFor(qweather.refreshSeconds);
    return c;
}

TextClientConfig PanelConfig::textClient() const
{
    TextClientConfig c;
    c.apiKey = shwg.apiKey;
    c.timeoutMs = seconds_to_ms(shwg.timeoutSeconds);
    return c;
}

QuoteServiceConfig PanelConfig::quoteService() const
{
    QuoteServiceConfig c;
    c.quoteType = shwg.quoteType;
    c.priority = shwg.quotePriority;
    c.policy = policyFor(shwg.quoteRefreshSeconds);
    return c;
}
