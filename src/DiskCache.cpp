#include "DiskCache.h"

#include <ArduinoJson.h>
#include <utility>

#include "Log.h"

static constexpr const char* TAG = "DiskCache";

// Room for seven forecast days with CJK text.
static constexpr size_t FORECAST_DOC_SIZE = 4096;
static constexpr size_t RECORD_DOC_SIZE   = 1024;
static constexpr size_t LUNAR_DOC_SIZE    = 2048;

DiskCache::DiskCache(StateStore& store, CacheFileNames names)
: store_(store), names_(std::move(names)) {}

std::string DiskCache::lastError() const
{
    std::lock_guard<std::mutex> lock(errMutex_);
    return lastError_;
}

bool DiskCache::readDoc_(const std::string& name, std::string& text)
{
    if (!store_.read(name, text)) {
        panel_log(TAG, "%s: no cached copy (%s)", name.c_str(), store_.lastError());
        return false;
    }
    return true;
}

bool DiskCache::write_(const std::string& name, const std::string& text)
{
    if (text.empty()) {
        noteFailure_(name, "serializeJson wrote 0 bytes");
        return false;
    }
    if (!store_.writeAtomic(name, text)) {
        noteFailure_(name, store_.lastError());
        return false;
    }
    panel_log(TAG, "%s: wrote %u bytes", name.c_str(), (unsigned)text.size());
    return true;
}

void DiskCache::noteFailure_(const std::string& name, const char* why)
{
    const uint32_t n = ++writeFailures_;
    {
        std::lock_guard<std::mutex> lock(errMutex_);
        lastError_ = name + ": " + (why ? why : "?");
    }
    panel_log(TAG, "write %s failed: %s (failures=%lu)",
               name.c_str(), why ? why : "?", (unsigned long)n);
}

// -----------------------------------------------------------------------------
// geo_cache.json
// -----------------------------------------------------------------------------

bool DiskCache::loadGeo(GeoLocation& out)
{
    std::string text;
    if (!readDoc_(names_.geo, text)) return false;

    DynamicJsonDocument doc(RECORD_DOC_SIZE);
    DeserializationError err = deserializeJson(doc, text);
    if (err || !doc.is<JsonObject>()) {
        panel_log(TAG, "%s: unreadable (%s), ignoring", names_.geo.c_str(),
                   err ? err.c_str() : "not an object");
        return false;
    }

    const char* id = doc["location_id"] | "";
    if (!id[0]) {
        panel_log(TAG, "%s: no location_id, ignoring", names_.geo.c_str());
        return false;
    }

    out.id = id;
    out.name = doc["location_name"] | "-";
    out.resolvedAt = (time_t)(doc["ts"] | 0.0);
    return true;
}

bool DiskCache::saveGeo(const GeoLocation& geo)
{
    DynamicJsonDocument doc(RECORD_DOC_SIZE);
    doc["location_id"] = geo.id;
    doc["location_name"] = geo.name;
    doc["ts"] = (uint32_t)geo.resolvedAt;

    std::string text;
    serializeJson(doc, text);
    return write_(names_.geo, text);
}

// -----------------------------------------------------------------------------
// weather_now.json
// -----------------------------------------------------------------------------

bool DiskCache::loadWeatherNow(WeatherReport& out, time_t& lastOk)
{
    std::string text;
    if (!readDoc_(names_.weatherNow, text)) return false;

    DynamicJsonDocument doc(RECORD_DOC_SIZE);
    DeserializationError err = deserializeJson(doc, text);
    if (err || !doc.is<JsonObject>()) {
        panel_log(TAG, "%s: unreadable (%s), ignoring", names_.weatherNow.c_str(),
                   err ? err.c_str() : "not an object");
        return false;
    }
    if (!doc.containsKey("temp_c")) {
        panel_log(TAG, "%s: no temp_c, ignoring", names_.weatherNow.c_str());
        return false;
    }

    out.locationId = doc["location_id"] | "";
    out.locationName = doc["location_name"] | "-";
    out.now.tempC = doc["temp_c"] | "-";
    out.now.text = doc["text"] | "-";
    out.now.icon = doc["icon"] | "-";
    out.now.obsTime = doc["obs_time"] | "-";
    out.now.updateTime = doc["update_time"] | "-";
    lastOk = (time_t)(doc["last_ok_ts"] | 0.0);
    return true;
}

bool DiskCache::saveWeatherNow(const WeatherReport& report, time_t lastOk)
{
    DynamicJsonDocument doc(RECORD_DOC_SIZE);
    doc["location_id"] = report.locationId;
    doc["location_name"] = report.locationName;
    doc["temp_c"] = report.now.tempC;
    doc["text"] = report.now.text;
    doc["icon"] = report.now.icon;
    doc["obs_time"] = report.now.obsTime;
    doc["update_time"] = report.now.updateTime;
    doc["last_ok_ts"] = (uint32_t)lastOk;

    std::string text;
    serializeJson(doc, text);
    return write_(names_.weatherNow, text);
}

// -----------------------------------------------------------------------------
// forecast_cache.json
// -----------------------------------------------------------------------------

bool DiskCache::loadForecast(WeatherReport& out)
{
    std::string text;
    if (!readDoc_(names_.forecast, text)) return false;

    DynamicJsonDocument doc(FORECAST_DOC_SIZE);
    DeserializationError err = deserializeJson(doc, text);
    if (err || !doc.is<JsonObject>()) {
        panel_log(TAG, "%s: unreadable (%s), ignoring", names_.forecast.c_str(),
                   err ? err.c_str() : "not an object");
        return false;
    }

    JsonArray arr = doc["daily"].as<JsonArray>();
    if (arr.isNull()) {
        panel_log(TAG, "%s: no daily[] array", names_.forecast.c_str());
        return false;
    }

    out.daily.clear();
    for (JsonObject obj : arr) {
        DailyForecast d;
        d.date = obj["date"] | "-";
        d.textDay = obj["text_day"] | "-";
        d.tempMax = obj["temp_max"] | "-";
        d.tempMin = obj["temp_min"] | "-";
        d.iconDay = obj["icon_day"] | "-";
        out.daily.push_back(std::move(d));
    }

    if (out.locationId.empty()) {
        out.locationId = doc["location_id"] | "";
        out.locationName = doc["location_name"] | "-";
    }
    return true;
}

bool DiskCache::saveForecast(const WeatherReport& report)
{
    DynamicJsonDocument doc(FORECAST_DOC_SIZE);
    doc["location_id"] = report.locationId;
    doc["location_name"] = report.locationName;

    JsonArray arr = doc.createNestedArray("daily");
    for (const DailyForecast& d : report.daily) {
        JsonObject obj = arr.createNestedObject();
        obj["date"] = d.date;
        obj["text_day"] = d.textDay;
        obj["temp_max"] = d.tempMax;
        obj["temp_min"] = d.tempMin;
        obj["icon_day"] = d.iconDay;
    }

    if (doc.overflowed()) {
        noteFailure_(names_.forecast, "document overflowed");
        return false;
    }

    std::string text;
    serializeJson(doc, text);
    return write_(names_.forecast, text);
}

// -----------------------------------------------------------------------------
// lunar_cache.json
// -----------------------------------------------------------------------------

bool DiskCache::loadLunar(LunarInfo& out, time_t& lastOk)
{
    std::string text;
    if (!readDoc_(names_.lunar, text)) return false;

    DynamicJsonDocument doc(LUNAR_DOC_SIZE);
    DeserializationError err = deserializeJson(doc, text);
    if (err || !doc.is<JsonObject>()) {
        panel_log(TAG, "%s: unreadable (%s), ignoring", names_.lunar.c_str(),
                   err ? err.c_str() : "not an object");
        return false;
    }
    if (!doc.containsKey("lunar")) {
        panel_log(TAG, "%s: no lunar field, ignoring", names_.lunar.c_str());
        return false;
    }

    out.solar = doc["solar"] | "-";
    out.lunar = doc["lunar"] | "-";
    out.week = doc["week"] | "-";
    out.ganzhiYear = doc["ganzhi_year"] | "-";
    out.ganzhiMonth = doc["ganzhi_month"] | "-";
    out.ganzhiDay = doc["ganzhi_day"] | "-";
    out.constellation = doc["constellation"] | "-";
    out.yi = doc["yi"] | "-";
    out.ji = doc["ji"] | "-";
    lastOk = (time_t)(doc["last_ok_ts"] | 0.0);
    return true;
}

bool DiskCache::saveLunar(const LunarInfo& info, time_t lastOk)
{
    DynamicJsonDocument doc(LUNAR_DOC_SIZE);
    doc["solar"] = info.solar;
    doc["lunar"] = info.lunar;
    doc["week"] = info.week;
    doc["ganzhi_year"] = info.ganzhiYear;
    doc["ganzhi_month"] = info.ganzhiMonth;
    doc["ganzhi_day"] = info.ganzhiDay;
    doc["constellation"] = info.constellation;
    doc["yi"] = info.yi;
    doc["ji"] = info.ji;
    doc["last_ok_ts"] = (uint32_t)lastOk;

    if (doc.overflowed()) {
        noteFailure_(names_.lunar, "document overflowed");
        return false;
    }

    std::string text;
    serializeJson(doc, text);
    return write_(names_.lunar, text);
}
