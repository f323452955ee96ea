#include "WeatherClient.h"

#include <ArduinoJson.h>
#include <utility>

#include "ApiJson.h"
#include "Log.h"

static constexpr const char* TAG = "WeatherClient";

static constexpr const char* PATH_CITY_LOOKUP = "/geo/v2/city/lookup";
static constexpr const char* PATH_WEATHER_NOW = "/v7/weather/now";
static constexpr const char* PATH_WEATHER_7D  = "/v7/weather/7d";

static constexpr int SUCCESS_CODE = 200;

WeatherClient::WeatherClient(HttpTransport& http, WeatherClientConfig cfg)
: http_(http), cfg_(std::move(cfg)) {}

FetchResult<std::string> WeatherClient::get_(const char* path, const std::string& query)
{
    using R = FetchResult<std::string>;

    if (cfg_.host.empty() || cfg_.host.find("YOUR_HOST") != std::string::npos) {
        return R::failure(FetchError::Config, "weather host not configured");
    }
    if (cfg_.apiKey.empty()) {
        return R::failure(FetchError::Config, "weather api key not configured");
    }

    HttpRequest req;
    req.url = "https://" + cfg_.host + path + "?" + query;
    req.headers.emplace_back("X-QW-Api-Key", cfg_.apiKey);
    req.timeoutMs = cfg_.timeoutMs;

    panel_log(TAG, "GET %s", path);
    HttpResponse resp = http_.get(req);

    if (resp.status < 0) {
        return R::failure(FetchError::Network,
                          std::string(path) + ": " + (resp.error.empty() ? "transport error" : resp.error));
    }
    if (resp.status < 200 || resp.status >= 300) {
        return R::failure(FetchError::Http, std::string(path) + ": HTTP " + std::to_string(resp.status));
    }
    return R::success(std::move(resp.body));
}

FetchResult<GeoLocation> WeatherClient::resolveLocation(const std::string& query)
{
    using R = FetchResult<GeoLocation>;

    if (query.empty()) {
        return R::failure(FetchError::Config, "no location configured");
    }

    std::string q = "location=" + url_encode(query) +
                    "&lang=" + url_encode(cfg_.lang) +
                    "&range=" + url_encode(cfg_.range) +
                    "&number=" + std::to_string(cfg_.number);

    FetchResult<std::string> body = get_(PATH_CITY_LOOKUP, q);
    if (!body.ok()) return R::failureFrom(body);

    DynamicJsonDocument doc(4096);
    DeserializationError err = deserializeJson(doc, body.value);
    if (err) {
        return R::failure(FetchError::Parse, std::string("geo lookup: ") + err.c_str());
    }

    if (!json_code_is(doc["code"], SUCCESS_CODE)) {
        return R::failure(FetchError::Protocol, "Geo lookup failed: " + json_code_desc(doc["code"]));
    }

    JsonObjectConst loc0 = doc["location"][0];
    const char* id = loc0["id"] | "";
    if (loc0.isNull() || !id[0]) {
        return R::failure(FetchError::Protocol, "Geo lookup failed: no location");
    }

    GeoLocation geo;
    geo.id = id;
    geo.name = loc0["name"] | query.c_str();
    panel_log(TAG, "resolved '%s' -> %s (%s)", query.c_str(), geo.id.c_str(), geo.name.c_str());
    return R::success(std::move(geo));
}

FetchResult<WeatherNow> WeatherClient::fetchNow_(const std::string& locationId)
{
    using R = FetchResult<WeatherNow>;

    std::string q = "location=" + url_encode(locationId) +
                    "&lang=" + url_encode(cfg_.lang) +
                    "&unit=" + url_encode(cfg_.unit);

    FetchResult<std::string> body = get_(PATH_WEATHER_NOW, q);
    if (!body.ok()) return R::failureFrom(body);

    DynamicJsonDocument doc(3072);
    DeserializationError err = deserializeJson(doc, body.value);
    if (err) {
        return R::failure(FetchError::Parse, std::string("weather now: ") + err.c_str());
    }
    if (!json_code_is(doc["code"], SUCCESS_CODE)) {
        return R::failure(FetchError::Protocol, "Weather now failed: " + json_code_desc(doc["code"]));
    }

    JsonObjectConst now = doc["now"];
    if (now.isNull()) {
        return R::failure(FetchError::Protocol, "Weather now failed: no now{}");
    }

    WeatherNow w;
    w.tempC = json_text(now["temp"]);
    w.text = json_text(now["text"]);
    w.icon = json_text(now["icon"]);
    w.obsTime = json_text(now["obsTime"]);
    w.updateTime = json_text(doc["updateTime"], "");
    return R::success(std::move(w));
}

FetchResult<std::vector<DailyForecast>> WeatherClient::fetchDaily_(const std::string& locationId)
{
    using R = FetchResult<std::vector<DailyForecast>>;

    std::string q = "location=" + url_encode(locationId) +
                    "&lang=" + url_encode(cfg_.lang) +
                    "&unit=" + url_encode(cfg_.unit);

    FetchResult<std::string> body = get_(PATH_WEATHER_7D, q);
    if (!body.ok()) return R::failureFrom(body);

    // The 7d payload carries ~30 fields per day; keep only what we draw.
    StaticJsonDocument<512> filter;
    filter["code"] = true;
    filter["daily"][0]["fxDate"] = true;
    filter["daily"][0]["textDay"] = true;
    filter["daily"][0]["tempMax"] = true;
    filter["daily"][0]["tempMin"] = true;
    filter["daily"][0]["iconDay"] = true;

    DynamicJsonDocument doc(4096);
    DeserializationError err = deserializeJson(doc, body.value, DeserializationOption::Filter(filter));
    if (err) {
        return R::failure(FetchError::Parse, std::string("weather 7d: ") + err.c_str());
    }
    if (!json_code_is(doc["code"], SUCCESS_CODE)) {
        return R::failure(FetchError::Protocol, "Weather 7d failed: " + json_code_desc(doc["code"]));
    }

    std::vector<DailyForecast> daily;
    for (JsonObjectConst item : doc["daily"].as<JsonArrayConst>()) {
        DailyForecast d;
        d.date = json_text(item["fxDate"]);
        d.textDay = json_text(item["textDay"]);
        d.tempMax = json_text(item["tempMax"]);
        d.tempMin = json_text(item["tempMin"]);
        d.iconDay = json_text(item["iconDay"]);
        daily.push_back(std::move(d));
    }
    return R::success(std::move(daily));
}

FetchResult<WeatherFetch> WeatherClient::fetchWeather(const std::string& locationId)
{
    using R = FetchResult<WeatherFetch>;

    if (locationId.empty()) {
        return R::failure(FetchError::Config, "no location id");
    }

    FetchResult<WeatherNow> now = fetchNow_(locationId);
    if (!now.ok()) return R::failureFrom(now);

    WeatherFetch out;
    out.now = std::move(now.value);

    FetchResult<std::vector<DailyForecast>> daily = fetchDaily_(locationId);
    if (daily.ok()) {
        out.hasForecast = true;
        out.daily = std::move(daily.value);
    } else {
        panel_log(TAG, "forecast unavailable (%s: %s), keeping current only",
                   fetch_error_name(daily.error), daily.message.c_str());
    }
    return R::success(std::move(out));
}
