#include "TextClient.h"

#include <ArduinoJson.h>
#include <initializer_list>
#include <utility>

#include "ApiJson.h"
#include "Log.h"

static constexpr const char* TAG = "TextClient";

static constexpr const char* PATH_RANDTEXT = "/api/randtext/get";
static constexpr const char* PATH_LUNAR    = "/api/lunars/lunarpro";

static constexpr int SUCCESS_CODE = 200;

static std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    const size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    const size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

TextClient::TextClient(HttpTransport& http, TextClientConfig cfg)
: http_(http), cfg_(std::move(cfg)) {}

FetchResult<std::string> TextClient::get_(const char* path, const std::string& query)
{
    using R = FetchResult<std::string>;

    if (cfg_.apiKey.empty()) {
        return R::failure(FetchError::Config, "text api key not configured");
    }
    if (cfg_.host.empty()) {
        return R::failure(FetchError::Config, "text api host not configured");
    }

    HttpRequest req;
    req.url = "https://" + cfg_.host + path + "?key=" + url_encode(cfg_.apiKey);
    if (!query.empty()) {
        req.url += "&";
        req.url += query;
    }
    req.timeoutMs = cfg_.timeoutMs;

    // path only: the key rides in the query string
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

FetchResult<std::string> TextClient::fetchShortText(int quoteType)
{
    using R = FetchResult<std::string>;

    FetchResult<std::string> body = get_(PATH_RANDTEXT, "type=" + std::to_string(quoteType) + "&m=");
    if (!body.ok()) return body;

    DynamicJsonDocument doc(2048);
    DeserializationError err = deserializeJson(doc, body.value);
    if (err) {
        return R::failure(FetchError::Parse, std::string("quote: ") + err.c_str());
    }
    if (!json_code_is(doc["code"], SUCCESS_CODE)) {
        return R::failure(FetchError::Protocol, "quote failed: " + json_code_desc(doc["code"]));
    }

    JsonObjectConst data = doc["data"];
    const std::string text = trim(json_text(data["text"], ""));
    const std::string cn = trim(json_text(data["cn"], ""));

    if (!text.empty() && !cn.empty()) return R::success(text + " " + cn);
    if (!text.empty()) return R::success(text);
    if (!cn.empty()) return R::success(cn);
    return R::failure(FetchError::Protocol, "quote failed: empty text");
}

FetchResult<LunarInfo> TextClient::fetchLunar()
{
    using R = FetchResult<LunarInfo>;

    FetchResult<std::string> body = get_(PATH_LUNAR, std::string());
    if (!body.ok()) return R::failureFrom(body);

    StaticJsonDocument<512> filter;
    filter["code"] = true;
    for (const char* key : {"Solar", "Lunar", "Week", "GanZhiYear", "GanZhiMonth",
                            "GanZhiDay", "Constellation", "YiDay", "JiDay"}) {
        filter["data"][key] = true;
    }

    DynamicJsonDocument doc(3072);
    DeserializationError err = deserializeJson(doc, body.value, DeserializationOption::Filter(filter));
    if (err) {
        return R::failure(FetchError::Parse, std::string("lunar: ") + err.c_str());
    }
    if (!json_code_is(doc["code"], SUCCESS_CODE)) {
        return R::failure(FetchError::Protocol, "lunar failed: " + json_code_desc(doc["code"]));
    }

    JsonObjectConst data = doc["data"];
    if (data.isNull()) {
        return R::failure(FetchError::Protocol, "lunar failed: no data{}");
    }

    LunarInfo info;
    info.solar = json_text(data["Solar"]);
    info.lunar = json_text(data["Lunar"]);
    info.week = json_text(data["Week"]);
    info.ganzhiYear = json_text(data["GanZhiYear"]);
    info.ganzhiMonth = json_text(data["GanZhiMonth"]);
    info.ganzhiDay = json_text(data["GanZhiDay"]);
    info.constellation = json_text(data["Constellation"]);
    info.yi = json_text(data["YiDay"]);
    info.ji = json_text(data["JiDay"]);
    return R::success(std::move(info));
}
