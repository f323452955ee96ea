#include <gtest/gtest.h>

#include "TestSupport.h"
#include "WeatherClient.h"

static WeatherClientConfig config()
{
    WeatherClientConfig cfg;
    cfg.host = "abc.re.qweatherapi.com";
    cfg.apiKey = "secret-key";
    return cfg;
}

TEST(WeatherClientTest, ResolvesFirstLocation)
{
    FakeTransport http;
    http.on("/geo/v2/city/lookup", 200, geo_body("101010100", "北京"));
    WeatherClient client(http, config());

    FetchResult<GeoLocation> r = client.resolveLocation("Beijing");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ("101010100", r.value.id);
    EXPECT_EQ("北京", r.value.name);

    ASSERT_EQ(1u, http.requests.size());
    const HttpRequest& req = http.requests[0];
    EXPECT_EQ(0u, req.url.find("https://abc.re.qweatherapi.com/geo/v2/city/lookup?"));
    EXPECT_NE(std::string::npos, req.url.find("location=Beijing"));
    EXPECT_NE(std::string::npos, req.url.find("range=cn"));
    EXPECT_EQ(std::string::npos, req.url.find("secret-key"));
    ASSERT_EQ(1u, req.headers.size());
    EXPECT_EQ("X-QW-Api-Key", req.headers[0].first);
    EXPECT_EQ("secret-key", req.headers[0].second);
    EXPECT_EQ(8000u, req.timeoutMs);
}

TEST(WeatherClientTest, LookupQueryIsPercentEncoded)
{
    FakeTransport http;
    http.on("/geo/v2/city/lookup", 200, geo_body());
    WeatherClient client(http, config());

    ASSERT_TRUE(client.resolveLocation("New York").ok());
    EXPECT_NE(std::string::npos, http.requests[0].url.find("location=New%20York"));
}

TEST(WeatherClientTest, LookupWithNonSuccessCodeIsProtocolError)
{
    FakeTransport http;
    http.on("/geo/v2/city/lookup", 200, R"({"code":"401"})");
    WeatherClient client(http, config());

    FetchResult<GeoLocation> r = client.resolveLocation("Beijing");
    EXPECT_EQ(FetchError::Protocol, r.error);
    EXPECT_NE(std::string::npos, r.message.find("code=401"));
}

TEST(WeatherClientTest, LookupWithoutMatchesIsProtocolError)
{
    FakeTransport http;
    http.on("/geo/v2/city/lookup", 200, R"({"code":"200","location":[]})");
    WeatherClient client(http, config());

    EXPECT_EQ(FetchError::Protocol, client.resolveLocation("Atlantis").error);
}

TEST(WeatherClientTest, FetchesCurrentAndForecast)
{
    FakeTransport http;
    http.on("/v7/weather/now", 200, now_body("23", "晴"));
    http.on("/v7/weather/7d", 200, daily_body());
    WeatherClient client(http, config());

    FetchResult<WeatherFetch> r = client.fetchWeather("101010100");
    ASSERT_TRUE(r.ok()) << r.message;

    EXPECT_EQ("23", r.value.now.tempC);
    EXPECT_EQ("晴", r.value.now.text);
    EXPECT_EQ("100", r.value.now.icon);
    EXPECT_EQ("2024-06-01T10:00+08:00", r.value.now.obsTime);
    EXPECT_EQ("2024-06-01T10:05+08:00", r.value.now.updateTime);

    ASSERT_TRUE(r.value.hasForecast);
    ASSERT_EQ(4u, r.value.daily.size());
    EXPECT_EQ("2024-06-03", r.value.daily[2].date);
    EXPECT_EQ("Light Rain", r.value.daily[2].textDay);
    EXPECT_EQ("25", r.value.daily[2].tempMax);
    EXPECT_EQ("16", r.value.daily[2].tempMin);
    EXPECT_EQ("305", r.value.daily[2].iconDay);

    EXPECT_NE(std::string::npos, http.requests[0].url.find("location=101010100"));
    EXPECT_NE(std::string::npos, http.requests[0].url.find("unit=m"));
}

TEST(WeatherClientTest, NumericFieldsAreAcceptedAsText)
{
    FakeTransport http;
    http.on("/v7/weather/now", 200, R"({"code":200,"now":{"temp":-3,"text":"Snow","icon":"400","obsTime":"t"}})");
    http.on("/v7/weather/7d", 200, daily_body());
    WeatherClient client(http, config());

    FetchResult<WeatherFetch> r = client.fetchWeather("1");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ("-3", r.value.now.tempC);
}

TEST(WeatherClientTest, ForecastFailureOnlyDropsForecast)
{
    FakeTransport http;
    http.on("/v7/weather/now", 200, now_body());
    http.on("/v7/weather/7d", 500, "oops");
    WeatherClient client(http, config());

    FetchResult<WeatherFetch> r = client.fetchWeather("101010100");
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value.hasForecast);
    EXPECT_TRUE(r.value.daily.empty());
    EXPECT_EQ("23", r.value.now.tempC);
}

TEST(WeatherClientTest, CurrentConditionsFailureClassification)
{
    FakeTransport http;
    WeatherClient client(http, config());

    http.on("/v7/weather/now", 403, "{}");
    FetchResult<WeatherFetch> r = client.fetchWeather("1");
    EXPECT_EQ(FetchError::Http, r.error);
    EXPECT_NE(std::string::npos, r.message.find("HTTP 403"));

    http.on("/v7/weather/now", 200, "{\"code\":\"200\",\"now\":");
    EXPECT_EQ(FetchError::Parse, client.fetchWeather("1").error);

    http.on("/v7/weather/now", 200, R"({"code":"402"})");
    EXPECT_EQ(FetchError::Protocol, client.fetchWeather("1").error);

    http.on("/v7/weather/now", 200, R"({"code":"200"})");
    EXPECT_EQ(FetchError::Protocol, client.fetchWeather("1").error);

    http.fail("/v7/weather/now", "connection refused");
    r = client.fetchWeather("1");
    EXPECT_EQ(FetchError::Network, r.error);
    EXPECT_NE(std::string::npos, r.message.find("connection refused"));

    // the forecast is never asked for when current conditions fail
    EXPECT_EQ(0u, http.count("/v7/weather/7d"));
}

TEST(WeatherClientTest, MissingSettingsAreConfigErrors)
{
    FakeTransport http;

    WeatherClientConfig noKey = config();
    noKey.apiKey.clear();
    WeatherClient a(http, noKey);
    EXPECT_EQ(FetchError::Config, a.fetchWeather("1").error);

    WeatherClientConfig placeholder = config();
    placeholder.host = "YOUR_HOST.re.qweatherapi.com";
    WeatherClient b(http, placeholder);
    EXPECT_EQ(FetchError::Config, b.resolveLocation("Beijing").error);

    WeatherClient c(http, config());
    EXPECT_EQ(FetchError::Config, c.resolveLocation("").error);
    EXPECT_EQ(FetchError::Config, c.fetchWeather("").error);

    EXPECT_TRUE(http.requests.empty());
}
