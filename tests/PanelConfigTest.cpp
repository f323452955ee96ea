#include <gtest/gtest.h>

#include "PanelConfig.h"

TEST(PanelConfigTest, EmptyObjectKeepsDefaults)
{
    PanelConfig cfg;
    std::string err;
    ASSERT_TRUE(parsePanelConfig("{}", cfg, &err)) << err;

    EXPECT_EQ("YOUR_HOST.re.qweatherapi.com", cfg.qweather.host);
    EXPECT_EQ("Beijing", cfg.qweather.locationText);
    EXPECT_EQ(600u, cfg.qweather.refreshSeconds);
    EXPECT_EQ(5, cfg.shwg.quoteType);
    EXPECT_EQ(20, cfg.shwg.quotePriority);
    EXPECT_EQ(21600u, cfg.shwg.lunarRefreshSeconds);
    EXPECT_EQ(5u, cfg.retry.backoffFloorSeconds);
    EXPECT_EQ(300u, cfg.retry.backoffCeilingSeconds);
    EXPECT_EQ("CST-8", cfg.time.tz);
    EXPECT_EQ(80, cfg.display.brightness);
    EXPECT_EQ(4u, cfg.display.pages.size());
    EXPECT_TRUE(cfg.reminders.times.empty());
}

TEST(PanelConfigTest, ReadsNestedSections)
{
    const char* json = R"({
        "wifi": {"ssid": "desk", "password": "pw"},
        "qweather": {"host": "abc.re.qweatherapi.com", "api_key": "qk", "refresh_seconds": 900,
                     "lookup": {"location_id": "101020100", "location_text": "Shanghai"}},
        "shwg": {"api_key": "sk", "quote_type": 3, "quote_priority": 15},
        "retry": {"backoff_floor_seconds": 2, "backoff_ceiling_seconds": 60},
        "paths": {"state_dir": "/data", "lunar_cache": "lunar.json"},
        "display": {"brightness": 55, "pages": ["weather", "clock"]},
        "ui": {"ticker_speed_px_per_s": 60},
        "reminders": {"times": ["10:30", "15:00"], "text": "stretch"}
    })";

    PanelConfig cfg;
    ASSERT_TRUE(parsePanelConfig(json, cfg));

    EXPECT_EQ("desk", cfg.wifi.ssid);
    EXPECT_EQ("pw", cfg.wifi.password);
    EXPECT_EQ("abc.re.qweatherapi.com", cfg.qweather.host);
    EXPECT_EQ("qk", cfg.qweather.apiKey);
    EXPECT_EQ(900u, cfg.qweather.refreshSeconds);
    EXPECT_EQ("101020100", cfg.qweather.locationId);
    EXPECT_EQ("Shanghai", cfg.qweather.locationText);
    EXPECT_EQ("sk", cfg.shwg.apiKey);
    EXPECT_EQ(3, cfg.shwg.quoteType);
    EXPECT_EQ(15, cfg.shwg.quotePriority);
    EXPECT_EQ("/data", cfg.paths.stateDir);
    EXPECT_EQ("lunar.json", cfg.paths.files.lunar);
    EXPECT_EQ("geo_cache.json", cfg.paths.files.geo);
    EXPECT_EQ(55, cfg.display.brightness);
    EXPECT_EQ((std::vector<std::string>{"weather", "clock"}), cfg.display.pages);
    EXPECT_FLOAT_EQ(60.0f, cfg.ui.tickerSpeedPxPerS);
    EXPECT_EQ((std::vector<std::string>{"10:30", "15:00"}), cfg.reminders.times);
    EXPECT_EQ("stretch", cfg.reminders.text);

    RetryPolicy p = cfg.weatherService().policy;
    EXPECT_EQ(900000u, p.refreshMs);
    EXPECT_EQ(2000u, p.backoffFloorMs);
    EXPECT_EQ(60000u, p.backoffCeilingMs);

    WeatherClientConfig wc = cfg.weatherClient();
    EXPECT_EQ("qk", wc.apiKey);
    EXPECT_EQ(8000u, wc.timeoutMs);

    QuoteServiceConfig qc = cfg.quoteService();
    EXPECT_EQ(3, qc.quoteType);
    EXPECT_EQ(15, qc.priority);
    EXPECT_EQ(600000u, qc.policy.refreshMs);
}

TEST(PanelConfigTest, WrongTypesAreIgnored)
{
    const char* json = R"({
        "wifi": "not an object",
        "qweather": {"host": 42, "refresh_seconds": "soon"},
        "shwg": {"quote_type": "five"},
        "display": {"pages": "clock", "brightness": "max"}
    })";

    PanelConfig cfg;
    ASSERT_TRUE(parsePanelConfig(json, cfg));
    EXPECT_EQ("", cfg.wifi.ssid);
    EXPECT_EQ("YOUR_HOST.re.qweatherapi.com", cfg.qweather.host);
    EXPECT_EQ(600u, cfg.qweather.refreshSeconds);
    EXPECT_EQ(5, cfg.shwg.quoteType);
    EXPECT_EQ(4u, cfg.display.pages.size());
    EXPECT_EQ(80, cfg.display.brightness);
}

TEST(PanelConfigTest, MalformedTextIsRejected)
{
    PanelConfig cfg;
    std::string err;
    EXPECT_FALSE(parsePanelConfig("{\"wifi\": {", cfg, &err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(parsePanelConfig("[1, 2]", cfg, &err));
    EXPECT_EQ("settings root is not an object", err);

    EXPECT_FALSE(parsePanelConfig("", cfg));
}

TEST(PanelConfigTest, ValuesAreClamped)
{
    const char* json = R"({
        "qweather": {"refresh_seconds": 0},
        "retry": {"backoff_floor_seconds": 30, "backoff_ceiling_seconds": 10},
        "display": {"brightness": 150}
    })";

    PanelConfig cfg;
    ASSERT_TRUE(parsePanelConfig(json, cfg));
    EXPECT_EQ(1u, cfg.qweather.refreshSeconds);
    EXPECT_EQ(30u, cfg.retry.backoffCeilingSeconds);
    EXPECT_EQ(100, cfg.display.brightness);

    PanelConfig dim;
    ASSERT_TRUE(parsePanelConfig(R"({"display": {"brightness": -5}})", dim));
    EXPECT_EQ(0, dim.display.brightness);
}

TEST(PanelConfigTest, HugeSecondsSaturateInsteadOfWrapping)
{
    // 5000000 s * 1000 wraps a uint32_t to 705032704 ms (about 8 days)
    const char* json = R"({
        "qweather": {"refresh_seconds": 5000000, "timeout_seconds": 1e12},
        "retry": {"backoff_floor_seconds": 4294968, "backoff_ceiling_seconds": 1e300},
        "network": {"refresh_seconds": 4294967295, "connect_timeout_ms": 1e20}
    })";

    PanelConfig cfg;
    ASSERT_TRUE(parsePanelConfig(json, cfg));
    EXPECT_EQ(MAX_CONFIG_SECONDS, cfg.qweather.refreshSeconds);
    EXPECT_EQ(MAX_CONFIG_SECONDS, cfg.qweather.timeoutSeconds);
    EXPECT_EQ(MAX_CONFIG_SECONDS, cfg.retry.backoffFloorSeconds);
    EXPECT_EQ(MAX_CONFIG_SECONDS, cfg.retry.backoffCeilingSeconds);
    EXPECT_EQ(UINT32_MAX, cfg.network.connectTimeoutMs);

    const RetryPolicy p = cfg.weatherService().policy;
    EXPECT_EQ(MAX_CONFIG_SECONDS * 1000, p.refreshMs);
    EXPECT_GE(p.refreshMs, 4294967000u);
    EXPECT_EQ(p.backoffFloorMs, p.backoffCeilingMs);
    EXPECT_GE(cfg.weatherClient().timeoutMs, 4294967000u);
    EXPECT_GE(cfg.reachability().refreshMs, 4294967000u);
}

TEST(PanelConfigTest, SecondsToMsSaturates)
{
    EXPECT_EQ(0u, seconds_to_ms(0));
    EXPECT_EQ(600000u, seconds_to_ms(600));
    EXPECT_EQ(MAX_CONFIG_SECONDS * 1000, seconds_to_ms(MAX_CONFIG_SECONDS));
    EXPECT_EQ(MAX_CONFIG_SECONDS * 1000, seconds_to_ms(UINT32_MAX));
}

TEST(PanelConfigTest, ReachabilityAndTextClientSettings)
{
    const char* json = R"({
        "network": {"connect_test_host": "1.1.1.1", "connect_test_port": 443, "refresh_seconds": 30},
        "shwg": {"api_key": "sk", "timeout_seconds": 6}
    })";

    PanelConfig cfg;
    ASSERT_TRUE(parsePanelConfig(json, cfg));

    ReachabilityConfig rc = cfg.reachability();
    EXPECT_EQ("1.1.1.1", rc.host);
    EXPECT_EQ(443, rc.port);
    EXPECT_EQ(30000u, rc.refreshMs);
    EXPECT_EQ(1500u, rc.connectTimeoutMs);

    TextClientConfig tc = cfg.textClient();
    EXPECT_EQ("sk", tc.apiKey);
    EXPECT_EQ(6000u, tc.timeoutMs);
    EXPECT_EQ("api.shwgij.com", tc.host);
}

TEST(PanelConfigTest, DefaultDocumentParsesBackToDefaults)
{
    const std::string text = defaultSettingsJson();
    ASSERT_FALSE(text.empty());

    PanelConfig cfg;
    cfg.qweather.locationText = "overwritten";
    cfg.display.pages.clear();
    ASSERT_TRUE(parsePanelConfig(text, cfg));

    const PanelConfig d;
    EXPECT_EQ(d.qweather.locationText, cfg.qweather.locationText);
    EXPECT_EQ(d.qweather.host, cfg.qweather.host);
    EXPECT_EQ(d.display.pages, cfg.display.pages);
    EXPECT_EQ(d.ui.tickerFallback, cfg.ui.tickerFallback);
    EXPECT_EQ(d.reminders.text, cfg.reminders.text);
    EXPECT_EQ(d.paths.files.forecast, cfg.paths.files.forecast);
}
