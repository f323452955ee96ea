#include <gtest/gtest.h>

#include "TestSupport.h"
#include "TextClient.h"

static TextClientConfig config()
{
    TextClientConfig cfg;
    cfg.apiKey = "k&1";
    return cfg;
}

TEST(TextClientTest, QuoteJoinsTextAndTranslation)
{
    FakeTransport http;
    http.on("/api/randtext/get", 200,
            R"({"code":200,"msg":"ok","data":{"text":"  Stay hungry, stay foolish. ","cn":"求知若饥，虚心若愚。"}})");
    TextClient client(http, config());

    FetchResult<std::string> r = client.fetchShortText(5);
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ("Stay hungry, stay foolish. 求知若饥，虚心若愚。", r.value);

    ASSERT_EQ(1u, http.requests.size());
    const std::string& url = http.requests[0].url;
    EXPECT_EQ(0u, url.find("https://api.shwgij.com/api/randtext/get?key=k%261"));
    EXPECT_NE(std::string::npos, url.find("type=5"));
    EXPECT_EQ(4000u, http.requests[0].timeoutMs);
}

TEST(TextClientTest, QuoteWithOnlyOnePart)
{
    FakeTransport http;
    http.on("/api/randtext/get", 200, R"({"code":200,"data":{"cn":"知足常乐"}})");
    TextClient client(http, config());

    FetchResult<std::string> r = client.fetchShortText(1);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ("知足常乐", r.value);
}

TEST(TextClientTest, EmptyQuoteIsProtocolError)
{
    FakeTransport http;
    http.on("/api/randtext/get", 200, R"({"code":200,"data":{"text":"   ","cn":""}})");
    TextClient client(http, config());

    FetchResult<std::string> r = client.fetchShortText(5);
    EXPECT_EQ(FetchError::Protocol, r.error);
    EXPECT_EQ("quote failed: empty text", r.message);
}

TEST(TextClientTest, NonSuccessCodeIsProtocolError)
{
    FakeTransport http;
    http.on("/api/randtext/get", 200, R"({"code":403,"msg":"bad key"})");
    TextClient client(http, config());

    FetchResult<std::string> r = client.fetchShortText(5);
    EXPECT_EQ(FetchError::Protocol, r.error);
    EXPECT_NE(std::string::npos, r.message.find("code=403"));
}

TEST(TextClientTest, LunarFields)
{
    FakeTransport http;
    http.on("/api/lunars/lunarpro", 200,
            R"({"code":200,"data":{"Solar":"2024-06-01","Lunar":"四月廿五","Week":"六",)"
            R"("GanZhiYear":"甲辰","GanZhiMonth":"己巳","GanZhiDay":"癸酉","Constellation":"双子座",)"
            R"("YiDay":"祭祀 出行","JiDay":"动土","Festivals":["儿童节"],"Extra":{"a":1}}})");
    TextClient client(http, config());

    FetchResult<LunarInfo> r = client.fetchLunar();
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ("2024-06-01", r.value.solar);
    EXPECT_EQ("四月廿五", r.value.lunar);
    EXPECT_EQ("甲辰", r.value.ganzhiYear);
    EXPECT_EQ("癸酉", r.value.ganzhiDay);
    EXPECT_EQ("双子座", r.value.constellation);
    EXPECT_EQ("祭祀 出行", r.value.yi);
    EXPECT_EQ("动土", r.value.ji);
}

TEST(TextClientTest, LunarWithoutDataIsProtocolError)
{
    FakeTransport http;
    http.on("/api/lunars/lunarpro", 200, R"({"code":200})");
    TextClient client(http, config());

    EXPECT_EQ(FetchError::Protocol, client.fetchLunar().error);
}

TEST(TextClientTest, MissingKeyIsConfigError)
{
    FakeTransport http;
    TextClient client(http, TextClientConfig());

    EXPECT_EQ(FetchError::Config, client.fetchShortText(5).error);
    EXPECT_EQ(FetchError::Config, client.fetchLunar().error);
    EXPECT_TRUE(http.requests.empty());
}

TEST(TextClientTest, TransportAndHttpFailures)
{
    FakeTransport http;
    TextClient client(http, config());

    http.fail("/api/lunars/lunarpro", "timeout");
    EXPECT_EQ(FetchError::Network, client.fetchLunar().error);

    http.on("/api/lunars/lunarpro", 502, "");
    EXPECT_EQ(FetchError::Http, client.fetchLunar().error);
}
