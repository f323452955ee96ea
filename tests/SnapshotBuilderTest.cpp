#include <gtest/gtest.h>

#include "SnapshotBuilder.h"
#include "TestSupport.h"

class FakeMetrics : public MetricsReader {
public:
    bool cpuTempC(float& out) override { out = cpu; return haveCpu; }
    bool gpuTempC(float&) override { return false; }
    bool load1(float& out) override { out = load; return haveLoad; }
    bool memPercent(float& out) override { out = mem; return true; }
    bool diskPercent(float& out) override { out = disk; return true; }
    bool uptimeSeconds(uint32_t& out) override { out = up; return true; }

    bool haveCpu = true;
    bool haveLoad = false;
    float cpu = 47.3f;
    float load = 0.0f;
    float mem = 41.6f;
    float disk = 12.4f;
    uint32_t up = 3723;
};

TEST(SnapshotBuilderTest, NoSourcesMeansNothingFetched)
{
    FakeClock clock;
    SnapshotBuilder builder(SnapshotSources(), clock);

    Snapshot s = builder.build();
    EXPECT_EQ(clock.epochNow(), s.now);
    EXPECT_FALSE(s.network.ok);
    EXPECT_FALSE(s.weather.ok);
    EXPECT_FALSE(s.lunar.ok);
    EXPECT_FALSE(s.quote.ok);
    EXPECT_FALSE(s.timeSync.ok);
    EXPECT_EQ("-", s.cpuTemp);
    EXPECT_EQ("-", s.gpuTemp);
    EXPECT_EQ("-", s.load);
    EXPECT_EQ("-", s.uptime);
    EXPECT_EQ(0u, s.cacheFailures);
    EXPECT_EQ("", s.cacheError);
}

TEST(SnapshotBuilderTest, MetricsAreFormattedOrDashed)
{
    FakeClock clock;
    FakeMetrics metrics;
    SnapshotSources src;
    src.metrics = &metrics;
    SnapshotBuilder builder(src, clock);

    Snapshot s = builder.build();
    EXPECT_EQ("47.3", s.cpuTemp);
    EXPECT_EQ("-", s.gpuTemp);
    EXPECT_EQ("-", s.load);
    EXPECT_EQ("42", s.memPercent);
    EXPECT_EQ("12", s.diskPercent);
    EXPECT_EQ("01:02:03", s.uptime);

    metrics.haveLoad = true;
    metrics.load = 0.5f;
    metrics.haveCpu = false;
    s = builder.build();
    EXPECT_EQ("0.50", s.load);
    EXPECT_EQ("-", s.cpuTemp);
}

TEST(SnapshotBuilderTest, CopiesPollerValues)
{
    FakeClock clock;
    StopSignal stop;

    Poller<std::string> quote("quote", [&]() {
        stop.request();
        return FetchResult<std::string>::success("carpe diem");
    }, RetryPolicy(), clock, stop);
    quote.run();

    StopSignal stop2;
    Poller<NetworkStatus> net("network", [&]() {
        stop2.request();
        NetworkStatus st;
        st.online = true;
        st.ip = "10.0.0.2";
        return FetchResult<NetworkStatus>::success(st);
    }, RetryPolicy(), clock, stop2);
    net.run();

    SnapshotSources src;
    src.quote = &quote;
    src.network = &net;
    SnapshotBuilder builder(src, clock);

    Snapshot s = builder.build();
    EXPECT_TRUE(s.quote.ok);
    EXPECT_EQ("carpe diem", s.quote.value);
    EXPECT_TRUE(s.network.ok);
    EXPECT_TRUE(s.network.value.online);
    EXPECT_EQ("10.0.0.2", s.network.value.ip);
    EXPECT_FALSE(s.weather.ok);
}

TEST(SnapshotBuilderTest, ReportsCacheWriteFailures)
{
    FakeClock clock;
    MemoryStateStore store;
    store.failWrites = true;
    DiskCache cache(store);

    LunarInfo info;
    info.lunar = "四月廿五";
    EXPECT_FALSE(cache.saveLunar(info, 1));
    EXPECT_FALSE(cache.saveLunar(info, 2));

    SnapshotSources src;
    src.cache = &cache;
    Snapshot s = SnapshotBuilder(src, clock).build();
    EXPECT_EQ(2u, s.cacheFailures);
    EXPECT_NE(std::string::npos, s.cacheError.find("lunar_cache.json"));
}

TEST(FormatUptimeTest, SwitchesToDaysAfterOneDay)
{
    EXPECT_EQ("00:00:00", format_uptime(0));
    EXPECT_EQ("23:59:59", format_uptime(86399));
    EXPECT_EQ("1d 00:00", format_uptime(86400));
    EXPECT_EQ("3d 04:12", format_uptime(3 * 86400 + 4 * 3600 + 12 * 60 + 33));
}
