#pragma once

#include <stdint.h>
#include <time.h>
#include <string>

#include "CachedValue.h"
#include "DiskCache.h"
#include "PanelData.h"
#include "Poller.h"

// Instantaneous board readings. Each returns false when the board has no such
// sensor or the read failed.
class MetricsReader {
public:
    virtual ~MetricsReader() {}

    virtual bool cpuTempC(float& out) = 0;
    virtual bool gpuTempC(float& out) = 0;
    virtual bool load1(float& out) = 0;
    virtual bool memPercent(float& out) = 0;
    virtual bool diskPercent(float& out) = 0;
    virtual bool uptimeSeconds(uint32_t& out) = 0;
};

// Everything one frame needs, copied out of the pollers. Metric strings are
// "-" when unavailable.
struct Snapshot {
    time_t now = 0;

    CachedValue<NetworkStatus> network;
    CachedValue<WeatherReport> weather;
    CachedValue<LunarInfo> lunar;
    CachedValue<std::string> quote;
    CachedValue<time_t> timeSync;

    std::string cpuTemp = "-";
    std::string gpuTemp = "-";
    std::string load = "-";
    std::string memPercent = "-";
    std::string diskPercent = "-";
    std::string uptime = "-";

    uint32_t cacheFailures = 0;
    std::string cacheError;
};

// Any source left null shows up as never-fetched (ok=false).
struct SnapshotSources {
    const Poller<NetworkStatus>* network = nullptr;
    const Poller<WeatherReport>* weather = nullptr;
    const Poller<LunarInfo>* lunar = nullptr;
    const Poller<std::string>* quote = nullptr;
    const Poller<time_t>* timeSync = nullptr;
    MetricsReader* metrics = nullptr;
    const DiskCache* cache = nullptr;
};

// Reads each poller under that poller's own lock, one after the other; there
// is no lock across the whole snapshot.
class SnapshotBuilder {
public:
    SnapshotBuilder(SnapshotSources sources, PollerClock& clock);

    Snapshot build() const;

private:
    const SnapshotSources src_;
    PollerClock& clock_;
};

// "04:12:33", or "3d 04:12" past one day.
std::string format_uptime(uint32_t seconds);
