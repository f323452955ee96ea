#pragma once

#include <stdint.h>

#include "SnapshotBuilder.h"

// Board readings for the status page: die temperature, heap use, LittleFS
// use and uptime. The ESP32 has no GPU and no load average.
class EspMetrics : public MetricsReader {
public:
    bool cpuTempC(float& out) override;
    bool gpuTempC(float& out) override;
    bool load1(float& out) override;
    bool memPercent(float& out) override;
    bool diskPercent(float& out) override;
    bool uptimeSeconds(uint32_t& out) override;
};
