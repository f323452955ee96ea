#include "SystemMetrics.h"

#include <Arduino.h>
#include <LittleFS.h>
#include <esp_timer.h>
#include <math.h>

bool EspMetrics::cpuTempC(float& out)
{
    const float t = temperatureRead();
    if (isnan(t)) return false;
    out = t;
    return true;
}

bool EspMetrics::gpuTempC(float& out)
{
    (void)out;
    return false;
}

bool EspMetrics::load1(float& out)
{
    (void)out;
    return false;
}

bool EspMetrics::memPercent(float& out)
{
    const uint32_t total = ESP.getHeapSize();
    if (total == 0) return false;
    out = 100.0f * (float)(total - ESP.getFreeHeap()) / (float)total;
    return true;
}

bool EspMetrics::diskPercent(float& out)
{
    const size_t total = LittleFS.totalBytes();
    if (total == 0) return false;
    out = 100.0f * (float)LittleFS.usedBytes() / (float)total;
    return true;
}

bool EspMetrics::uptimeSeconds(uint32_t& out)
{
    out = (uint32_t)(esp_timer_get_time() / 1000000LL);
    return true;
}
