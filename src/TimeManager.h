#pragma once
#include <stdint.h>
#include <stdbool.h>
#include <time.h>
#include <sys/time.h>
#include <string>

#include <WiFiUdp.h>
#include <NTPClient.h>

#include "TimeSync.h"

// POSIX TZ string, e.g. "CST-8". Call before the first localtime().
void time_manager_apply_tz(const char* tz);

// True once the system clock holds a plausible wall time.
bool time_manager_clock_valid();

// NTP over NTPClient. On success the ESP32 system clock is set with
// settimeofday(); the timezone is applied separately through TZ.
class NtpTimeSource : public TimeSource {
public:
    explicit NtpTimeSource(const std::string& server);

    FetchResult<time_t> syncNow() override;

private:
    const std::string server_;   // NTPClient keeps the pointer
    WiFiUDP udp_;
    NTPClient client_;
    bool begun_ = false;
};
