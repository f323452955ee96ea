#include "TimeManager.h"

#include <Arduino.h>
#include <stdlib.h>

#include "Log.h"
#include "WiFiManager.h"

static constexpr const char* TAG = "NTP";

void time_manager_apply_tz(const char* tz)
{
    if (!tz || !tz[0]) return;
    setenv("TZ", tz, 1);
    tzset();
    panel_log(TAG, "timezone %s", tz);
}

bool time_manager_clock_valid()
{
    return time(nullptr) >= TIME_VALID_AFTER;
}

NtpTimeSource::NtpTimeSource(const std::string& server)
: server_(server.empty() ? std::string("pool.ntp.org") : server),
  client_(udp_, server_.c_str(), 0 /* UTC; local time comes from TZ */)
{
}

FetchResult<time_t> NtpTimeSource::syncNow()
{
    using R = FetchResult<time_t>;

    if (!wifi_manager_is_connected()) {
        return R::failure(FetchError::Network, "wifi not connected");
    }

    if (!begun_) {
        client_.begin();
        begun_ = true;
    }

    if (!client_.forceUpdate()) {
        return R::failure(FetchError::Network, "no reply from " + server_);
    }

    const time_t epoch = (time_t)client_.getEpochTime();
    if (epoch < TIME_VALID_AFTER) {
        return R::failure(FetchError::Protocol, "implausible NTP time");
    }

    struct timeval tv {};
    tv.tv_sec = epoch;
    tv.tv_usec = 0;
    if (settimeofday(&tv, nullptr) != 0) {
        return R::failure(FetchError::Config, "settimeofday failed");
    }
    return R::success(epoch);
}
