#include "Alerts.h"

#include <utility>

#include "Log.h"

static constexpr const char* TAG = "Alerts";

const char* const ALERT_NETWORK_OFFLINE = "ALERT: network offline. check uplink/AP/DNS.";
const char* const ALERT_WEATHER_STALE   = "WARN: weather stale. check QWeather host/key or connectivity.";

std::string alert_for(const Snapshot& s)
{
    if (s.network.ok && !s.network.value.online) return ALERT_NETWORK_OFFLINE;
    if (s.weather.ok && s.weather.stale) return ALERT_WEATHER_STALE;
    return std::string();
}

// ---- AlertPublisher ----

AlertPublisher::AlertPublisher(MessageQueue& queue, PollerClock& clock)
: queue_(queue), clock_(clock) {}

void AlertPublisher::update(const Snapshot& s)
{
    const std::string text = alert_for(s);
    const uint64_t now = clock_.nowMs();

    if (text != active_) {
        if (!active_.empty()) {
            queue_.remove(active_);
            panel_log(TAG, "cleared: %s", active_.c_str());
        }
        active_ = text;
        if (active_.empty()) return;

        panel_log(TAG, "raised: %s", active_.c_str());
        queue_.push(active_, ALERT_TTL_MS, ALERT_PRIORITY);
        pushedAtMs_ = now;
        return;
    }

    // Same text: the remove+push keeps a single live item, and the ticker
    // does not restart because its text is unchanged.
    if (!active_.empty() && now - pushedAtMs_ >= ALERT_REFRESH_MS) {
        queue_.remove(active_);
        queue_.push(active_, ALERT_TTL_MS, ALERT_PRIORITY);
        pushedAtMs_ = now;
    }
}

// ---- reminders ----

bool parse_hhmm(const std::string& s, int& minuteOfDay)
{
    if (s.size() != 5 || s[2] != ':') return false;
    static const int DIGITS[] = {0, 1, 3, 4};
    for (int i : DIGITS) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    const int h = (s[0] - '0') * 10 + (s[1] - '0');
    const int m = (s[3] - '0') * 10 + (s[4] - '0');
    if (h > 23 || m > 59) return false;
    minuteOfDay = h * 60 + m;
    return true;
}

ReminderSchedule::ReminderSchedule(const std::vector<std::string>& times, std::string text)
: text_(std::move(text))
{
    for (const std::string& t : times) {
        int m = 0;
        if (parse_hhmm(t, m)) {
            minutes_.push_back(m);
        } else {
            panel_log(TAG, "ignoring reminder time '%s' (want HH:MM)", t.c_str());
        }
    }
}

bool ReminderSchedule::tick(const struct tm& local, MessageQueue& queue)
{
    if (minutes_.empty() || text_.empty()) return false;

    const int minute = local.tm_hour * 60 + local.tm_min;
    bool match = false;
    for (int m : minutes_) {
        if (m == minute) {
            match = true;
            break;
        }
    }
    if (!match) return false;

    const long stamp = ((long)local.tm_year * 366 + local.tm_yday) * 1440 + minute;
    if (stamp == lastFired_) return false;
    lastFired_ = stamp;

    queue.push(text_, REMINDER_TTL_MS, REMINDER_PRIORITY);
    panel_log(TAG, "reminder at %02d:%02d", local.tm_hour, local.tm_min);
    return true;
}
