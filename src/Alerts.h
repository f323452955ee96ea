#pragma once

#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>

#include "MessageQueue.h"
#include "SnapshotBuilder.h"

static constexpr int      ALERT_PRIORITY    = 1;
static constexpr uint32_t ALERT_TTL_MS      = 30000;
// Re-queue interval for a raised alert; must stay below ALERT_TTL_MS.
static constexpr uint32_t ALERT_REFRESH_MS  = ALERT_TTL_MS / 2;
static constexpr int      REMINDER_PRIORITY = 5;
static constexpr uint32_t REMINDER_TTL_MS   = 60000;

extern const char* const ALERT_NETWORK_OFFLINE;
extern const char* const ALERT_WEATHER_STALE;

// "" when nothing is wrong. Offline wins over stale weather. Offline is only
// claimed once the reachability check has reported at least once.
std::string alert_for(const Snapshot& s);

// Keeps the global alert on the ticker queue: pushed when it appears or its
// text changes, replaced by a fresh item every ALERT_REFRESH_MS while the
// condition holds, removed as soon as it clears.
class AlertPublisher {
public:
    AlertPublisher(MessageQueue& queue, PollerClock& clock);

    void update(const Snapshot& s);

    // Text of the alert currently raised, "" if none.
    const std::string& active() const { return active_; }

private:
    MessageQueue& queue_;
    PollerClock& clock_;
    std::string active_;
    uint64_t pushedAtMs_ = 0;
};

// Reminder text pushed at fixed local times ("HH:MM"), once per matching
// minute however often tick() runs within it.
class ReminderSchedule {
public:
    ReminderSchedule(const std::vector<std::string>& times, std::string text);

    // Pushes the reminder if `local` falls in a configured minute not yet
    // served. Returns true when it pushed.
    bool tick(const struct tm& local, MessageQueue& queue);

    size_t size() const { return minutes_.size(); }

private:
    std::vector<int> minutes_;   // minute of day
    std::string text_;
    long lastFired_ = -1;        // (year * 366 + yday) * 1440 + minute
};

// "07:30" -> 450. false on anything else.
bool parse_hhmm(const std::string& s, int& minuteOfDay);
