#include "PageContent.h"

#include <stdio.h>
#include <time.h>

#include "Log.h"

static constexpr const char* TAG = "Pages";

static constexpr size_t FORECAST_ROWS = 3;

bool page_kind_from_name(const std::string& name, PageKind& out)
{
    if (name == "clock")   { out = PageKind::Clock;   return true; }
    if (name == "weather") { out = PageKind::Weather; return true; }
    if (name == "status")  { out = PageKind::Status;  return true; }
    if (name == "quotes")  { out = PageKind::Quotes;  return true; }
    return false;
}

const char* page_kind_name(PageKind kind)
{
    switch (kind) {
        case PageKind::Clock:   return "clock";
        case PageKind::Weather: return "weather";
        case PageKind::Status:  return "status";
        case PageKind::Quotes:  return "quotes";
    }
    return "?";
}

// ---- rotation ----

PageRotation::PageRotation(const std::vector<std::string>& names, uint32_t cycleMs)
: cycleMs_(cycleMs ? cycleMs : 1000)
{
    for (const std::string& n : names) {
        PageKind k;
        if (page_kind_from_name(n, k)) {
            pages_.push_back(k);
        } else {
            panel_log(TAG, "unknown page '%s', skipped", n.c_str());
        }
    }
    if (pages_.empty()) pages_.push_back(PageKind::Clock);
}

PageKind PageRotation::current(uint64_t nowMs)
{
    if (!started_) {
        started_ = true;
        startMs_ = nowMs;
    }
    if (pages_.size() > 1 && nowMs - startMs_ >= cycleMs_) {
        startMs_ = nowMs;
        index_ = (index_ + 1) % pages_.size();
    }
    return pages_[index_];
}

// ---- page text ----

PetMood pet_mood(const Snapshot& s, bool alertActive)
{
    if (s.network.ok && !s.network.value.online) return PetMood::Offline;
    if (alertActive) return PetMood::Alert;
    return PetMood::Happy;
}

ClockText clock_page_text(const Snapshot& s)
{
    ClockText c;
    c.synced = s.timeSync.ok;

    struct tm lt;
    const time_t t = s.now;
    localtime_r(&t, &lt);

    char buf[32];
    strftime(buf, sizeof(buf), "%H:%M", &lt);
    c.time = buf;
    strftime(buf, sizeof(buf), "%S", &lt);
    c.seconds = buf;
    strftime(buf, sizeof(buf), "%Y-%m-%d", &lt);
    c.date = buf;
    strftime(buf, sizeof(buf), "%a", &lt);
    c.weekday = buf;

    if (s.lunar.ok) {
        const LunarInfo& l = s.lunar.value;
        c.lunar = l.lunar + " " + l.ganzhiYear;
    }
    return c;
}

PageText weather_page_text(const Snapshot& s)
{
    const CachedValue<WeatherReport>& w = s.weather;

    PageText p;
    p.title = w.ok ? w.value.locationName : "Weather";
    p.marker = freshness_marker(w);

    if (!w.ok) {
        p.lines.push_back("no weather yet");
        if (!w.error.empty()) p.lines.push_back(w.error);
        return p;
    }

    const WeatherNow& now = w.value.now;
    p.lines.push_back(now.tempC + "C  " + now.text);
    p.lines.push_back("obs " + now.obsTime);

    const size_t rows = w.value.daily.size() < FORECAST_ROWS ? w.value.daily.size() : FORECAST_ROWS;
    for (size_t i = 0; i < rows; ++i) {
        const DailyForecast& d = w.value.daily[i];
        // "2024-06-01" -> "06-01"
        const std::string day = d.date.size() >= 10 ? d.date.substr(5) : d.date;
        p.lines.push_back(day + " " + d.textDay + " " + d.tempMin + "~" + d.tempMax + "C");
    }

    if (w.stale && !w.error.empty()) p.lines.push_back("err: " + w.error);
    return p;
}

PageText status_page_text(const Snapshot& s)
{
    const NetworkStatus& n = s.network.value;

    PageText p;
    p.title = "Status";
    p.marker = s.network.ok ? "" : "n/a";

    char buf[64];
    p.lines.push_back("IP " + n.ip);
    snprintf(buf, sizeof(buf), "net %s  rssi %d", n.online ? "online" : "offline", (int)n.rssi);
    p.lines.push_back(buf);
    p.lines.push_back("CPU " + s.cpuTemp + "C  GPU " + s.gpuTemp);
    p.lines.push_back("load " + s.load + "  mem " + s.memPercent + "%  disk " + s.diskPercent + "%");
    p.lines.push_back("up " + s.uptime);
    snprintf(buf, sizeof(buf), "cache write fails %lu", (unsigned long)s.cacheFailures);
    p.lines.push_back(buf);
    p.lines.push_back(std::string("time ") + (s.timeSync.ok ? (s.timeSync.stale ? "synced (stale)" : "synced")
                                                          : "not synced"));
    return p;
}

PageText quote_page_text(const Snapshot& s)
{
    PageText p;
    p.title = "Quote";
    p.marker = freshness_marker(s.quote);
    p.lines.push_back(s.quote.ok ? s.quote.value : "-");
    if (s.quote.stale && !s.quote.error.empty()) p.lines.push_back("err: " + s.quote.error);
    return p;
}
