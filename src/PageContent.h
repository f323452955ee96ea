#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "CachedValue.h"
#include "SnapshotBuilder.h"

enum class PageKind : uint8_t { Clock, Weather, Status, Quotes };

bool page_kind_from_name(const std::string& name, PageKind& out);
const char* page_kind_name(PageKind kind);

// Cycles through the configured pages. Unknown names are skipped; an empty
// list falls back to the clock page.
class PageRotation {
public:
    PageRotation(const std::vector<std::string>& names, uint32_t cycleMs);

    // Page to draw at nowMs, advancing once per elapsed cycle.
    PageKind current(uint64_t nowMs);

    size_t count() const { return pages_.size(); }

private:
    std::vector<PageKind> pages_;
    uint32_t cycleMs_;
    size_t index_ = 0;
    uint64_t startMs_ = 0;
    bool started_ = false;
};

// "" while fresh, "stale" after a failed or overdue refresh, "n/a" before
// anything was ever fetched.
template <typename T>
const char* freshness_marker(const CachedValue<T>& v)
{
    if (!v.ok) return "n/a";
    if (v.stale) return "stale";
    return "";
}

enum class PetMood : uint8_t { Happy, Offline, Alert };

PetMood pet_mood(const Snapshot& s, bool alertActive);

// Text layout of a page; the renderer only decides fonts and positions.
struct PageText {
    std::string title;
    std::string marker;
    std::vector<std::string> lines;
};

struct ClockText {
    std::string time;      // "14:05"
    std::string seconds;   // "07"
    std::string date;      // "2024-06-01"
    std::string weekday;   // "Sat"
    std::string lunar;     // lunar line, "" when never fetched
    bool synced = false;
};

ClockText clock_page_text(const Snapshot& s);
PageText weather_page_text(const Snapshot& s);
PageText status_page_text(const Snapshot& s);
PageText quote_page_text(const Snapshot& s);
