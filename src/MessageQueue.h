#pragma once

#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>

#include "PollerClock.h"

struct MessageItem {
    std::string text;
    int priority = 10;        // lower = more urgent
    uint64_t expiresAtMs = 0; // PollerClock::nowMs() domain
    uint64_t seq = 0;         // insertion order, breaks priority ties
};

// Ticker arbitration: the single most urgent live message wins.
// Pushed from the quote task and the render loop, read by the render loop.
class MessageQueue {
public:
    explicit MessageQueue(PollerClock& clock);

    // No dedup: the same text pushed twice is two items.
    void push(const std::string& text, uint32_t ttlMs, int priority);

    // Drops expired items, then returns the winner's text or "".
    std::string current();

    // Removes every item carrying this text. Returns how many were removed.
    size_t remove(const std::string& text);

    // Live (unexpired) item count.
    size_t size();

private:
    void evictExpired_(uint64_t now);

    PollerClock& clock_;
    std::mutex mutex_;
    std::vector<MessageItem> items_;   // kept sorted by (priority, seq)
    uint64_t nextSeq_ = 0;
};
