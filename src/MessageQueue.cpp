#include "MessageQueue.h"

#include <algorithm>
#include <utility>

MessageQueue::MessageQueue(PollerClock& clock)
: clock_(clock) {}

void MessageQueue::push(const std::string& text, uint32_t ttlMs, int priority)
{
    const uint64_t now = clock_.nowMs();

    std::lock_guard<std::mutex> lock(mutex_);

    MessageItem item;
    item.text = text;
    item.priority = priority;
    item.expiresAtMs = now + ttlMs;
    item.seq = nextSeq_++;
    items_.push_back(std::move(item));

    // A handful of live items at most, a full stable resort is fine.
    std::stable_sort(items_.begin(), items_.end(),
                     [](const MessageItem& a, const MessageItem& b) {
                         return a.priority < b.priority;
                     });
}

std::string MessageQueue::current()
{
    const uint64_t now = clock_.nowMs();

    std::lock_guard<std::mutex> lock(mutex_);
    evictExpired_(now);
    if (items_.empty()) return std::string();
    return items_.front().text;
}

size_t MessageQueue::remove(const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [&](const MessageItem& m) { return m.text == text; }),
                 items_.end());
    return before - items_.size();
}

size_t MessageQueue::size()
{
    const uint64_t now = clock_.nowMs();

    std::lock_guard<std::mutex> lock(mutex_);
    evictExpired_(now);
    return items_.size();
}

void MessageQueue::evictExpired_(uint64_t now)
{
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [now](const MessageItem& m) { return m.expiresAtMs <= now; }),
                 items_.end());
}
