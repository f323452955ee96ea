#pragma once

#include <stdint.h>
#include <time.h>
#include <atomic>

// Time source for pollers and the message queue.
// nowMs() is monotonic; epochNow() is wall-clock seconds.
class PollerClock {
public:
    virtual ~PollerClock() {}
    virtual uint64_t nowMs() = 0;
    virtual time_t epochNow() = 0;
    virtual void sleepMs(uint32_t ms) = 0;
};

// std::chrono / std::this_thread backed clock. On the ESP32 these sit on
// esp_timer and vTaskDelay.
class SystemClock : public PollerClock {
public:
    static SystemClock& instance();

    uint64_t nowMs() override;
    time_t epochNow() override;
    void sleepMs(uint32_t ms) override;

private:
    SystemClock() = default;
};

// Process-wide cooperative stop flag shared by every poller task and the
// render loop.
class StopSignal {
public:
    void request() { stop_.store(true); }
    bool requested() const { return stop_.load(); }

private:
    std::atomic<bool> stop_{false};
};
