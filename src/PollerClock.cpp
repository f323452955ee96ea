#include "PollerClock.h"

#include <chrono>
#include <thread>

SystemClock& SystemClock::instance()
{
    static SystemClock inst;
    return inst;
}

uint64_t SystemClock::nowMs()
{
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

time_t SystemClock::epochNow()
{
    return time(nullptr);
}

void SystemClock::sleepMs(uint32_t ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
