#pragma once

#include <stdint.h>
#include <atomic>
#include <functional>
#include <utility>

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

// One FreeRTOS task around a blocking poller loop. The body returns once the
// shared StopSignal is raised; finished() then turns true.
class PollerTask
{
public:
    PollerTask(const char* name, std::function<void()> body,
               uint32_t stackBytes = 8192, UBaseType_t priority = 1, BaseType_t core = 0)
    : name_(name), body_(std::move(body)), stack_(stackBytes), prio_(priority), core_(core) {}

    PollerTask(const PollerTask&) = delete;
    PollerTask& operator=(const PollerTask&) = delete;

    bool start()
    {
        BaseType_t ok = xTaskCreatePinnedToCore(entry_, name_, stack_, this, prio_, &handle_, core_);
        if (ok != pdPASS) {
            handle_ = nullptr;
            finished_.store(true);
            return false;
        }
        return true;
    }

    const char* name() const { return name_; }
    bool finished() const { return finished_.load(); }

private:
    static void entry_(void* arg)
    {
        PollerTask* self = static_cast<PollerTask*>(arg);
        self->body_();
        self->finished_.store(true);
        vTaskDelete(nullptr);
    }

    const char* name_;
    std::function<void()> body_;
    uint32_t stack_;
    UBaseType_t prio_;
    BaseType_t core_;

    TaskHandle_t handle_ = nullptr;
    std::atomic<bool> finished_{false};
};
