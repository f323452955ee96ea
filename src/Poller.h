#pragma once

#include <stdint.h>
#include <time.h>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include "CachedValue.h"
#include "FetchResult.h"
#include "Log.h"
#include "PollerClock.h"

// Generic refresh loop: fetch on a schedule, publish the latest value under
// its own lock, back off on failure, persist successes, seed from disk.
//
// run() blocks until the stop signal is raised; the firmware gives each
// poller its own FreeRTOS task (PollerTask.h). snapshot() may be called from
// any task and never waits on I/O.
template <typename T>
class Poller {
public:
    using FetchFn   = std::function<FetchResult<T>()>;
    using PersistFn = std::function<bool(const T&)>;
    // Fills value and the wall-clock time it was last fetched.
    using PreloadFn = std::function<bool(T& value, time_t& savedAt)>;

    static constexpr uint32_t SLEEP_SLICE_MS = 500;
    static constexpr size_t   MAX_ERROR_LEN  = 60;

    Poller(const char* name,
           FetchFn fetch,
           RetryPolicy policy,
           PollerClock& clock,
           StopSignal& stop,
           PersistFn persist = nullptr,
           PreloadFn preload = nullptr)
    : name_(name ? name : "poller"),
      fetch_(std::move(fetch)),
      persist_(std::move(persist)),
      preload_(std::move(preload)),
      policy_(policy),
      clock_(clock),
      stop_(stop),
      tag_(std::string("Poller:") + name_)
    {
        if (policy_.backoffCeilingMs < policy_.backoffFloorMs) {
            policy_.backoffCeilingMs = policy_.backoffFloorMs;
        }
        retry_.reset(policy_);
    }

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    const char* name() const { return name_; }
    const RetryPolicy& policy() const { return policy_; }

    // Copy of the latest value. A fresh value whose refresh is overdue by
    // more than one backoff floor is reported stale.
    CachedValue<T> snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CachedValue<T> out = value_;
        if (!out.stale && freshSinceMs_ != 0) {
            const uint64_t now = clock_.nowMs();
            const uint64_t limit = (uint64_t)policy_.refreshMs + policy_.backoffFloorMs;
            if (now - freshSinceMs_ > limit) out.stale = true;
        }
        return out;
    }

    // Only meaningful from inside the poller's own task (or after run()
    // returned).
    const RetryState& retryState() const { return retry_; }

    uint32_t persistFailures() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return persistFailures_;
    }

    void run()
    {
        panel_log(logTag_(), "started, refresh=%lu ms floor=%lu ms ceiling=%lu ms",
                   (unsigned long)policy_.refreshMs,
                   (unsigned long)policy_.backoffFloorMs,
                   (unsigned long)policy_.backoffCeilingMs);

        loadPreloaded_();

        while (!stop_.requested()) {
            FetchResult<T> r = fetch_();

            if (r.ok()) {
                publishSuccess_(r.value);

                if (persist_ && !persist_(r.value)) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ++persistFailures_;
                    panel_log(logTag_(), "persist failed (%lu so far), continuing",
                               (unsigned long)persistFailures_);
                }

                retry_.reset(policy_);
                waitFor_(policy_.refreshMs);
            } else {
                publishFailure_(r);
                const uint32_t wait = retry_.takeBackoff(policy_);
                panel_log(logTag_(), "fetch failed (%s: %s), retry #%lu in %lu ms",
                           fetch_error_name(r.error), r.message.c_str(),
                           (unsigned long)retry_.consecutiveFailures,
                           (unsigned long)wait);
                waitFor_(wait);
            }
        }

        panel_log(logTag_(), "stopped");
    }

private:
    const char* logTag_() const { return tag_.c_str(); }

    void loadPreloaded_()
    {
        if (!preload_) return;

        T seeded{};
        time_t savedAt = 0;
        if (!preload_(seeded, savedAt)) {
            panel_log(logTag_(), "no cached value to seed from");
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        value_.value = std::move(seeded);
        value_.ok = true;
        value_.stale = true;
        value_.lastSuccessTime = savedAt;
        value_.error = "(cache)";
        panel_log(logTag_(), "seeded from cache, saved at %ld", (long)savedAt);
    }

    void publishSuccess_(const T& v)
    {
        const time_t epoch = clock_.epochNow();
        const uint64_t mono = clock_.nowMs();

        std::lock_guard<std::mutex> lock(mutex_);
        value_.value = v;
        value_.ok = true;
        value_.stale = false;
        value_.lastSuccessTime = epoch;
        value_.error.clear();
        // 0 is reserved for "never fresh"
        freshSinceMs_ = mono ? mono : 1;
    }

    void publishFailure_(const FetchResult<T>& r)
    {
        std::string msg = r.message.empty() ? fetch_error_name(r.error) : r.message;
        if (msg.size() > MAX_ERROR_LEN) msg.resize(MAX_ERROR_LEN);

        std::lock_guard<std::mutex> lock(mutex_);
        value_.stale = true;
        value_.error = std::move(msg);
        freshSinceMs_ = 0;
    }

    // Sleeps in slices so a stop request is seen within SLEEP_SLICE_MS.
    void waitFor_(uint32_t ms)
    {
        const uint64_t end = clock_.nowMs() + ms;
        while (!stop_.requested()) {
            const uint64_t now = clock_.nowMs();
            if (now >= end) return;
            const uint64_t left = end - now;
            clock_.sleepMs(left < SLEEP_SLICE_MS ? (uint32_t)left : SLEEP_SLICE_MS);
        }
    }

    const char* name_;

    FetchFn fetch_;
    PersistFn persist_;
    PreloadFn preload_;
    RetryPolicy policy_;

    PollerClock& clock_;
    StopSignal& stop_;
    const std::string tag_;

    mutable std::mutex mutex_;
    CachedValue<T> value_;
    uint64_t freshSinceMs_ = 0;
    uint32_t persistFailures_ = 0;

    RetryState retry_;
};
