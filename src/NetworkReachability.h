#pragma once

#include <stdint.h>
#include <string>

#include "CachedValue.h"
#include "PanelData.h"
#include "Poller.h"

// Board side of the reachability check. The firmware implements it on top of
// the WiFi manager; tests script it.
class ConnectivityProbe {
public:
    virtual ~ConnectivityProbe() {}

    // Station associated with an AP.
    virtual bool linkUp() = 0;

    // Bounded TCP connect, closed straight away.
    virtual bool tcpConnect(const std::string& host, uint16_t port, uint32_t timeoutMs) = 0;

    virtual std::string localIp() = 0;
    virtual int8_t rssi() = 0;
};

struct ReachabilityConfig {
    std::string host = "223.5.5.5";
    uint16_t port = 53;
    uint32_t connectTimeoutMs = 1500;
    uint32_t refreshMs = 10000;
};

// Publishes {online, ip, rssi}. An unreachable host is a normal value
// (online=false), not a fetch failure, so the check keeps its cadence and
// never backs off. Nothing is persisted.
class NetworkReachability {
public:
    NetworkReachability(ConnectivityProbe& probe,
                        ReachabilityConfig cfg,
                        PollerClock& clock,
                        StopSignal& stop);

    void run() { poller_.run(); }
    CachedValue<NetworkStatus> snapshot() const { return poller_.snapshot(); }
    Poller<NetworkStatus>& poller() { return poller_; }

    FetchResult<NetworkStatus> probeOnce();

private:
    static RetryPolicy policyFor_(const ReachabilityConfig& cfg);

    ConnectivityProbe& probe_;
    const ReachabilityConfig cfg_;
    bool lastOnline_ = false;

    Poller<NetworkStatus> poller_;
};
