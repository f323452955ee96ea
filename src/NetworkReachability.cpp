#include "NetworkReachability.h"

#include <utility>

#include "Log.h"

static constexpr const char* TAG = "Reachability";

NetworkReachability::NetworkReachability(ConnectivityProbe& probe,
                                         ReachabilityConfig cfg,
                                         PollerClock& clock,
                                         StopSignal& stop)
: probe_(probe),
  cfg_(std::move(cfg)),
  poller_("network", [this]() { return probeOnce(); }, policyFor_(cfg_), clock, stop)
{
}

RetryPolicy NetworkReachability::policyFor_(const ReachabilityConfig& cfg)
{
    RetryPolicy p;
    p.refreshMs = cfg.refreshMs;
    p.backoffFloorMs = cfg.refreshMs;
    p.backoffCeilingMs = cfg.refreshMs;
    return p;
}

FetchResult<NetworkStatus> NetworkReachability::probeOnce()
{
    NetworkStatus st;

    if (probe_.linkUp()) {
        st.ip = probe_.localIp();
        st.rssi = probe_.rssi();
        st.online = probe_.tcpConnect(cfg_.host, cfg_.port, cfg_.connectTimeoutMs);
    }

    if (st.online != lastOnline_) {
        panel_log(TAG, "%s (ip %s, rssi %d)", st.online ? "online" : "offline",
                   st.ip.c_str(), (int)st.rssi);
        lastOnline_ = st.online;
    }
    return FetchResult<NetworkStatus>::success(std::move(st));
}
