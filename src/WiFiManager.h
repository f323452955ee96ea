#pragma once
#include <stdint.h>
#include <stdbool.h>
#include <string>

#include "NetworkReachability.h"

enum WifiMgrState : uint8_t {
    WIFI_MGR_OFF = 0,
    WIFI_MGR_IDLE,
    WIFI_MGR_CONNECTING,
    WIFI_MGR_CONNECTED,
    WIFI_MGR_FAILED
};

void wifi_manager_begin();

// Start an async connection attempt (returns true if started).
// Credentials are copied.
bool wifi_manager_start_connect(const char* ssid, const char* password, uint32_t timeout_ms);

// Call from loop(). Drives the attempt and reconnects after a drop or a
// failed attempt, every retry_ms.
void wifi_manager_tick(uint32_t retry_ms = 30000);

// Abort / power down
void wifi_manager_disconnect(bool power_off = true);

WifiMgrState wifi_manager_state();
int8_t wifi_manager_rssi();

// Helper
bool wifi_manager_is_connected();

// Reachability probe backed by the station interface.
class WiFiConnectivityProbe : public ConnectivityProbe {
public:
    bool linkUp() override;
    bool tcpConnect(const std::string& host, uint16_t port, uint32_t timeoutMs) override;
    std::string localIp() override;
    int8_t rssi() override;
};
