#include "WiFiManager.h"
#include <WiFi.h>
#include <Arduino.h>

#include "Log.h"

static constexpr const char* TAG = "WiFi";

static volatile WifiMgrState g_state = WIFI_MGR_IDLE;
static volatile int8_t g_rssi = -127;

static uint32_t g_start_ms = 0;
static uint32_t g_timeout_ms = 0;
static uint32_t g_gave_up_ms = 0;

static std::string g_ssid;
static std::string g_pass;

// prevent repeated mode() calls
static bool g_wifi_started = false;


void wifi_manager_begin() {
    g_state = WIFI_MGR_IDLE;
    WiFi.persistent(false);
    WiFi.setAutoReconnect(false);   // reconnects are driven from tick()
}

static void kick_connect() {
    if (!g_wifi_started) {
        WiFi.mode(WIFI_STA);
        g_wifi_started = true;
    }

    g_start_ms = millis();
    // returns immediately
    WiFi.begin(g_ssid.c_str(), g_pass.c_str());
    g_state = WIFI_MGR_CONNECTING;
    panel_log(TAG, "connecting to '%s'", g_ssid.c_str());
}

bool wifi_manager_start_connect(const char* ssid, const char* password, uint32_t timeout_ms) {
    if (!ssid || !ssid[0]) {
        panel_log(TAG, "no SSID configured, staying offline");
        g_state = WIFI_MGR_FAILED;
        return false;
    }

    g_ssid = ssid;
    g_pass = password ? password : "";
    g_timeout_ms = timeout_ms;

    // If already connected, don't restart.
    if (WiFi.status() == WL_CONNECTED) {
        g_state = WIFI_MGR_CONNECTED;
        g_rssi = (int8_t)WiFi.RSSI();
        return true;
    }

    kick_connect();
    return true;
}

static void give_up(const char* why) {
    WiFi.disconnect(true);
    WiFi.mode(WIFI_OFF);
    g_wifi_started = false;

    g_state = WIFI_MGR_FAILED;
    g_rssi = -127;
    g_gave_up_ms = millis();
    panel_log(TAG, "%s", why);
}

void wifi_manager_tick(uint32_t retry_ms) {
    switch (g_state) {
    case WIFI_MGR_CONNECTING: {
        const wl_status_t st = WiFi.status();

        if (st == WL_CONNECTED) {
            g_state = WIFI_MGR_CONNECTED;
            g_rssi = (int8_t)WiFi.RSSI();
            panel_log(TAG, "connected, ip %s rssi %d",
                       WiFi.localIP().toString().c_str(), (int)g_rssi);
            return;
        }

        // hard-failed fast
        if (st == WL_CONNECT_FAILED || st == WL_NO_SSID_AVAIL) {
            give_up(st == WL_NO_SSID_AVAIL ? "SSID not found" : "connect failed");
            return;
        }

        if ((millis() - g_start_ms) >= g_timeout_ms) {
            give_up("connect timed out");
        }
        return;
    }

    case WIFI_MGR_CONNECTED:
        if (WiFi.status() != WL_CONNECTED) {
            panel_log(TAG, "link lost, reconnecting");
            kick_connect();
        } else {
            g_rssi = (int8_t)WiFi.RSSI();
        }
        return;

    case WIFI_MGR_FAILED:
        if (!g_ssid.empty() && (millis() - g_gave_up_ms) >= retry_ms) {
            kick_connect();
        }
        return;

    case WIFI_MGR_OFF:
    case WIFI_MGR_IDLE:
        return;
    }
}

void wifi_manager_disconnect(bool power_off) {
    WiFi.disconnect(true);
    if (power_off) {
        WiFi.mode(WIFI_OFF);
        g_wifi_started = false;
    }
    g_state = WIFI_MGR_OFF;
    g_rssi = -127;
}

WifiMgrState wifi_manager_state() { return g_state; }
int8_t wifi_manager_rssi() { return g_rssi; }

bool wifi_manager_is_connected() {
    return WiFi.status() == WL_CONNECTED;
}

// ---- reachability probe ----

bool WiFiConnectivityProbe::linkUp() {
    return wifi_manager_is_connected();
}

bool WiFiConnectivityProbe::tcpConnect(const std::string& host, uint16_t port, uint32_t timeoutMs) {
    WiFiClient client;
    const bool ok = client.connect(host.c_str(), port, (int32_t)timeoutMs) == 1;
    client.stop();
    return ok;
}

std::string WiFiConnectivityProbe::localIp() {
    return WiFi.localIP().toString().c_str();
}

int8_t WiFiConnectivityProbe::rssi() {
    return (int8_t)WiFi.RSSI();
}
