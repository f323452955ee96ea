#include "SettingsManager.h"

#include <Arduino.h>
#include <LittleFS.h>
#include <string>

#include "Log.h"

static constexpr const char* TAG = "Settings";

static const char* filePath = "/settings.json";
PanelConfig currentSettings;


bool loadSettingsDataFromFile(const char* filePath, PanelConfig& settings)
{
    File file = LittleFS.open(filePath, FILE_READ);
    if (!file) {
        panel_log(TAG, "failed to open %s for reading", filePath);
        return false;
    }

    std::string text;
    text.reserve(file.size());
    while (file.available()) {
        uint8_t buf[128];
        const size_t n = file.read(buf, sizeof(buf));
        if (n == 0) break;
        text.append((const char*)buf, n);
    }
    file.close();

    std::string err;
    if (!parsePanelConfig(text, settings, &err)) {
        panel_log(TAG, "failed to parse %s: %s, using defaults", filePath, err.c_str());
        return false;
    }

    panel_log(TAG, "settings loaded from %s", filePath);
    return true;
}


bool saveDefaultSettingsFile(const char* filePath)
{
    File file = LittleFS.open(filePath, FILE_WRITE);
    if (!file) {
        panel_log(TAG, "failed to open %s for writing", filePath);
        return false;
    }

    const std::string text = defaultSettingsJson();
    const size_t n = file.write((const uint8_t*)text.data(), text.size());
    file.close();

    if (n != text.size()) {
        panel_log(TAG, "short write on %s (%u of %u bytes)", filePath, (unsigned)n, (unsigned)text.size());
        return false;
    }
    panel_log(TAG, "default settings written to %s", filePath);
    return true;
}


void initializeSettingsData()
{
    currentSettings = PanelConfig();

    if (!LittleFS.exists(filePath)) {
        panel_log(TAG, "%s does not exist, creating a default file", filePath);
        if (!saveDefaultSettingsFile(filePath)) {
            panel_log(TAG, "running on built-in defaults");
        }
        return;
    }

    if (!loadSettingsDataFromFile(filePath, currentSettings)) {
        currentSettings = PanelConfig();
    }
}
