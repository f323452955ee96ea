#pragma once

#include "PanelConfig.h"

// Loaded once in setup(), read-only afterwards.
extern PanelConfig currentSettings;

// Reads /settings.json into settings. A malformed file leaves the defaults
// in place.
bool loadSettingsDataFromFile(const char* filePath, PanelConfig& settings);

// Writes the default settings document (first boot).
bool saveDefaultSettingsFile(const char* filePath);

// Loads /settings.json into currentSettings, creating it on first boot.
// LittleFS must be mounted.
void initializeSettingsData();
