#pragma once

#include <stdint.h>

class Arduino_GFX;

// Panel-level controls that are not page drawing: the ST7789 sleep state and
// the PWM backlight. Brightness is in percent, as in /settings.json.
class DisplayManager
{
public:
  static DisplayManager& instance();

  // After gfx->begin(). A negative pin means a fixed backlight; levels are
  // then only remembered.
  void begin(Arduino_GFX* gfx, int backlightPin);

  void setBrightnessPercent(uint8_t percent);
  uint8_t brightnessPercent() const { return percent_; }

  // Non-blocking ramp from the current level; driven by tick().
  void rampTo(uint8_t percent, uint16_t durationMs);
  bool ramping() const { return rampMs_ != 0; }
  void tick();

  // Backlight dark and panel in sleep-in. Used on the way to deep sleep.
  void powerDown();

  static uint8_t levelFor(uint8_t percent);

private:
  DisplayManager() = default;

  void writeLevel_(uint8_t percent);

  Arduino_GFX* gfx_ = nullptr;
  int blPin_ = -1;
  bool panelAwake_ = true;

  uint8_t percent_ = 100;

  uint8_t rampFrom_ = 0;
  uint8_t rampTo_ = 0;
  uint32_t rampStartMs_ = 0;
  uint16_t rampMs_ = 0;   // 0 = idle
};
