#include "DisplayManager.h"

#include <Arduino.h>
#include <Arduino_GFX_Library.h>

#include "Log.h"

static constexpr const char* TAG = "Display";

static constexpr uint32_t BL_PWM_FREQ = 5000;
static constexpr uint8_t  BL_PWM_BITS = 8;

DisplayManager& DisplayManager::instance()
{
  static DisplayManager inst;
  return inst;
}

uint8_t DisplayManager::levelFor(uint8_t percent)
{
  if(percent > 100) percent = 100;
  return (uint8_t)((percent * 255UL) / 100UL);
}

void DisplayManager::begin(Arduino_GFX* gfx, int backlightPin)
{
  gfx_ = gfx;
  blPin_ = backlightPin;

  if(blPin_ >= 0 && !ledcAttach(blPin_, BL_PWM_FREQ, BL_PWM_BITS)) {
    panel_log(TAG, "ledcAttach(%d) failed, backlight stays at full", blPin_);
    blPin_ = -1;
  }

  if(gfx_) gfx_->displayOn();
  panelAwake_ = true;
  writeLevel_(percent_);
}

void DisplayManager::setBrightnessPercent(uint8_t percent)
{
  rampMs_ = 0;
  percent_ = percent > 100 ? 100 : percent;
  writeLevel_(percent_);
}

void DisplayManager::rampTo(uint8_t percent, uint16_t durationMs)
{
  if(percent > 100) percent = 100;
  if(durationMs == 0) {
    setBrightnessPercent(percent);
    return;
  }
  rampFrom_ = percent_;
  rampTo_ = percent;
  rampStartMs_ = millis();
  rampMs_ = durationMs;
}

void DisplayManager::tick()
{
  if(rampMs_ == 0) return;

  const uint32_t elapsed = millis() - rampStartMs_;
  if(elapsed >= rampMs_) {
    rampMs_ = 0;
    percent_ = rampTo_;
    writeLevel_(percent_);
    return;
  }

  const int span = (int)rampTo_ - (int)rampFrom_;
  const uint8_t p = (uint8_t)((int)rampFrom_ + span * (int)elapsed / (int)rampMs_);
  if(p != percent_) {
    percent_ = p;
    writeLevel_(percent_);
  }
}

void DisplayManager::powerDown()
{
  rampMs_ = 0;
  if(blPin_ >= 0) ledcWrite(blPin_, 0);
  if(gfx_) gfx_->displayOff();
  panelAwake_ = false;
  panel_log(TAG, "panel off");
}

void DisplayManager::writeLevel_(uint8_t percent)
{
  if(blPin_ < 0 || !panelAwake_) return;
  ledcWrite(blPin_, levelFor(percent));
}
