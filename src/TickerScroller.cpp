#include "TickerScroller.h"

#include <math.h>

void TickerScroller::setText(const std::string& text)
{
    if (text == text_) return;
    text_ = text;
    textWidth_ = -1;
    offset_ = 0.0f;
}

void TickerScroller::step(float speedPxPerSec, uint64_t nowMs)
{
    if (lastMs_ == 0) {
        lastMs_ = nowMs;
        return;
    }
    const float dt = (float)(nowMs - lastMs_) / 1000.0f;
    lastMs_ = nowMs;
    offset_ += speedPxPerSec * dt;

    // Keep the float small so precision does not drift on a long uptime.
    if (textWidth_ >= 0) {
        const float total = (float)(textWidth_ + GAP_PX);
        offset_ = fmodf(offset_, total);
    }
}

int TickerScroller::firstX(int bandWidth) const
{
    if (textWidth_ < 0) return bandWidth;
    const float total = (float)(textWidth_ + GAP_PX);
    const float off = fmodf(offset_, total);
    return bandWidth - (int)off;
}
