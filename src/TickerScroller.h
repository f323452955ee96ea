#pragma once

#include <stdint.h>
#include <string>

// Scroll position of the ticker band. The renderer measures the text once
// and asks for the x offset each frame.
class TickerScroller {
public:
    static constexpr int GAP_PX = 30;

    // New text restarts the scroll from the right edge.
    void setText(const std::string& text);
    const std::string& text() const { return text_; }

    void step(float speedPxPerSec, uint64_t nowMs);

    // Text width in pixels as measured by the renderer; -1 = not measured.
    void setTextWidth(int widthPx) { textWidth_ = widthPx; }
    int textWidth() const { return textWidth_; }

    // Left x of the first copy for a band of bandWidth pixels. Further
    // copies repeat every textWidth() + GAP_PX.
    int firstX(int bandWidth) const;

private:
    std::string text_ = "INIT";
    float offset_ = 0.0f;
    uint64_t lastMs_ = 0;
    int textWidth_ = -1;
};
