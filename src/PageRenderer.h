#pragma once

#include <stdint.h>
#include <string>

#include "PageContent.h"
#include "SnapshotBuilder.h"
#include "TickerScroller.h"

class Arduino_Canvas;

// Draws one full frame (page body + ticker band) into the off-screen canvas
// and flushes it to the panel. Only called from the render loop.
class PageRenderer
{
public:
    PageRenderer(Arduino_Canvas* canvas, int tickerHeight, float tickerSpeedPxPerS);

    void render(PageKind page,
                const Snapshot& snap,
                bool alertActive,
                const std::string& tickerText,
                uint64_t nowMs);

private:
    void drawHeader_(const std::string& title, const std::string& marker);
    void drawLines_(const PageText& text, bool wrap);
    void drawClock_(const Snapshot& snap, bool alertActive);
    void drawPet_(int cx, int cy, int r, PetMood mood);
    void drawTicker_(const std::string& text, uint64_t nowMs);
    int  textWidth_(const std::string& text);

    Arduino_Canvas* canvas_;
    const int width_;
    const int height_;
    const int tickerHeight_;
    const float tickerSpeed_;

    TickerScroller ticker_;
};
