#include "PageRenderer.h"

#include <Arduino.h>
#include <Arduino_GFX_Library.h>
#include <U8g2lib.h>

// RGB565
static constexpr uint16_t COL_BG      = 0x0000;
static constexpr uint16_t COL_TEXT    = 0xFFFF;
static constexpr uint16_t COL_DIM     = 0x8410;
static constexpr uint16_t COL_ACCENT  = 0x05FF;
static constexpr uint16_t COL_WARN    = 0xFE60;
static constexpr uint16_t COL_ERROR   = 0xF800;
static constexpr uint16_t COL_HEADER  = 0x18E3;
static constexpr uint16_t COL_TICKER  = 0x10A2;
static constexpr uint16_t COL_PET     = 0xFEA0;

static constexpr int HEADER_H = 24;
static constexpr int MARGIN   = 6;
static constexpr int LINE_H   = 18;

#define FONT_BODY   u8g2_font_wqy12_t_gb2312
#define FONT_TITLE  u8g2_font_wqy16_t_gb2312
#define FONT_CLOCK  u8g2_font_logisoso42_tn
#define FONT_SMALL  u8g2_font_6x12_tf

PageRenderer::PageRenderer(Arduino_Canvas* canvas, int tickerHeight, float tickerSpeedPxPerS)
: canvas_(canvas),
  width_(canvas->width()),
  height_(canvas->height()),
  tickerHeight_(tickerHeight > 0 ? tickerHeight : 24),
  tickerSpeed_(tickerSpeedPxPerS)
{
}

int PageRenderer::textWidth_(const std::string& text)
{
    int16_t x1 = 0, y1 = 0;
    uint16_t w = 0, h = 0;
    canvas_->getTextBounds(text.c_str(), 0, 0, &x1, &y1, &w, &h);
    return (int)w;
}

void PageRenderer::render(PageKind page,
                          const Snapshot& snap,
                          bool alertActive,
                          const std::string& tickerText,
                          uint64_t nowMs)
{
    canvas_->fillScreen(COL_BG);
    canvas_->setUTF8Print(true);
    canvas_->setTextSize(1);

    switch (page) {
    case PageKind::Clock:
        drawClock_(snap, alertActive);
        break;
    case PageKind::Weather:
        drawLines_(weather_page_text(snap), false);
        break;
    case PageKind::Status:
        drawLines_(status_page_text(snap), false);
        break;
    case PageKind::Quotes:
        drawLines_(quote_page_text(snap), true);
        break;
    }

    drawTicker_(tickerText, nowMs);
    canvas_->flush();
}

// ---- pieces ----

void PageRenderer::drawHeader_(const std::string& title, const std::string& marker)
{
    canvas_->fillRect(0, 0, width_, HEADER_H, COL_HEADER);
    canvas_->setTextWrap(false);
    canvas_->setFont(FONT_TITLE);
    canvas_->setTextColor(COL_TEXT);
    canvas_->setCursor(MARGIN, HEADER_H - 5);
    canvas_->print(title.c_str());

    if (!marker.empty()) {
        canvas_->setFont(FONT_SMALL);
        canvas_->setTextColor(marker == "n/a" ? COL_ERROR : COL_WARN);
        canvas_->setCursor(width_ - MARGIN - textWidth_(marker), HEADER_H - 7);
        canvas_->print(marker.c_str());
    }
}

void PageRenderer::drawLines_(const PageText& text, bool wrap)
{
    drawHeader_(text.title, text.marker);

    const int bottom = height_ - tickerHeight_;
    canvas_->setFont(FONT_BODY);
    canvas_->setTextWrap(wrap);

    int y = HEADER_H + LINE_H;
    for (const std::string& line : text.lines) {
        if (y > bottom - 4) break;
        const bool isError = line.compare(0, 5, "err: ") == 0;
        canvas_->setTextColor(isError ? COL_ERROR : COL_TEXT);
        canvas_->setCursor(MARGIN, y);
        canvas_->print(line.c_str());
        // wrapped text moves the cursor down by itself
        y = (wrap ? canvas_->getCursorY() : y) + LINE_H;
    }
    canvas_->setTextWrap(false);
}

void PageRenderer::drawClock_(const Snapshot& snap, bool alertActive)
{
    const ClockText c = clock_page_text(snap);

    canvas_->setTextWrap(false);

    canvas_->setFont(FONT_CLOCK);
    canvas_->setTextColor(c.synced ? COL_TEXT : COL_DIM);
    const int tw = textWidth_(c.time);
    canvas_->setCursor((width_ - tw) / 2 - 8, 70);
    canvas_->print(c.time.c_str());

    canvas_->setFont(FONT_SMALL);
    canvas_->setTextColor(COL_DIM);
    canvas_->setCursor((width_ + tw) / 2 - 4, 70);
    canvas_->print(c.seconds.c_str());

    canvas_->setFont(FONT_BODY);
    canvas_->setTextColor(COL_ACCENT);
    const std::string dateLine = c.date + "  " + c.weekday;
    canvas_->setCursor((width_ - textWidth_(dateLine)) / 2, 96);
    canvas_->print(dateLine.c_str());

    if (!c.lunar.empty()) {
        canvas_->setTextColor(COL_TEXT);
        canvas_->setCursor((width_ - textWidth_(c.lunar)) / 2, 116);
        canvas_->print(c.lunar.c_str());
    }

    if (!c.synced) {
        canvas_->setFont(FONT_SMALL);
        canvas_->setTextColor(COL_WARN);
        canvas_->setCursor(MARGIN, 14);
        canvas_->print("time not synced");
    }

    const int petTop = 130;
    const int petBottom = height_ - tickerHeight_ - 8;
    const int r = (petBottom - petTop) / 2;
    drawPet_(width_ / 2, petTop + r, r > 60 ? 60 : r, pet_mood(snap, alertActive));
}

void PageRenderer::drawPet_(int cx, int cy, int r, PetMood mood)
{
    if (r < 10) return;

    canvas_->fillCircle(cx, cy, r, COL_PET);

    const int eyeDx = r / 3;
    const int eyeY = cy - r / 5;
    const int eyeR = r / 8 > 2 ? r / 8 : 2;

    switch (mood) {
    case PetMood::Happy:
        canvas_->fillCircle(cx - eyeDx, eyeY, eyeR, COL_BG);
        canvas_->fillCircle(cx + eyeDx, eyeY, eyeR, COL_BG);
        // smile: lower half of a ring
        for (int t = 0; t < 3; ++t) {
            canvas_->drawCircleHelper(cx, cy + r / 8, r / 2 - t, 0x4 | 0x8, COL_BG);
        }
        break;

    case PetMood::Offline:
        // crossed eyes
        for (int side = -1; side <= 1; side += 2) {
            const int ex = cx + side * eyeDx;
            canvas_->drawLine(ex - eyeR, eyeY - eyeR, ex + eyeR, eyeY + eyeR, COL_BG);
            canvas_->drawLine(ex - eyeR, eyeY + eyeR, ex + eyeR, eyeY - eyeR, COL_BG);
        }
        canvas_->drawFastHLine(cx - r / 4, cy + r / 2, r / 2, COL_BG);
        break;

    case PetMood::Alert:
        canvas_->fillCircle(cx - eyeDx, eyeY, eyeR + 2, COL_BG);
        canvas_->fillCircle(cx + eyeDx, eyeY, eyeR + 2, COL_BG);
        canvas_->fillCircle(cx - eyeDx, eyeY, eyeR / 2, COL_TEXT);
        canvas_->fillCircle(cx + eyeDx, eyeY, eyeR / 2, COL_TEXT);
        // open mouth
        canvas_->fillCircle(cx, cy + r / 2, r / 6, COL_BG);
        break;
    }
}

void PageRenderer::drawTicker_(const std::string& text, uint64_t nowMs)
{
    const int top = height_ - tickerHeight_;
    canvas_->fillRect(0, top, width_, tickerHeight_, COL_TICKER);

    canvas_->setFont(FONT_BODY);
    canvas_->setTextWrap(false);
    canvas_->setTextColor(text.compare(0, 6, "ALERT:") == 0 ? COL_ERROR
                          : text.compare(0, 5, "WARN:") == 0 ? COL_WARN
                                                             : COL_TEXT);

    ticker_.setText(text);
    if (ticker_.textWidth() < 0) ticker_.setTextWidth(textWidth_(text));
    ticker_.step(tickerSpeed_, nowMs);

    const int baseline = top + (tickerHeight_ + 12) / 2;
    const int period = ticker_.textWidth() + TickerScroller::GAP_PX;
    for (int x = ticker_.firstX(width_); x < width_; x += period) {
        canvas_->setCursor(x, baseline);
        canvas_->print(text.c_str());
    }
}
