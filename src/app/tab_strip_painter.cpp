#include "tab_strip_painter.hpp"

#include <tabhost/logger.hpp>

#include <algorithm>

#include "../host/host_session.hpp"

// Xlib last: it defines macros such as None.
#include <X11/Xlib.h>

namespace tabhost
{

namespace
{

uint32_t shade(uint32_t rgb, int delta)
{
    auto channel = [&](int shift)
    {
        int value = static_cast<int>((rgb >> shift) & 0xff) + delta;
        return static_cast<uint32_t>(std::clamp(value, 0, 255)) << shift;
    };
    return channel(16) | channel(8) | channel(0);
}

constexpr uint32_t TEXT_ACTIVE   = 0xc0caf5;
constexpr uint32_t TEXT_INACTIVE = 0x787c99;
constexpr uint32_t ERROR_FILL    = 0xf7768e;
constexpr uint32_t ERROR_TEXT    = 0x1a1b26;
constexpr int      BANNER_HEIGHT = 24;
constexpr int      TEXT_PADDING  = 10;

}   // namespace

struct TabStripPainter::Resources
{
    GC           gc   = nullptr;
    XFontStruct* font = nullptr;
};

TabStripPainter::TabStripPainter(Display* display, unsigned long window, uint32_t background_color)
    : display_(display), window_(window), res_(std::make_unique<Resources>()), background_(background_color)
{
    if (!display_ || !window_)
        return;

    res_->gc   = XCreateGC(display_, window_, 0, nullptr);
    res_->font = XLoadQueryFont(display_, "fixed");
    if (res_->font)
        XSetFont(display_, res_->gc, res_->font->fid);
    else
        TABHOST_LOG_WARN("painter", "Font 'fixed' not available, tab labels use the server default");
}

TabStripPainter::~TabStripPainter()
{
    if (!display_)
        return;
    if (res_->font)
        XFreeFont(display_, res_->font);
    if (res_->gc)
        XFreeGC(display_, res_->gc);
}

void TabStripPainter::fill(uint32_t rgb, int x, int y, int width, int height)
{
    if (width <= 0 || height <= 0)
        return;
    XSetForeground(display_, res_->gc, rgb);
    XFillRectangle(display_,
                   window_,
                   res_->gc,
                   x,
                   y,
                   static_cast<unsigned int>(width),
                   static_cast<unsigned int>(height));
}

void TabStripPainter::line(uint32_t rgb, int x1, int y1, int x2, int y2)
{
    XSetForeground(display_, res_->gc, rgb);
    XDrawLine(display_, window_, res_->gc, x1, y1, x2, y2);
}

void TabStripPainter::text(uint32_t rgb, int x, int y, int max_width, const std::string& str)
{
    if (str.empty() || max_width <= 0)
        return;

    // Drop characters from the end until the label fits.
    int len = static_cast<int>(str.size());
    if (res_->font)
    {
        while (len > 0 && XTextWidth(res_->font, str.data(), len) > max_width)
            --len;
    }
    if (len <= 0)
        return;

    int ascent  = res_->font ? res_->font->ascent : 10;
    int descent = res_->font ? res_->font->descent : 3;

    XSetForeground(display_, res_->gc, rgb);
    XDrawString(display_, window_, res_->gc, x, y + (ascent - descent) / 2, str.data(), len);
}

void TabStripPainter::paint(const HostSession& session, int width, int height)
{
    if (!display_ || !window_ || !res_->gc)
        return;

    const int strip_height = TabStripLayout::STRIP_HEIGHT;
    fill(background_, 0, strip_height, width, height - strip_height);
    fill(shade(background_, -12), 0, 0, width, strip_height);

    const TabManager&     tabs   = session.tabs();
    const TabStripLayout  layout = session.layout();
    const auto&           drag   = tabs.drag_state();
    const bool            drag_active = drag && drag->is_active();

    auto draw_tab = [&](size_t index, int left)
    {
        const bool selected = index == tabs.selected_index();
        const int  w        = layout.tab_width();
        const Rect close    = layout.close_rect(index);
        const int  close_x  = close.x - layout.tab_left(index) + left;

        fill(selected ? shade(background_, 18) : shade(background_, -4), left + 1, 2, w - 2, strip_height - 2);
        text(selected ? TEXT_ACTIVE : TEXT_INACTIVE,
             left + TEXT_PADDING,
             strip_height / 2,
             close_x - left - TEXT_PADDING - 4,
             tabs.tab_label(index));

        const uint32_t cross = selected ? TEXT_ACTIVE : TEXT_INACTIVE;
        line(cross, close_x + 4, close.y + 4, close_x + close.width - 4, close.y + close.height - 4);
        line(cross, close_x + close.width - 4, close.y + 4, close_x + 4, close.y + close.height - 4);
    };

    for (size_t i = 0; i < tabs.count(); ++i)
    {
        if (drag_active && i == drag->tab_index)
            continue;
        draw_tab(i, layout.tab_left(i));
    }
    // The dragged tab floats above its neighbours.
    if (drag_active && drag->tab_index < tabs.count())
        draw_tab(drag->tab_index, drag->visual_x());

    const Rect plus = layout.new_tab_rect();
    const int  cx   = plus.x + plus.width / 2;
    const int  cy   = plus.y + plus.height / 2;
    line(TEXT_INACTIVE, cx - 6, cy, cx + 6, cy);
    line(TEXT_INACTIVE, cx, cy - 6, cx, cy + 6);

    if (!session.error_message().empty())
    {
        fill(ERROR_FILL, 0, strip_height, width, BANNER_HEIGHT);
        text(ERROR_TEXT,
             TEXT_PADDING,
             strip_height + BANNER_HEIGHT / 2,
             width - 2 * TEXT_PADDING,
             session.error_message());
    }

    XFlush(display_);
}

}   // namespace tabhost
