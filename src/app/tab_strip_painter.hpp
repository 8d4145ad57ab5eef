#pragma once

#include <cstdint>
#include <memory>
#include <string>

typedef struct _XDisplay Display;

namespace tabhost
{

class HostSession;

// Draws the tab strip, the error banner and the empty content background
// straight onto the host window with Xlib core drawing.
class TabStripPainter
{
   public:
    TabStripPainter(Display* display, unsigned long window, uint32_t background_color);
    ~TabStripPainter();

    TabStripPainter(const TabStripPainter&)            = delete;
    TabStripPainter& operator=(const TabStripPainter&) = delete;

    void set_background_color(uint32_t rgb) { background_ = rgb; }

    void paint(const HostSession& session, int width, int height);

   private:
    struct Resources;   // GC and font, kept out of this header with Xlib

    void fill(uint32_t rgb, int x, int y, int width, int height);
    void line(uint32_t rgb, int x1, int y1, int x2, int y2);
    void text(uint32_t rgb, int x, int y, int max_width, const std::string& str);

    Display*                   display_ = nullptr;
    unsigned long              window_  = 0;
    std::unique_ptr<Resources> res_;
    uint32_t                   background_;
};

}   // namespace tabhost
