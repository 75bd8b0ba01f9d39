#include "rm690b0/draw_target.hpp"

namespace rm690b0 {

void DrawTarget::fill_solid(const Rect& area, Rgb888 color) {
    Size s = size();
    int64_t x0 = area.x < 0 ? 0 : area.x;
    int64_t y0 = area.y < 0 ? 0 : area.y;
    int64_t x1 = static_cast<int64_t>(area.x) + area.w;
    int64_t y1 = static_cast<int64_t>(area.y) + area.h;
    if (x1 > s.width) x1 = s.width;
    if (y1 > s.height) y1 = s.height;
    for (int64_t y = y0; y < y1; ++y) {
        for (int64_t x = x0; x < x1; ++x) {
            draw_pixel(Pixel{Point{static_cast<int32_t>(x), static_cast<int32_t>(y)}, color});
        }
    }
}

} // namespace rm690b0
