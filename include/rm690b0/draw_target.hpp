#pragma once

#include <cstddef>
#include <cstdint>
#include "types.hpp"

namespace rm690b0 {

// Abstract drawing surface fed by graphics code. Drawing never fails:
// pixels outside size() are clipped by the implementation.
class DrawTarget {
public:
    virtual ~DrawTarget() = default;
    virtual void draw_pixel(const Pixel& pixel) = 0;
    virtual Size size() const = 0;

    // Clipped rectangle fill; the default goes pixel by pixel
    virtual void fill_solid(const Rect& area, Rgb888 color);

    void clear(Rgb888 color) {
        Size s = size();
        fill_solid(Rect{0, 0, s.width, s.height}, color);
    }

    void draw_iter(const Pixel* pixels, size_t count) {
        for (size_t i = 0; i < count; ++i) draw_pixel(pixels[i]);
    }

    template <typename It>
    void draw_iter(It first, It last) {
        for (; first != last; ++first) draw_pixel(*first);
    }
};

} // namespace rm690b0
