#pragma once

#include <cstddef>
#include <cstdint>

namespace rm690b0 {

// Panel dimensions in pixels
struct DisplaySize {
    uint16_t width{0};
    uint16_t height{0};

    constexpr DisplaySize() = default;
    constexpr DisplaySize(uint16_t w, uint16_t h) : width(w), height(h) {}
};

// Interface pixel formats the RM690B0 accepts on its memory write path
enum class ColorMode : uint8_t {
    Rgb565,
    Rgb888,
    Rgb666,
    Gray8,
};

constexpr size_t bytes_per_pixel(ColorMode mode) {
    switch (mode) {
        case ColorMode::Rgb565: return 2;
        case ColorMode::Rgb888: return 3;
        case ColorMode::Rgb666: return 3;
        case ColorMode::Gray8:  return 1;
    }
    return 0;
}

// COLMOD (0x3A) parameter for each mode
constexpr uint8_t colmod_value(ColorMode mode) {
    switch (mode) {
        case ColorMode::Rgb565: return 0x55;
        case ColorMode::Rgb888: return 0x77;
        case ColorMode::Rgb666: return 0x66;
        case ColorMode::Gray8:  return 0x11;
    }
    return 0x77;
}

const char* to_string(ColorMode mode);

// Bytes needed for one full frame; usable to size static storage.
constexpr size_t framebuffer_size(DisplaySize display, ColorMode color) {
    return static_cast<size_t>(display.width) * static_cast<size_t>(display.height) * bytes_per_pixel(color);
}

struct Rgb888 {
    uint8_t r{0}, g{0}, b{0};
};

constexpr bool operator==(const Rgb888& a, const Rgb888& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
constexpr bool operator!=(const Rgb888& a, const Rgb888& b) { return !(a == b); }

constexpr Rgb888 kBlack{0x00, 0x00, 0x00};
constexpr Rgb888 kWhite{0xFF, 0xFF, 0xFF};
constexpr Rgb888 kRed{0xFF, 0x00, 0x00};
constexpr Rgb888 kGreen{0x00, 0xFF, 0x00};
constexpr Rgb888 kBlue{0x00, 0x00, 0xFF};

// Signed so that shapes may extend past the visible area
struct Point {
    int32_t x{0}, y{0};
};

struct Size {
    uint32_t width{0}, height{0};
};

struct Pixel {
    Point point;
    Rgb888 color;
};

struct Rect {
    int32_t x{0}, y{0};
    uint32_t w{0}, h{0};
};

// Inclusive controller address window
struct Window {
    uint16_t x_start{0}, y_start{0};
    uint16_t x_end{0}, y_end{0};
};

} // namespace rm690b0
