#include "pixel_encoder.hpp"

namespace rm690b0 {

void encode_rgb888(Rgb888 c, uint8_t* out) {
    out[0] = c.r;
    out[1] = c.g;
    out[2] = c.b;
}

void encode_rgb666(Rgb888 c, uint8_t* out) {
    out[0] = c.r & 0xFC;
    out[1] = c.g & 0xFC;
    out[2] = c.b & 0xFC;
}

void encode_rgb565(Rgb888 c, uint8_t* out) {
    out[0] = static_cast<uint8_t>((c.r & 0xF8) | (c.g >> 5));
    out[1] = static_cast<uint8_t>(((c.g & 0x1C) << 3) | (c.b >> 3));
}

void encode_gray8(Rgb888 c, uint8_t* out) {
    uint32_t luma = 77u * c.r + 150u * c.g + 29u * c.b;
    out[0] = static_cast<uint8_t>(luma >> 8);
}

PixelEncoder encoder_for(ColorMode mode) {
    switch (mode) {
        case ColorMode::Rgb565: return &encode_rgb565;
        case ColorMode::Rgb666: return &encode_rgb666;
        case ColorMode::Gray8:  return &encode_gray8;
        case ColorMode::Rgb888: break;
    }
    return &encode_rgb888;
}

} // namespace rm690b0
