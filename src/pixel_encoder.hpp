// Color packing for the controller's interface pixel formats
#pragma once
#include <cstdint>
#include "rm690b0/types.hpp"

namespace rm690b0 {

// Writes bytes_per_pixel(mode) bytes for one color at `out`
using PixelEncoder = void (*)(Rgb888 color, uint8_t* out);

void encode_rgb888(Rgb888 color, uint8_t* out);
// 18-bit: six significant bits per channel, MSB aligned
void encode_rgb666(Rgb888 color, uint8_t* out);
// Big-endian RRRRRGGG GGGBBBBB
void encode_rgb565(Rgb888 color, uint8_t* out);
// BT.601 luma, weights sum to 256
void encode_gray8(Rgb888 color, uint8_t* out);

PixelEncoder encoder_for(ColorMode mode);

} // namespace rm690b0
