/*
 * Unit tests for frame storage and pixel packing: framebuffer sizing per
 * color mode, static vs heap storage, and the per-mode byte encoders.
 */

#include "rm690b0/types.hpp"
#include "src/framebuffer.hpp"
#include "src/pixel_encoder.hpp"

#include <unity.h>
#include <utility>

using namespace rm690b0;

void setUp(void) {}
void tearDown(void) {}

// ===========================================================================
// Sizing
// ===========================================================================

void test_bytes_per_pixel_per_mode(void)
{
    TEST_ASSERT_EQUAL_UINT32(2, bytes_per_pixel(ColorMode::Rgb565));
    TEST_ASSERT_EQUAL_UINT32(3, bytes_per_pixel(ColorMode::Rgb888));
    TEST_ASSERT_EQUAL_UINT32(3, bytes_per_pixel(ColorMode::Rgb666));
    TEST_ASSERT_EQUAL_UINT32(1, bytes_per_pixel(ColorMode::Gray8));
}

void test_framebuffer_size_every_mode(void)
{
    const DisplaySize d{17, 9};
    const ColorMode modes[] = {ColorMode::Rgb565, ColorMode::Rgb888, ColorMode::Rgb666, ColorMode::Gray8};
    for (ColorMode m : modes) {
        TEST_ASSERT_EQUAL_UINT32(17u * 9u * bytes_per_pixel(m), framebuffer_size(d, m));
    }
}

void test_framebuffer_size_t4_panel(void)
{
    static_assert(framebuffer_size(DisplaySize{450, 600}, ColorMode::Rgb888) == 810000, "usable in constant expressions");
    TEST_ASSERT_EQUAL_UINT32(810000, framebuffer_size(DisplaySize{450, 600}, ColorMode::Rgb888));
}

void test_colmod_values(void)
{
    TEST_ASSERT_EQUAL_HEX8(0x55, colmod_value(ColorMode::Rgb565));
    TEST_ASSERT_EQUAL_HEX8(0x77, colmod_value(ColorMode::Rgb888));
    TEST_ASSERT_EQUAL_HEX8(0x66, colmod_value(ColorMode::Rgb666));
    TEST_ASSERT_EQUAL_HEX8(0x11, colmod_value(ColorMode::Gray8));
}

// ===========================================================================
// Storage
// ===========================================================================

void test_allocate_is_zero_filled(void)
{
    Framebuffer fb = Framebuffer::allocate(64);
    TEST_ASSERT_FALSE(fb.empty());
    TEST_ASSERT_TRUE(fb.is_heap());
    TEST_ASSERT_EQUAL_UINT32(64, fb.size());
    for (size_t i = 0; i < fb.size(); ++i) TEST_ASSERT_EQUAL_UINT8(0, fb[i]);
}

void test_allocate_zero_is_empty(void)
{
    Framebuffer fb = Framebuffer::allocate(0);
    TEST_ASSERT_TRUE(fb.empty());
    TEST_ASSERT_NULL(fb.data());
}

void test_borrow_aliases_storage(void)
{
    static uint8_t storage[12] = {};
    Framebuffer fb = Framebuffer::borrow(storage, sizeof(storage));
    TEST_ASSERT_FALSE(fb.is_heap());
    TEST_ASSERT_EQUAL_PTR(storage, fb.data());
    fb[3] = 0xAB;
    TEST_ASSERT_EQUAL_HEX8(0xAB, storage[3]);
}

void test_move_transfers_ownership(void)
{
    Framebuffer a = Framebuffer::allocate(8);
    uint8_t* p = a.data();
    Framebuffer b = std::move(a);
    TEST_ASSERT_EQUAL_PTR(p, b.data());
    TEST_ASSERT_EQUAL_UINT32(8, b.size());
    TEST_ASSERT_TRUE(b.is_heap());
    // moved-from framebuffer keeps no handle to the storage
    TEST_ASSERT_TRUE(a.empty());
    TEST_ASSERT_NULL(a.data());
    TEST_ASSERT_EQUAL_UINT32(0, a.size());
    TEST_ASSERT_FALSE(a.is_heap());
}

void test_move_assign_releases_source(void)
{
    static uint8_t storage[6];
    Framebuffer a = Framebuffer::borrow(storage, sizeof(storage));
    Framebuffer b = Framebuffer::allocate(4);
    b = std::move(a);
    TEST_ASSERT_EQUAL_PTR(storage, b.data());
    TEST_ASSERT_EQUAL_UINT32(6, b.size());
    TEST_ASSERT_FALSE(b.is_heap());
    TEST_ASSERT_TRUE(a.empty());
    TEST_ASSERT_NULL(a.data());
}

// ===========================================================================
// Encoders
// ===========================================================================

void test_encode_rgb888_channel_order(void)
{
    uint8_t out[3];
    encoder_for(ColorMode::Rgb888)(Rgb888{0x12, 0x34, 0x56}, out);
    const uint8_t expected[] = {0x12, 0x34, 0x56};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, 3);
}

void test_encode_rgb666_drops_low_bits(void)
{
    uint8_t out[3];
    encoder_for(ColorMode::Rgb666)(Rgb888{0xFF, 0x83, 0x03}, out);
    const uint8_t expected[] = {0xFC, 0x80, 0x00};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, 3);
}

void test_encode_rgb565_big_endian(void)
{
    uint8_t out[2];
    PixelEncoder enc = encoder_for(ColorMode::Rgb565);

    enc(kRed, out);
    TEST_ASSERT_EQUAL_HEX8(0xF8, out[0]);
    TEST_ASSERT_EQUAL_HEX8(0x00, out[1]);

    enc(kGreen, out);
    TEST_ASSERT_EQUAL_HEX8(0x07, out[0]);
    TEST_ASSERT_EQUAL_HEX8(0xE0, out[1]);

    enc(kBlue, out);
    TEST_ASSERT_EQUAL_HEX8(0x00, out[0]);
    TEST_ASSERT_EQUAL_HEX8(0x1F, out[1]);

    enc(kWhite, out);
    TEST_ASSERT_EQUAL_HEX8(0xFF, out[0]);
    TEST_ASSERT_EQUAL_HEX8(0xFF, out[1]);
}

void test_encode_gray8_luma(void)
{
    uint8_t out = 0xAA;
    PixelEncoder enc = encoder_for(ColorMode::Gray8);
    enc(kWhite, &out);
    TEST_ASSERT_EQUAL_UINT8(255, out);
    enc(kBlack, &out);
    TEST_ASSERT_EQUAL_UINT8(0, out);
    enc(Rgb888{100, 100, 100}, &out);
    TEST_ASSERT_EQUAL_UINT8(100, out);
    // green dominates
    enc(kGreen, &out);
    TEST_ASSERT_EQUAL_UINT8((150 * 255) >> 8, out);
}

int main(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_bytes_per_pixel_per_mode);
    RUN_TEST(test_framebuffer_size_every_mode);
    RUN_TEST(test_framebuffer_size_t4_panel);
    RUN_TEST(test_colmod_values);

    RUN_TEST(test_allocate_is_zero_filled);
    RUN_TEST(test_allocate_zero_is_empty);
    RUN_TEST(test_borrow_aliases_storage);
    RUN_TEST(test_move_transfers_ownership);
    RUN_TEST(test_move_assign_releases_source);

    RUN_TEST(test_encode_rgb888_channel_order);
    RUN_TEST(test_encode_rgb666_drops_low_bits);
    RUN_TEST(test_encode_rgb565_big_endian);
    RUN_TEST(test_encode_gray8_luma);

    return UNITY_END();
}
