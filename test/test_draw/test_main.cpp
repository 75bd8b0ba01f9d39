/*
 * Unit tests for the drawing surface of Rm690b0Display: in-bounds pixel
 * writes land at (y*width + x)*bpp in the configured encoding, anything
 * outside the panel is clipped silently, and fills/clears stay in bounds.
 */

#include "drivers/rm690b0_display.hpp"

#include "TestUtil.h"
#include <cstring>
#include <memory>
#include <unity.h>
#include <vector>

using namespace rm690b0;

static constexpr uint16_t W = 12;
static constexpr uint16_t H = 7;

// Surface with no fill_solid override, so fills take the per-pixel default
class GridTarget : public DrawTarget {
public:
    GridTarget(uint32_t w, uint32_t h) : w_(w), h_(h), cells_(w * h, kBlack) {}

    void draw_pixel(const Pixel &pixel) override
    {
        ++writes;
        const Point &p = pixel.point;
        if (p.x < 0 || p.y < 0 || static_cast<uint32_t>(p.x) >= w_ || static_cast<uint32_t>(p.y) >= h_) {
            ++rejected;
            return;
        }
        cells_[static_cast<size_t>(p.y) * w_ + static_cast<size_t>(p.x)] = pixel.color;
    }

    Size size() const override { return Size{w_, h_}; }

    Rgb888 at(uint32_t x, uint32_t y) const { return cells_[static_cast<size_t>(y) * w_ + x]; }

    size_t writes = 0;
    size_t rejected = 0;

private:
    uint32_t w_;
    uint32_t h_;
    std::vector<Rgb888> cells_;
};

static testutil::RecordingController *iface = nullptr;
static testutil::FakeReset *reset = nullptr;
static testutil::RecordingDelay *delay = nullptr;

static std::unique_ptr<Rm690b0Display> makeDisplay(ColorMode color)
{
    PanelConfig cfg;
    cfg.size = DisplaySize{W, H};
    cfg.color = color;
    std::unique_ptr<Rm690b0Display> d;
    Status st = Rm690b0Display::create_heap(*iface, *reset, *delay, cfg, d);
    TEST_ASSERT_TRUE(st.ok());
    return d;
}

static std::vector<uint8_t> snapshot(const Rm690b0Display &d)
{
    const Framebuffer &fb = d.framebuffer();
    return std::vector<uint8_t>(fb.data(), fb.data() + fb.size());
}

static const uint8_t *pixelAt(const Rm690b0Display &d, int x, int y)
{
    size_t bpp = bytes_per_pixel(d.color_mode());
    return d.framebuffer().data() + (static_cast<size_t>(y) * W + static_cast<size_t>(x)) * bpp;
}

void setUp(void)
{
    iface = new testutil::RecordingController();
    reset = new testutil::FakeReset();
    delay = new testutil::RecordingDelay();
}

void tearDown(void)
{
    delete iface;
    delete reset;
    delete delay;
}

// ===========================================================================
// Pixel writes
// ===========================================================================

void test_size_reports_panel(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb888);
    TEST_ASSERT_EQUAL_UINT32(W, d->size().width);
    TEST_ASSERT_EQUAL_UINT32(H, d->size().height);
}

void test_rgb888_round_trip_every_pixel(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb888);
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            Rgb888 c{static_cast<uint8_t>(x * 20), static_cast<uint8_t>(y * 30), static_cast<uint8_t>(x + y)};
            d->draw_pixel(Pixel{Point{x, y}, c});
        }
    }
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const uint8_t *p = pixelAt(*d, x, y);
            TEST_ASSERT_EQUAL_UINT8(x * 20, p[0]);
            TEST_ASSERT_EQUAL_UINT8(y * 30, p[1]);
            TEST_ASSERT_EQUAL_UINT8(x + y, p[2]);
        }
    }
}

void test_rgb565_pixel_packing(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb565);
    d->draw_pixel(Pixel{Point{3, 2}, kGreen});
    const uint8_t *p = pixelAt(*d, 3, 2);
    TEST_ASSERT_EQUAL_HEX8(0x07, p[0]);
    TEST_ASSERT_EQUAL_HEX8(0xE0, p[1]);
    // neighbours untouched
    TEST_ASSERT_EQUAL_HEX8(0x00, pixelAt(*d, 2, 2)[1]);
    TEST_ASSERT_EQUAL_HEX8(0x00, pixelAt(*d, 4, 2)[0]);
}

void test_gray8_pixel_packing(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Gray8);
    d->draw_pixel(Pixel{Point{W - 1, H - 1}, kWhite});
    TEST_ASSERT_EQUAL_UINT8(255, *pixelAt(*d, W - 1, H - 1));
    TEST_ASSERT_EQUAL_UINT32(static_cast<size_t>(W) * H, d->framebuffer().size());
}

void test_out_of_bounds_is_noop(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb888);
    d->clear(Rgb888{1, 2, 3});
    std::vector<uint8_t> before = snapshot(*d);

    const Pixel outside[] = {
        {Point{-1, 0}, kRed},
        {Point{0, -1}, kRed},
        {Point{W, 0}, kRed},
        {Point{0, H}, kRed},
        {Point{W, H}, kRed},
        {Point{-1000, 5000}, kRed},
    };
    d->draw_iter(outside, sizeof(outside) / sizeof(outside[0]));

    std::vector<uint8_t> after = snapshot(*d);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(before.data(), after.data(), before.size());
}

void test_draw_iter_container(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb888);
    std::vector<Pixel> pixels = {{Point{0, 0}, kRed}, {Point{W, 0}, kRed}, {Point{1, 1}, kBlue}};
    d->draw_iter(pixels.begin(), pixels.end());
    TEST_ASSERT_EQUAL_HEX8(0xFF, pixelAt(*d, 0, 0)[0]);
    TEST_ASSERT_EQUAL_HEX8(0xFF, pixelAt(*d, 1, 1)[2]);
}

void test_drawing_issues_no_transactions(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb888);
    size_t before = iface->attempts;
    d->draw_pixel(Pixel{Point{1, 1}, kWhite});
    d->fill_solid(Rect{0, 0, W, H}, kBlue);
    TEST_ASSERT_EQUAL_UINT32(before, iface->attempts);
}

// ===========================================================================
// Fills
// ===========================================================================

void test_fill_solid_clips(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb888);
    d->fill_solid(Rect{-3, -2, 5, 4}, kWhite); // covers x 0..1, y 0..1
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            uint8_t expected = (x < 2 && y < 2) ? 0xFF : 0x00;
            TEST_ASSERT_EQUAL_HEX8(expected, pixelAt(*d, x, y)[0]);
        }
    }
    d->fill_solid(Rect{W - 1, H - 1, 100, 100}, kRed);
    TEST_ASSERT_EQUAL_HEX8(0xFF, pixelAt(*d, W - 1, H - 1)[0]);
    TEST_ASSERT_EQUAL_HEX8(0x00, pixelAt(*d, W - 1, H - 1)[1]);
}

void test_default_fill_solid_clips_to_surface(void)
{
    GridTarget grid(5, 4);
    grid.fill_solid(Rect{-2, 1, 4, 10}, kRed); // covers x 0..1, y 1..3
    for (uint32_t y = 0; y < 4; ++y) {
        for (uint32_t x = 0; x < 5; ++x) {
            bool inside = x < 2 && y >= 1;
            TEST_ASSERT_TRUE(grid.at(x, y) == (inside ? kRed : kBlack));
        }
    }
    // only in-bounds pixels reach draw_pixel
    TEST_ASSERT_EQUAL_UINT32(6, grid.writes);
    TEST_ASSERT_EQUAL_UINT32(0, grid.rejected);
}

void test_default_fill_solid_outside_draws_nothing(void)
{
    GridTarget grid(5, 4);
    grid.fill_solid(Rect{5, 0, 3, 3}, kWhite);
    grid.fill_solid(Rect{-4, -4, 4, 4}, kWhite);
    grid.fill_solid(Rect{1, 1, 0, 2}, kWhite);
    TEST_ASSERT_EQUAL_UINT32(0, grid.writes);
}

void test_default_clear_covers_surface(void)
{
    GridTarget grid(3, 2);
    grid.clear(kBlue);
    TEST_ASSERT_EQUAL_UINT32(6, grid.writes);
    for (uint32_t y = 0; y < 2; ++y) {
        for (uint32_t x = 0; x < 3; ++x) {
            TEST_ASSERT_TRUE(grid.at(x, y) == kBlue);
        }
    }
}

void test_fill_solid_fully_outside(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb565);
    std::vector<uint8_t> before = snapshot(*d);
    d->fill_solid(Rect{W, 0, 4, 4}, kWhite);
    d->fill_solid(Rect{-10, -10, 5, 5}, kWhite);
    std::vector<uint8_t> after = snapshot(*d);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(before.data(), after.data(), before.size());
}

void test_clear_matches_per_pixel_encoding(void)
{
    std::unique_ptr<Rm690b0Display> d = makeDisplay(ColorMode::Rgb666);
    d->clear(Rgb888{0xFF, 0x81, 0x42});
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const uint8_t *p = pixelAt(*d, x, y);
            TEST_ASSERT_EQUAL_HEX8(0xFC, p[0]);
            TEST_ASSERT_EQUAL_HEX8(0x80, p[1]);
            TEST_ASSERT_EQUAL_HEX8(0x40, p[2]);
        }
    }
}

int main(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_size_reports_panel);
    RUN_TEST(test_rgb888_round_trip_every_pixel);
    RUN_TEST(test_rgb565_pixel_packing);
    RUN_TEST(test_gray8_pixel_packing);
    RUN_TEST(test_out_of_bounds_is_noop);
    RUN_TEST(test_draw_iter_container);
    RUN_TEST(test_drawing_issues_no_transactions);

    RUN_TEST(test_fill_solid_clips);
    RUN_TEST(test_fill_solid_fully_outside);
    RUN_TEST(test_default_fill_solid_clips_to_surface);
    RUN_TEST(test_default_fill_solid_outside_draws_nothing);
    RUN_TEST(test_default_clear_covers_surface);
    RUN_TEST(test_clear_matches_per_pixel_encoding);

    return UNITY_END();
}
