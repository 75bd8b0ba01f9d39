#include "app.hpp"

#include "pico/stdlib.h"
#include "hardware/gpio.h"
#include "hardware/i2c.h"
#include "hardware/pio.h"
#include "hardware/spi.h"

#include "boards/pico2_pins.hpp"
#include "drivers/pico/gpio_output_line.hpp"
#include "drivers/pico/pico_spi_transport.hpp"
#include "drivers/pico/pio_qspi_transport.hpp"
#include "drivers/pico/tca9554_output_line.hpp"
#include "drivers/pin_reset.hpp"
#include "drivers/qspi_controller.hpp"
#include "rm690b0/log.hpp"

namespace rm690b0 {

namespace {
    constexpr const char* TAG = "app";

    // Full frame lives in static SRAM
    uint8_t g_framebuffer[framebuffer_size(board::panel.size, board::panel.color)];

    Transport* make_transport() {
        if (board::quad_bus) {
            static PioQspiTransport qspi(pio0, QspiPins{board::qspi_sck, board::qspi_sio0, board::qspi_cs},
                                         board::qspi_hz);
            if (!qspi.init()) {
                RM690B0_LOGE(TAG, "no free PIO state machine");
                return nullptr;
            }
            return &qspi;
        }
        gpio_set_function(board::qspi_sck, GPIO_FUNC_SPI);
        gpio_set_function(board::qspi_sio0, GPIO_FUNC_SPI);
        static SpiBus bus(spi0, board::spi_hz);
        static PicoSpiTransport spi(bus, board::qspi_cs);
        if (!spi.init()) {
            RM690B0_LOGE(TAG, "spi init failed");
            return nullptr;
        }
        RM690B0_LOGI(TAG, "spi at %lu Hz", static_cast<unsigned long>(bus.frequency()));
        return &spi;
    }

    OutputLine* make_reset_line() {
        if (board::reset_via_expander) {
            i2c_init(i2c0, board::i2c_hz);
            gpio_set_function(board::i2c_sda, GPIO_FUNC_I2C);
            gpio_set_function(board::i2c_scl, GPIO_FUNC_I2C);
            gpio_pull_up(board::i2c_sda);
            gpio_pull_up(board::i2c_scl);
            static Tca9554OutputLine expander(i2c0, board::expander_addr, board::expander_rst_pin);
            int rc = expander.init();
            if (rc != PICO_OK) {
                RM690B0_LOGE(TAG, "expander init failed (%d)", rc);
                return nullptr;
            }
            return &expander;
        }
        static GpioOutputLine rst(board::panel_rst, true);
        rst.init();
        return &rst;
    }
}

bool App::init() {
    static GpioOutputLine panel_en(board::panel_en, true);
    panel_en.init();

    Transport* bus = make_transport();
    if (!bus) return false;

    OutputLine* rst = make_reset_line();
    if (!rst) return false;

    static SleepDelay delay;
    static PinReset reset(*rst, delay, board::panel.reset_low_ms, board::panel.reset_high_ms);
    static QspiController controller(*bus, board::protocol);

    Status st = Rm690b0Display::create_static(controller, reset, delay, board::panel, g_framebuffer, display_);
    if (!st.ok()) {
        RM690B0_LOGE(TAG, "display init failed: %s (code %d)", to_string(st.kind), st.code);
        return false;
    }

    display_->clear(kBlack);
    st = display_->flush();
    if (!st.ok()) return false;
    bar_y_ = (board::panel.size.height - kBarH) / 2;
    fps_last_sample_us_ = time_us_64();
    return true;
}

void App::draw_bar(int x, int y) {
    for (int col = 0; col < kBarW; ++col) {
        uint8_t v = static_cast<uint8_t>(255 * (col + 1) / kBarW);
        display_->fill_solid(Rect{x + col, y, 1, kBarH}, Rgb888{v, v, v});
    }
}

void App::loop() {
    const int width = board::panel.size.width;
    while (true) {
        const int prev_x = bar_x_;
        display_->fill_solid(Rect{prev_x, bar_y_, kBarW, kBarH}, kBlack);
        bar_x_ += kStep;
        if (bar_x_ + kBarW > width) bar_x_ = 0;
        draw_bar(bar_x_, bar_y_);

        // Dirty span covers both the erased and the new bar
        int x0 = prev_x < bar_x_ ? prev_x : bar_x_;
        int x1 = (prev_x > bar_x_ ? prev_x : bar_x_) + kBarW - 1;
        Status st = display_->partial_flush(static_cast<uint16_t>(x0), static_cast<uint16_t>(x1),
                                            static_cast<uint16_t>(bar_y_),
                                            static_cast<uint16_t>(bar_y_ + kBarH - 1),
                                            display_->color_mode());
        if (!st.ok()) {
            // Window state is undefined after a failed flush; a full frame re-sets it
            RM690B0_LOGW(TAG, "partial flush failed: %s (code %d)", to_string(st.kind), st.code);
            sleep_ms(100);
            if (!display_->flush().ok()) {
                RM690B0_LOGE(TAG, "recovering with reset");
                Status rec = display_->hard_reset();
                if (rec.ok()) rec = display_->initialize_display();
                if (rec.ok()) rec = display_->flush();
                if (!rec.ok()) RM690B0_LOGE(TAG, "recovery failed: %s (code %d)", to_string(rec.kind), rec.code);
            }
            continue;
        }

        ++frame_;
        ++fps_frame_counter_;
        uint64_t now_us = time_us_64();
        if (now_us - fps_last_sample_us_ >= 1000000) {
            RM690B0_LOGI(TAG, "%lu fps", static_cast<unsigned long>(fps_frame_counter_));
            fps_frame_counter_ = 0;
            fps_last_sample_us_ = now_us;
        }
    }
}

} // namespace rm690b0
