#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "rm690b0/config.hpp"
#include "rm690b0/controller_interface.hpp"
#include "rm690b0/draw_target.hpp"
#include "rm690b0/reset.hpp"
#include "rm690b0/status.hpp"
#include "rm690b0/types.hpp"
#include "src/framebuffer.hpp"
#include "src/pixel_encoder.hpp"

namespace rm690b0 {

// RM690B0 AMOLED controller with a full-frame RAM framebuffer.
// Drawing only touches the framebuffer; flush()/partial_flush() push it out.
// Instances only exist once reset and the init sequence have succeeded.
class Rm690b0Display : public DrawTarget {
public:
    static Status create(ControllerInterface& iface, ResetInterface& reset, Delay& delay,
                         const PanelConfig& config, Framebuffer framebuffer,
                         std::unique_ptr<Rm690b0Display>& out);

    static Status create_heap(ControllerInterface& iface, ResetInterface& reset, Delay& delay,
                              const PanelConfig& config, std::unique_ptr<Rm690b0Display>& out) {
        return create(iface, reset, delay, config,
                      Framebuffer::allocate(framebuffer_size(config.size, config.color)), out);
    }

    template <size_t N>
    static Status create_static(ControllerInterface& iface, ResetInterface& reset, Delay& delay,
                                const PanelConfig& config, uint8_t (&storage)[N],
                                std::unique_ptr<Rm690b0Display>& out) {
        return create(iface, reset, delay, config, Framebuffer::borrow(storage, N), out);
    }

    Status hard_reset();
    // Wake, vendor tuning, pixel format, TE, display on, brightness
    Status initialize_display();

    Status sleep_in();
    Status sleep_out();
    Status display_on();
    Status display_off();
    Status set_madctr(uint8_t value);
    Status set_brightness(uint8_t value);
    Status set_window(uint16_t x_start, uint16_t y_start, uint16_t x_end, uint16_t y_end);

    Status flush();
    // Pushes only the inclusive rectangle; nothing is sent if it is rejected.
    Status partial_flush(uint16_t x_start, uint16_t x_end, uint16_t y_start, uint16_t y_end, ColorMode color);
    Status partial_flush(const Window& window) {
        return partial_flush(window.x_start, window.x_end, window.y_start, window.y_end, config_.color);
    }

    // DrawTarget
    void draw_pixel(const Pixel& pixel) override;
    Size size() const override { return Size{config_.size.width, config_.size.height}; }
    void fill_solid(const Rect& area, Rgb888 color) override;

    const Framebuffer& framebuffer() const { return framebuffer_; }
    const PanelConfig& config() const { return config_; }
    ColorMode color_mode() const { return config_.color; }

private:
    Rm690b0Display(ControllerInterface& iface, ResetInterface& reset, Delay& delay,
                   const PanelConfig& config, Framebuffer framebuffer);

    Status send_command(uint8_t cmd);
    Status send_command_with_data(uint8_t cmd, const uint8_t* data, size_t len);
    Status send_command_with_byte(uint8_t cmd, uint8_t value) { return send_command_with_data(cmd, &value, 1); }
    Status validate_window(uint16_t x_start, uint16_t y_start, uint16_t x_end, uint16_t y_end) const;

    ControllerInterface& iface_;
    ResetInterface& reset_;
    Delay& delay_;
    PanelConfig config_;
    Framebuffer framebuffer_;
    PixelEncoder encode_;
    std::vector<uint8_t> staging_; // packed rows for partial_flush
};

} // namespace rm690b0
