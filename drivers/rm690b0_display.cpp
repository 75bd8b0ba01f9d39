#include "rm690b0_display.hpp"

#include <cstring>
#include <new>
#include <utility>

#include "rm690b0/commands.hpp"
#include "rm690b0/log.hpp"

namespace rm690b0 {

namespace {
    constexpr const char* TAG = "rm690b0";

    struct RegisterWrite {
        uint8_t cmd;
        uint8_t value;
    };

    // Vendor page 0x20 tuning; order matters, the last write returns to the user page
    constexpr RegisterWrite kManufacturerInit[] = {
        {commands::CMDMODE, 0x20},
        {0x26, 0x0A},
        {0x24, 0x80},
        {0x5A, 0x51},
        {0x5B, 0x2E},
        {commands::CMDMODE, 0x00},
    };

    Status log_failure(const Status& st, const char* what) {
        if (!st.ok()) {
            RM690B0_LOGE(TAG, "%s: %s (%s, code %d)", what, st.message ? st.message : "", to_string(st.kind), st.code);
        }
        return st;
    }
}

Status Rm690b0Display::create(ControllerInterface& iface, ResetInterface& reset, Delay& delay,
                              const PanelConfig& config, Framebuffer framebuffer,
                              std::unique_ptr<Rm690b0Display>& out) {
    out.reset();
    if (config.size.width == 0 || config.size.height == 0) {
        return log_failure(Status::invalid_configuration("display size is zero"), "create");
    }
    if (config.size.width > config.max_column_count) {
        return log_failure(Status::invalid_configuration("display wider than controller column range"), "create");
    }
    if (framebuffer.empty()) {
        return log_failure(Status::invalid_configuration("framebuffer storage unavailable"), "create");
    }
    if (framebuffer.size() != framebuffer_size(config.size, config.color)) {
        return log_failure(Status::invalid_configuration("framebuffer size does not match display"), "create");
    }

    std::unique_ptr<Rm690b0Display> display(
        new (std::nothrow) Rm690b0Display(iface, reset, delay, config, std::move(framebuffer)));
    if (!display) {
        return log_failure(Status::invalid_configuration("driver allocation failed"), "create");
    }

    RM690B0_LOGI(TAG, "init %ux%u %s, %u byte framebuffer (%s)",
                 config.size.width, config.size.height, to_string(config.color),
                 static_cast<unsigned>(display->framebuffer_.size()),
                 display->framebuffer_.is_heap() ? "heap" : "static");

    Status st = display->hard_reset();
    if (!st.ok()) return st;
    st = display->initialize_display();
    if (!st.ok()) return st;

    out = std::move(display);
    return st;
}

Rm690b0Display::Rm690b0Display(ControllerInterface& iface, ResetInterface& reset, Delay& delay,
                               const PanelConfig& config, Framebuffer framebuffer)
    : iface_(iface), reset_(reset), delay_(delay), config_(config),
      framebuffer_(std::move(framebuffer)), encode_(encoder_for(config.color)) {}

Status Rm690b0Display::hard_reset() {
    int rc = reset_.reset();
    if (rc != kOk) return log_failure(Status::reset_error(rc), "hard reset");
    return Status::success();
}

Status Rm690b0Display::initialize_display() {
    Status st = send_command(commands::SLPOUT);
    if (!st.ok()) return log_failure(st, "sleep out");
    delay_.delay_ms(config_.sleep_out_settle_ms);

    for (const RegisterWrite& w : kManufacturerInit) {
        st = send_command_with_byte(w.cmd, w.value);
        if (!st.ok()) return log_failure(st, "manufacturer init");
    }

    st = send_command_with_byte(commands::COLMOD, colmod_value(config_.color));
    if (!st.ok()) return log_failure(st, "pixel format");

    // TE output on, V-blank only (parameter 0x00); the driver never waits on it
    st = send_command_with_byte(commands::TEON, 0x00);
    if (!st.ok()) return log_failure(st, "tearing effect");

    st = send_command(commands::DISPON);
    if (!st.ok()) return log_failure(st, "display on");
    delay_.delay_ms(config_.display_on_settle_ms);

    st = send_command_with_byte(commands::WRDISBV, config_.initial_brightness);
    if (!st.ok()) return log_failure(st, "brightness");

    RM690B0_LOGI(TAG, "panel ready");
    return st;
}

Status Rm690b0Display::send_command(uint8_t cmd) {
    int rc = iface_.send_command(cmd);
    if (rc != kOk) return Status::interface_error(rc);
    return Status::success();
}

Status Rm690b0Display::send_command_with_data(uint8_t cmd, const uint8_t* data, size_t len) {
    int rc = iface_.send_command_with_data(cmd, data, len);
    if (rc != kOk) return Status::interface_error(rc);
    return Status::success();
}

Status Rm690b0Display::sleep_in() {
    Status st = send_command(commands::SLPIN);
    if (!st.ok()) return log_failure(st, "sleep in");
    delay_.delay_ms(config_.sleep_settle_ms);
    return st;
}

Status Rm690b0Display::sleep_out() {
    Status st = send_command(commands::SLPOUT);
    if (!st.ok()) return log_failure(st, "sleep out");
    delay_.delay_ms(config_.sleep_settle_ms);
    return st;
}

Status Rm690b0Display::display_on() { return log_failure(send_command(commands::DISPON), "display on"); }
Status Rm690b0Display::display_off() { return log_failure(send_command(commands::DISPOFF), "display off"); }

Status Rm690b0Display::set_madctr(uint8_t value) {
    return log_failure(send_command_with_byte(commands::MADCTR, value), "madctr");
}

Status Rm690b0Display::set_brightness(uint8_t value) {
    return log_failure(send_command_with_byte(commands::WRDISBV, value), "brightness");
}

Status Rm690b0Display::validate_window(uint16_t x_start, uint16_t y_start, uint16_t x_end, uint16_t y_end) const {
    if (x_end < x_start || y_end < y_start) {
        return Status::invalid_configuration("window end before start");
    }
    if (x_end >= config_.max_column_count || y_end >= config_.size.height) {
        return Status::invalid_configuration("window outside panel");
    }
    return Status::success();
}

Status Rm690b0Display::set_window(uint16_t x_start, uint16_t y_start, uint16_t x_end, uint16_t y_end) {
    Status st = validate_window(x_start, y_start, x_end, y_end);
    if (!st.ok()) return log_failure(st, "set window");

    const uint8_t caset[4] = {
        static_cast<uint8_t>(x_start >> 8), static_cast<uint8_t>(x_start & 0xFF),
        static_cast<uint8_t>(x_end >> 8),   static_cast<uint8_t>(x_end & 0xFF),
    };
    st = send_command_with_data(commands::CASET, caset, sizeof(caset));
    if (!st.ok()) return log_failure(st, "caset");

    const uint8_t raset[4] = {
        static_cast<uint8_t>(y_start >> 8), static_cast<uint8_t>(y_start & 0xFF),
        static_cast<uint8_t>(y_end >> 8),   static_cast<uint8_t>(y_end & 0xFF),
    };
    st = send_command_with_data(commands::RASET, raset, sizeof(raset));
    if (!st.ok()) return log_failure(st, "raset");
    return st;
}

Status Rm690b0Display::flush() {
    Status st = set_window(0, 0, config_.size.width - 1, config_.size.height - 1);
    if (!st.ok()) return st;
    int rc = iface_.send_pixels(framebuffer_.data(), framebuffer_.size());
    if (rc != kOk) return log_failure(Status::interface_error(rc, "pixel write failed"), "flush");
    return st;
}

Status Rm690b0Display::partial_flush(uint16_t x_start, uint16_t x_end, uint16_t y_start, uint16_t y_end,
                                     ColorMode color) {
    Status st = validate_window(x_start, y_start, x_end, y_end);
    if (!st.ok()) return log_failure(st, "partial flush");

    const size_t bpp = bytes_per_pixel(color);
    if (bpp != bytes_per_pixel(config_.color)) {
        return log_failure(Status::invalid_configuration("color mode does not match framebuffer"), "partial flush");
    }
    // A column past the framebuffer row would wrap into the next row
    if (x_end >= config_.size.width) {
        return log_failure(Status::invalid_configuration("window wider than framebuffer"), "partial flush");
    }

    const size_t stride = static_cast<size_t>(config_.size.width) * bpp;
    const size_t row_len = static_cast<size_t>(x_end - x_start + 1) * bpp;
    const size_t rows = static_cast<size_t>(y_end - y_start + 1);

    staging_.clear();
    staging_.reserve(row_len * rows);
    for (size_t y = 0; y < rows; ++y) {
        const size_t offset = (y_start + y) * stride + static_cast<size_t>(x_start) * bpp;
        if (offset >= framebuffer_.size() || offset + row_len > framebuffer_.size()) {
            staging_.clear();
            return log_failure(Status::invalid_configuration("framebuffer slice out of bounds"), "partial flush");
        }
        const uint8_t* row = framebuffer_.data() + offset;
        staging_.insert(staging_.end(), row, row + row_len);
    }

    RM690B0_LOGD(TAG, "partial flush (%u,%u)-(%u,%u) %u bytes", x_start, y_start, x_end, y_end,
                 static_cast<unsigned>(staging_.size()));

    st = set_window(x_start, y_start, x_end, y_end);
    if (!st.ok()) return st;
    int rc = iface_.send_pixels(staging_.data(), staging_.size());
    if (rc != kOk) return log_failure(Status::interface_error(rc, "pixel write failed"), "partial flush");
    return st;
}

void Rm690b0Display::draw_pixel(const Pixel& pixel) {
    const Point& p = pixel.point;
    if (p.x < 0 || p.y < 0 || p.x >= config_.size.width || p.y >= config_.size.height) return;
    const size_t bpp = bytes_per_pixel(config_.color);
    const size_t index = (static_cast<size_t>(p.y) * config_.size.width + static_cast<size_t>(p.x)) * bpp;
    if (index + bpp > framebuffer_.size()) return;
    encode_(pixel.color, framebuffer_.data() + index);
}

void Rm690b0Display::fill_solid(const Rect& area, Rgb888 color) {
    int64_t x0 = area.x < 0 ? 0 : area.x;
    int64_t y0 = area.y < 0 ? 0 : area.y;
    int64_t x1 = static_cast<int64_t>(area.x) + area.w;
    int64_t y1 = static_cast<int64_t>(area.y) + area.h;
    if (x1 > config_.size.width) x1 = config_.size.width;
    if (y1 > config_.size.height) y1 = config_.size.height;
    if (x0 >= x1 || y0 >= y1) return;

    const size_t bpp = bytes_per_pixel(config_.color);
    uint8_t encoded[4];
    encode_(color, encoded);
    for (int64_t y = y0; y < y1; ++y) {
        uint8_t* dst = framebuffer_.data() + (static_cast<size_t>(y) * config_.size.width + static_cast<size_t>(x0)) * bpp;
        for (int64_t x = x0; x < x1; ++x, dst += bpp) {
            std::memcpy(dst, encoded, bpp);
        }
    }
}

} // namespace rm690b0
