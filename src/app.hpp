#pragma once

#include <cstdint>
#include <memory>
#include "drivers/rm690b0_display.hpp"

namespace rm690b0 {

// Demo: a gradient bar sweeps across the panel, pushed with partial flushes
class App {
public:
    bool init();
    void loop();
private:
    static constexpr int kBarW = 30;
    static constexpr int kBarH = 120;
    static constexpr int kStep = 6;

    void draw_bar(int x, int y);

    std::unique_ptr<Rm690b0Display> display_;
    int bar_x_ = 0;
    int bar_y_ = 0;
    uint32_t frame_ = 0;
    // FPS tracking (updated once per second)
    uint32_t fps_frame_counter_ = 0;
    uint64_t fps_last_sample_us_ = 0;
};

} // namespace rm690b0
