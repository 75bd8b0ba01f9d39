#include "gpio_output_line.hpp"

#include "pico/stdlib.h"
#include "hardware/gpio.h"

namespace rm690b0 {

void GpioOutputLine::init() {
    gpio_init(pin_);
    gpio_put(pin_, initial_);
    gpio_set_dir(pin_, GPIO_OUT);
}

int GpioOutputLine::set_level(bool high) {
    gpio_put(pin_, high);
    return PICO_OK;
}

void SleepDelay::delay_ms(uint32_t ms) { sleep_ms(ms); }

} // namespace rm690b0
