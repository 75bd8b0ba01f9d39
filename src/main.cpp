#include "pico/stdlib.h"

#include "app.hpp"
#include "rm690b0/log.hpp"

int main() {
    stdio_init_all();

    static rm690b0::App app;
    if (!app.init()) {
        RM690B0_LOGE("main", "startup failed");
        while (true) sleep_ms(1000);
    }
    app.loop();
}
