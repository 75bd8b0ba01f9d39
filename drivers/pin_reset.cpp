#include "pin_reset.hpp"

#include "rm690b0/status.hpp"

namespace rm690b0 {

int PinReset::reset() {
    int rc = line_.set_level(false);
    if (rc != kOk) return rc;
    delay_.delay_ms(low_ms_);
    rc = line_.set_level(true);
    if (rc != kOk) return rc;
    delay_.delay_ms(high_ms_);
    return kOk;
}

} // namespace rm690b0
