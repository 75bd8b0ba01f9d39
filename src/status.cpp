#include "rm690b0/status.hpp"
#include "rm690b0/types.hpp"

namespace rm690b0 {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "ok";
        case ErrorKind::Interface:            return "interface error";
        case ErrorKind::Reset:                return "reset error";
        case ErrorKind::InvalidConfiguration: return "invalid configuration";
    }
    return "unknown";
}

const char* to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::Rgb565: return "RGB565";
        case ColorMode::Rgb888: return "RGB888";
        case ColorMode::Rgb666: return "RGB666";
        case ColorMode::Gray8:  return "Gray8";
    }
    return "unknown";
}

} // namespace rm690b0
