#include "framebuffer.hpp"
#include <new>

namespace rm690b0 {

Framebuffer Framebuffer::borrow(uint8_t* storage, size_t len) {
    Framebuffer fb;
    if (!storage) return fb;
    fb.data_ = storage;
    fb.len_ = len;
    return fb;
}

Framebuffer Framebuffer::allocate(size_t len) {
    Framebuffer fb;
    if (len == 0) return fb;
    fb.heap_.reset(new (std::nothrow) uint8_t[len]());
    if (!fb.heap_) return fb;
    fb.data_ = fb.heap_.get();
    fb.len_ = len;
    return fb;
}

} // namespace rm690b0
