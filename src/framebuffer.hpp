// Frame storage owned by the display driver
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace rm690b0 {

// Contiguous pixel bytes, either borrowed from storage with static lifetime
// or allocated on the heap. Move-only; algorithms only see data()/size().
class Framebuffer {
public:
    Framebuffer() = default;
    // The source is left empty so no handle to the moved storage survives
    Framebuffer(Framebuffer&& other) noexcept
        : heap_(std::move(other.heap_)),
          data_(std::exchange(other.data_, nullptr)),
          len_(std::exchange(other.len_, 0)) {}
    Framebuffer& operator=(Framebuffer&& other) noexcept {
        if (this != &other) {
            heap_ = std::move(other.heap_);
            data_ = std::exchange(other.data_, nullptr);
            len_ = std::exchange(other.len_, 0);
        }
        return *this;
    }
    Framebuffer(const Framebuffer&) = delete;
    Framebuffer& operator=(const Framebuffer&) = delete;

    // `storage` must outlive the framebuffer (typically a static array)
    static Framebuffer borrow(uint8_t* storage, size_t len);
    // Zero-filled; empty() on allocation failure
    static Framebuffer allocate(size_t len);

    uint8_t* data() { return data_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return len_; }
    bool empty() const { return len_ == 0; }
    bool is_heap() const { return heap_ != nullptr; }

    uint8_t& operator[](size_t i) { return data_[i]; }
    uint8_t operator[](size_t i) const { return data_[i]; }

private:
    std::unique_ptr<uint8_t[]> heap_;
    uint8_t* data_ = nullptr;
    size_t len_ = 0;
};

} // namespace rm690b0
