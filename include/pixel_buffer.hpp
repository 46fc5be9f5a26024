#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace ashface {

constexpr uint16_t kPanelWidth  = 480;
constexpr uint16_t kPanelHeight = 320;

enum class PixelFormat : uint8_t { RGB888, RGB565, BGR565 };

constexpr size_t bytes_per_pixel(PixelFormat f) {
    return f == PixelFormat::RGB888 ? 3 : 2;
}

constexpr size_t frame_bytes(PixelFormat f) {
    return static_cast<size_t>(kPanelWidth) * kPanelHeight * bytes_per_pixel(f);
}

const char* to_string(PixelFormat f);

struct Rgb {
    uint8_t r{0}, g{0}, b{0};
};

inline bool operator==(const Rgb& a, const Rgb& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

// Immutable full-panel frame (kPanelWidth x kPanelHeight, row-major).
// 16-bit formats are stored big-endian, i.e. in controller wire order.
// Copies share the payload.
class PixelBuffer {
public:
    // nullopt unless bytes.size() == frame_bytes(format)
    static std::optional<PixelBuffer> from_bytes(PixelFormat format, std::vector<uint8_t> bytes);
    static PixelBuffer solid(PixelFormat format, Rgb color);

    uint16_t width() const { return kPanelWidth; }
    uint16_t height() const { return kPanelHeight; }
    PixelFormat format() const { return format_; }
    const uint8_t* data() const { return bytes_->data(); }
    size_t size() const { return bytes_->size(); }
    const std::vector<uint8_t>& bytes() const { return *bytes_; }

    Rgb pixel(uint16_t x, uint16_t y) const;

    bool operator==(const PixelBuffer& other) const;
    bool operator!=(const PixelBuffer& other) const { return !(*this == other); }

private:
    PixelBuffer(PixelFormat format, std::shared_ptr<const std::vector<uint8_t>> bytes)
        : format_(format), bytes_(std::move(bytes)) {}

    PixelFormat format_;
    std::shared_ptr<const std::vector<uint8_t>> bytes_;
};

} // namespace ashface
