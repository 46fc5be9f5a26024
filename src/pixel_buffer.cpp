#include "pixel_buffer.hpp"

#include <algorithm>

#include "pixel_format.hpp"

namespace ashface {

const char* to_string(PixelFormat f) {
    switch (f) {
    case PixelFormat::RGB888: return "RGB888";
    case PixelFormat::RGB565: return "RGB565";
    case PixelFormat::BGR565: return "BGR565";
    }
    return "?";
}

std::optional<PixelBuffer> PixelBuffer::from_bytes(PixelFormat format, std::vector<uint8_t> bytes) {
    if (bytes.size() != frame_bytes(format)) return std::nullopt;
    return PixelBuffer(format, std::make_shared<const std::vector<uint8_t>>(std::move(bytes)));
}

PixelBuffer PixelBuffer::solid(PixelFormat format, Rgb color) {
    const size_t bpp = bytes_per_pixel(format);
    uint8_t px[3] = {color.r, color.g, color.b};
    if (format != PixelFormat::RGB888) {
        uint16_t v = pack565(color, format);
        px[0] = static_cast<uint8_t>(v >> 8);
        px[1] = static_cast<uint8_t>(v & 0xFF);
    }
    std::vector<uint8_t> bytes(frame_bytes(format));
    for (size_t i = 0; i < bytes.size(); i += bpp) {
        std::copy(px, px + bpp, bytes.begin() + static_cast<std::ptrdiff_t>(i));
    }
    return PixelBuffer(format, std::make_shared<const std::vector<uint8_t>>(std::move(bytes)));
}

Rgb PixelBuffer::pixel(uint16_t x, uint16_t y) const {
    const size_t bpp = bytes_per_pixel(format_);
    const uint8_t* p = data() + (static_cast<size_t>(y) * kPanelWidth + x) * bpp;
    if (format_ == PixelFormat::RGB888) return Rgb{p[0], p[1], p[2]};
    return unpack565(static_cast<uint16_t>((p[0] << 8) | p[1]), format_);
}

bool PixelBuffer::operator==(const PixelBuffer& other) const {
    if (format_ != other.format_) return false;
    if (bytes_ == other.bytes_) return true;
    return *bytes_ == *other.bytes_;
}

} // namespace ashface
