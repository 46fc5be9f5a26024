#pragma once

#include <cstddef>
#include <cstdint>

#include "display.hpp"
#include "panel_config.hpp"
#include "pixel_buffer.hpp"

namespace ashface {

// Geometry and pixel layout reported by a Linux framebuffer, read once at open
struct FbLayout {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t bits_per_pixel = 0;
    uint32_t line_length = 0; // bytes per scanline, may include padding
    uint32_t red_offset = 0, red_length = 0;
    uint32_t green_offset = 0, green_length = 0;
    uint32_t blue_offset = 0, blue_length = 0;
    size_t visible_offset = 0; // byte offset of the displayed page
};

// Pixel value in the layout's channel positions (stored little-endian)
uint32_t fb_pack(Rgb c, const FbLayout& layout);
// base points at the start of the mapping; layout must match the frame size
void fb_write_frame(const PixelBuffer& frame, const FbLayout& layout, uint8_t* base);
void fb_fill(Rgb color, const FbLayout& layout, uint8_t* base);

// Panel owned by the kernel (fbtft / vendor overlay) and exposed as /dev/fbN
class FbdevDisplay {
public:
    FbdevDisplay() = default;
    ~FbdevDisplay() { shutdown(); }
    FbdevDisplay(FbdevDisplay&& other) noexcept;
    FbdevDisplay& operator=(FbdevDisplay&&) = delete;

    InitResult init(const PanelConfig& cfg);
    TransferResult present(const PixelBuffer& frame);
    TransferResult clear(Rgb color);
    void shutdown();

    bool initialized() const { return map_ != nullptr; }
    const FbLayout& layout() const { return layout_; }

private:
    int fd_ = -1;
    uint8_t* map_ = nullptr;
    size_t map_len_ = 0;
    FbLayout layout_;
};

} // namespace ashface
