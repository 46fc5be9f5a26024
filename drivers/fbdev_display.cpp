#include "fbdev_display.hpp"
#include "linux_device.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/fb.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

namespace ashface {

namespace {

inline uint32_t place(uint8_t v, uint32_t offset, uint32_t length) {
    if (length == 0) return 0;
    uint32_t scaled = length >= 8 ? static_cast<uint32_t>(v) << (length - 8) : v >> (8 - length);
    return scaled << offset;
}

inline void store(uint8_t* p, uint32_t value, uint32_t bytes) {
    for (uint32_t i = 0; i < bytes; ++i) {
        p[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

} // namespace

uint32_t fb_pack(Rgb c, const FbLayout& l) {
    return place(c.r, l.red_offset, l.red_length) |
           place(c.g, l.green_offset, l.green_length) |
           place(c.b, l.blue_offset, l.blue_length);
}

void fb_write_frame(const PixelBuffer& frame, const FbLayout& layout, uint8_t* base) {
    const uint32_t bytes = layout.bits_per_pixel / 8;
    for (uint16_t y = 0; y < frame.height(); ++y) {
        uint8_t* row = base + layout.visible_offset + static_cast<size_t>(y) * layout.line_length;
        for (uint16_t x = 0; x < frame.width(); ++x) {
            store(row + static_cast<size_t>(x) * bytes, fb_pack(frame.pixel(x, y), layout), bytes);
        }
    }
}

void fb_fill(Rgb color, const FbLayout& layout, uint8_t* base) {
    const uint32_t bytes = layout.bits_per_pixel / 8;
    const uint32_t value = fb_pack(color, layout);
    uint8_t* first = base + layout.visible_offset;
    for (uint32_t x = 0; x < layout.width; ++x) store(first + static_cast<size_t>(x) * bytes, value, bytes);
    for (uint32_t y = 1; y < layout.height; ++y) {
        std::memcpy(first + static_cast<size_t>(y) * layout.line_length, first,
                    static_cast<size_t>(layout.width) * bytes);
    }
}

FbdevDisplay::FbdevDisplay(FbdevDisplay&& other) noexcept
    : fd_(other.fd_), map_(other.map_), map_len_(other.map_len_), layout_(other.layout_) {
    other.fd_ = -1;
    other.map_ = nullptr;
    other.map_len_ = 0;
}

InitResult FbdevDisplay::init(const PanelConfig& cfg) {
    const std::string path = fbdev_path(cfg);
    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        spdlog::debug("[Fbdev] open {} failed: {}", path, std::strerror(err));
        return init_result_from_errno(err);
    }

    fb_var_screeninfo var;
    fb_fix_screeninfo fix;
    std::memset(&var, 0, sizeof(var));
    std::memset(&fix, 0, sizeof(fix));
    if (ioctl(fd, FBIOGET_VSCREENINFO, &var) < 0 || ioctl(fd, FBIOGET_FSCREENINFO, &fix) < 0) {
        spdlog::error("[Fbdev] {} is not a framebuffer: {}", path, std::strerror(errno));
        ::close(fd);
        return InitResult::IoError;
    }

    FbLayout l;
    l.width = var.xres;
    l.height = var.yres;
    l.bits_per_pixel = var.bits_per_pixel;
    l.line_length = fix.line_length;
    l.red_offset = var.red.offset;
    l.red_length = var.red.length;
    l.green_offset = var.green.offset;
    l.green_length = var.green.length;
    l.blue_offset = var.blue.offset;
    l.blue_length = var.blue.length;
    l.visible_offset = static_cast<size_t>(var.yoffset) * fix.line_length +
                       static_cast<size_t>(var.xoffset) * (var.bits_per_pixel / 8);

    const bool depth_ok = l.bits_per_pixel == 16 || l.bits_per_pixel == 24 || l.bits_per_pixel == 32;
    const size_t needed = l.visible_offset +
                          static_cast<size_t>(l.height ? l.height - 1 : 0) * l.line_length +
                          static_cast<size_t>(l.width) * (l.bits_per_pixel / 8);
    if (l.width != cfg.width || l.height != cfg.height || l.width != kPanelWidth ||
        l.height != kPanelHeight || !depth_ok || needed > fix.smem_len) {
        spdlog::error("[Fbdev] {} reports {}x{}@{}bpp (smem {}), expected {}x{}@16/24/32", path,
                      l.width, l.height, l.bits_per_pixel, fix.smem_len, cfg.width, cfg.height);
        ::close(fd);
        return InitResult::GeometryMismatch;
    }

    void* map = mmap(nullptr, fix.smem_len, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (map == MAP_FAILED) {
        spdlog::error("[Fbdev] mmap {} failed: {}", path, std::strerror(errno));
        ::close(fd);
        return InitResult::IoError;
    }

    fd_ = fd;
    map_ = static_cast<uint8_t*>(map);
    map_len_ = fix.smem_len;
    layout_ = l;
    spdlog::info("[Fbdev] {} {}x{}@{}bpp R{}:{} G{}:{} B{}:{} stride {}", path, l.width, l.height,
                 l.bits_per_pixel, l.red_offset, l.red_length, l.green_offset, l.green_length,
                 l.blue_offset, l.blue_length, l.line_length);
    return InitResult::Ok;
}

TransferResult FbdevDisplay::present(const PixelBuffer& frame) {
    if (!map_) return TransferResult::NotInitialized;
    fb_write_frame(frame, layout_, map_);
    return TransferResult::Ok;
}

TransferResult FbdevDisplay::clear(Rgb color) {
    if (!map_) return TransferResult::NotInitialized;
    fb_fill(color, layout_, map_);
    return TransferResult::Ok;
}

void FbdevDisplay::shutdown() {
    if (map_) {
        if (munmap(map_, map_len_) < 0) {
            spdlog::warn("[Fbdev] munmap failed: {}", std::strerror(errno));
        }
        map_ = nullptr;
        map_len_ = 0;
        spdlog::info("[Fbdev] closed");
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace ashface
