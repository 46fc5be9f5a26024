#include "ili9486_display.hpp"

#include <spdlog/spdlog.h>

#include "pixel_format.hpp"

namespace ashface {

namespace {

struct InitCommand {
    uint8_t cmd;
    uint8_t len;
    uint8_t data[15];
    uint16_t delay_ms;
};

// Vendor bring-up for 3.5" ILI9486 SPI modules. MADCTL follows separately.
constexpr InitCommand kInitSequence[] = {
    {Ili9486Display::CMD_SWRESET, 0, {}, 120},
    {Ili9486Display::CMD_SLPOUT, 0, {}, 120},
    {Ili9486Display::CMD_IFMODE, 1, {0x00}, 0},
    {Ili9486Display::CMD_PIXFMT, 1, {0x55}, 0}, // 16 bpp on the serial interface
    {Ili9486Display::CMD_PWCTRL3, 1, {0x44}, 0},
    {Ili9486Display::CMD_VMCTRL, 4, {0x00, 0x00, 0x00, 0x00}, 0},
    {Ili9486Display::CMD_PGAMCTRL, 15,
     {0x0F, 0x1F, 0x1C, 0x0C, 0x0F, 0x08, 0x48, 0x98, 0x37, 0x0A, 0x13, 0x04, 0x11, 0x0D, 0x00}, 0},
    {Ili9486Display::CMD_NGAMCTRL, 15,
     {0x0F, 0x32, 0x2E, 0x0B, 0x0D, 0x05, 0x47, 0x75, 0x37, 0x06, 0x10, 0x03, 0x24, 0x20, 0x00}, 0},
    {Ili9486Display::CMD_DGAMCTRL, 15,
     {0x0F, 0x32, 0x2E, 0x0B, 0x0D, 0x05, 0x47, 0x75, 0x37, 0x06, 0x10, 0x03, 0x24, 0x20, 0x00}, 0},
    {Ili9486Display::CMD_DISPON, 0, {}, 20},
};

} // namespace

uint8_t Ili9486Display::madctl_for(Rotation rotation) {
    switch (rotation) {
    case Rotation::Deg0:   return MADCTL_MX | MADCTL_BGR;
    case Rotation::Deg90:  return MADCTL_MV | MADCTL_BGR;
    case Rotation::Deg180: return MADCTL_MY | MADCTL_BGR;
    case Rotation::Deg270: return MADCTL_MY | MADCTL_MX | MADCTL_MV | MADCTL_BGR;
    }
    return MADCTL_MV | MADCTL_BGR;
}

bool Ili9486Display::swaps_axes(Rotation rotation) {
    return (madctl_for(rotation) & MADCTL_MV) != 0;
}

InitResult Ili9486Display::init(const PanelConfig& cfg) {
    if (!io_) return InitResult::BadConfig;

    if (cfg.pin_dc == cfg.pin_rst || cfg.pin_dc == cfg.pin_bl || cfg.pin_rst == cfg.pin_bl) {
        spdlog::error("[Ili9486] DC={} RST={} BL={} must be distinct lines", cfg.pin_dc, cfg.pin_rst,
                      cfg.pin_bl);
        return InitResult::BadConfig;
    }

    const bool mv = swaps_axes(cfg.rotation);
    const uint16_t w = mv ? kNativeHeight : kNativeWidth;
    const uint16_t h = mv ? kNativeWidth : kNativeHeight;
    if (w != cfg.width || h != cfg.height || w != kPanelWidth || h != kPanelHeight) {
        spdlog::error("[Ili9486] rotation {} addresses {}x{}, panel declared {}x{}",
                      static_cast<int>(cfg.rotation) * 90, w, h, cfg.width, cfg.height);
        return InitResult::BadConfig;
    }

    InitResult r = io_->open(cfg);
    if (r != InitResult::Ok) return r;

    w_ = w;
    h_ = h;
    wire_ = cfg.color_order == ColorOrder::BGR ? PixelFormat::BGR565 : PixelFormat::RGB565;
    madctl_ = madctl_for(cfg.rotation);
    if (io_->max_transfer() < bytes_per_pixel(wire_)) {
        spdlog::error("[Ili9486] link moves {} bytes per write, a pixel needs {}", io_->max_transfer(),
                      bytes_per_pixel(wire_));
        io_->close();
        return InitResult::BadConfig;
    }
    chunk_ = chunk_size_for(io_->max_transfer(), bytes_per_pixel(wire_));
    wire_buf_.reserve(frame_bytes(wire_));

    // Reset, vendor sequence, scan direction; backlight only once all of it took
    if (!hw_reset() || !run_init_sequence()) {
        spdlog::error("[Ili9486] bus error during init sequence");
        io_->close();
        return InitResult::IoError;
    }
    if (!write_cmd(CMD_MADCTL) || !write_data(&madctl_, 1)) {
        spdlog::error("[Ili9486] bus error writing MADCTL");
        io_->close();
        return InitResult::IoError;
    }
    if (!io_->set_backlight(true)) {
        spdlog::error("[Ili9486] backlight line failed");
        io_->close();
        return InitResult::IoError;
    }

    state_ = State::Ready;
    spdlog::info("[Ili9486] ready {}x{} MADCTL=0x{:02X} wire={} chunk={}B", w_, h_, madctl_,
                 to_string(wire_), chunk_);
    return InitResult::Ok;
}

TransferResult Ili9486Display::present(const PixelBuffer& frame) {
    if (state_ != State::Ready) return TransferResult::NotInitialized;

    encode_wire(frame, wire_, wire_buf_);
    if (!set_window(0, 0, w_ - 1, h_ - 1) || !write_cmd(CMD_RAMWR) ||
        !stream(wire_buf_.data(), wire_buf_.size())) {
        spdlog::error("[Ili9486] frame transfer aborted");
        return TransferResult::IoError;
    }
    return TransferResult::Ok;
}

TransferResult Ili9486Display::clear(Rgb color) {
    if (state_ != State::Ready) return TransferResult::NotInitialized;

    // One chunk of the colour, streamed repeatedly
    const uint16_t px = pack565(color, wire_);
    fill_buf_.resize(chunk_);
    for (size_t i = 0; i + 1 < fill_buf_.size(); i += 2) {
        fill_buf_[i]     = static_cast<uint8_t>(px >> 8);
        fill_buf_[i + 1] = static_cast<uint8_t>(px & 0xFF);
    }

    if (!set_window(0, 0, w_ - 1, h_ - 1) || !write_cmd(CMD_RAMWR) || !dc_data()) {
        spdlog::error("[Ili9486] clear aborted");
        return TransferResult::IoError;
    }
    for (const Chunk& c : plan_chunks(frame_bytes(wire_), chunk_, 2)) {
        if (!io_->write(fill_buf_.data(), c.length)) {
            spdlog::error("[Ili9486] clear aborted at byte {}", c.offset);
            return TransferResult::IoError;
        }
    }
    return TransferResult::Ok;
}

void Ili9486Display::shutdown() {
    if (!io_) return;
    if (state_ == State::Ready) {
        if (!io_->set_backlight(false) || !write_cmd(CMD_DISPOFF)) {
            spdlog::warn("[Ili9486] panel did not acknowledge shutdown");
        }
        io_->close();
        spdlog::info("[Ili9486] shut down");
    }
    state_ = State::Shutdown;
}

bool Ili9486Display::dc_command() {
    if (!dc_is_data_) return true;
    if (!io_->set_dc(false)) return false;
    dc_is_data_ = false;
    return true;
}

bool Ili9486Display::dc_data() {
    if (dc_is_data_) return true;
    if (!io_->set_dc(true)) return false;
    dc_is_data_ = true;
    return true;
}

bool Ili9486Display::hw_reset() {
    // Sync the tracked DC level with the line
    if (!io_->set_dc(false)) return false;
    dc_is_data_ = false;

    if (!io_->set_reset(true)) return false;
    io_->delay_ms(10);
    if (!io_->set_reset(false)) return false;
    io_->delay_ms(10);
    if (!io_->set_reset(true)) return false;
    io_->delay_ms(120); // controller boot
    return true;
}

bool Ili9486Display::run_init_sequence() {
    for (const InitCommand& c : kInitSequence) {
        if (!write_cmd(c.cmd)) return false;
        if (c.len && !write_data(c.data, c.len)) return false;
        if (c.delay_ms) io_->delay_ms(c.delay_ms);
    }
    return true;
}

bool Ili9486Display::write_cmd(uint8_t cmd) {
    return dc_command() && io_->write(&cmd, 1);
}

bool Ili9486Display::write_data(const uint8_t* data, size_t len) {
    if (!data || !len) return true;
    return dc_data() && io_->write(data, len);
}

bool Ili9486Display::set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
    uint8_t col[4] = {static_cast<uint8_t>(x0 >> 8), static_cast<uint8_t>(x0 & 0xFF),
                      static_cast<uint8_t>(x1 >> 8), static_cast<uint8_t>(x1 & 0xFF)};
    uint8_t row[4] = {static_cast<uint8_t>(y0 >> 8), static_cast<uint8_t>(y0 & 0xFF),
                      static_cast<uint8_t>(y1 >> 8), static_cast<uint8_t>(y1 & 0xFF)};
    return write_cmd(CMD_CASET) && write_data(col, 4) &&
           write_cmd(CMD_RASET) && write_data(row, 4);
}

bool Ili9486Display::stream(const uint8_t* data, size_t len) {
    // DC stays in data mode for the whole payload
    if (!dc_data()) return false;
    for (const Chunk& c : plan_chunks(len, chunk_, bytes_per_pixel(wire_))) {
        if (!io_->write(data + c.offset, c.length)) {
            spdlog::error("[Ili9486] write failed at byte {} of {}", c.offset, len);
            return false;
        }
    }
    return true;
}

} // namespace ashface
