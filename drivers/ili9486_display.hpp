#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "display.hpp"
#include "panel_config.hpp"
#include "panel_io.hpp"
#include "pixel_buffer.hpp"

namespace ashface {

// ILI9486 panel controller over a command/data serial link.
// Native scan is 320x480; rotations with MV set address the 480x320 frame.
class Ili9486Display {
public:
    explicit Ili9486Display(std::unique_ptr<PanelIo> io) : io_(std::move(io)) {}
    ~Ili9486Display() { shutdown(); }
    Ili9486Display(Ili9486Display&&) = default;
    Ili9486Display& operator=(Ili9486Display&&) = delete;

    InitResult init(const PanelConfig& cfg);
    TransferResult present(const PixelBuffer& frame);
    TransferResult clear(Rgb color);
    void shutdown();

    bool initialized() const { return state_ == State::Ready; }
    PixelFormat wire_format() const { return wire_; }
    uint8_t madctl() const { return madctl_; }
    size_t chunk_bytes() const { return chunk_; }

    static uint8_t madctl_for(Rotation rotation);
    static bool swaps_axes(Rotation rotation);

    static constexpr uint16_t kNativeWidth  = 320;
    static constexpr uint16_t kNativeHeight = 480;

    // ILI9486 command set (subset)
    static constexpr uint8_t CMD_NOP      = 0x00;
    static constexpr uint8_t CMD_SWRESET  = 0x01;
    static constexpr uint8_t CMD_SLPIN    = 0x10;
    static constexpr uint8_t CMD_SLPOUT   = 0x11;
    static constexpr uint8_t CMD_DISPOFF  = 0x28;
    static constexpr uint8_t CMD_DISPON   = 0x29;
    static constexpr uint8_t CMD_CASET    = 0x2A;
    static constexpr uint8_t CMD_RASET    = 0x2B;
    static constexpr uint8_t CMD_RAMWR    = 0x2C;
    static constexpr uint8_t CMD_MADCTL   = 0x36;
    static constexpr uint8_t CMD_PIXFMT   = 0x3A;
    static constexpr uint8_t CMD_IFMODE   = 0xB0;
    static constexpr uint8_t CMD_PWCTRL3  = 0xC2;
    static constexpr uint8_t CMD_VMCTRL   = 0xC5;
    static constexpr uint8_t CMD_PGAMCTRL = 0xE0;
    static constexpr uint8_t CMD_NGAMCTRL = 0xE1;
    static constexpr uint8_t CMD_DGAMCTRL = 0xE2;

    // MADCTL bits
    static constexpr uint8_t MADCTL_MY  = 0x80;
    static constexpr uint8_t MADCTL_MX  = 0x40;
    static constexpr uint8_t MADCTL_MV  = 0x20;
    static constexpr uint8_t MADCTL_BGR = 0x08;

private:
    enum class State : uint8_t { Idle, Ready, Shutdown };

    bool dc_command();
    bool dc_data();
    bool hw_reset();
    bool run_init_sequence();
    bool write_cmd(uint8_t cmd);
    bool write_data(const uint8_t* data, size_t len);
    bool set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);
    bool stream(const uint8_t* data, size_t len);

    std::unique_ptr<PanelIo> io_;
    State state_ = State::Idle;
    bool dc_is_data_ = false; // level last driven on the DC line
    uint8_t madctl_ = 0;
    PixelFormat wire_ = PixelFormat::RGB565;
    uint16_t w_ = kPanelWidth;
    uint16_t h_ = kPanelHeight;
    size_t chunk_ = 0;
    std::vector<uint8_t> wire_buf_;  // one frame in wire format, reused
    std::vector<uint8_t> fill_buf_;  // one chunk of a repeated colour
};

} // namespace ashface
