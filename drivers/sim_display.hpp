#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "display.hpp"
#include "panel_config.hpp"
#include "pixel_buffer.hpp"

namespace ashface {

// Software-only panel: keeps the last frame in memory, optionally mirrored to a PNG
class SimDisplay {
public:
    SimDisplay() = default;
    ~SimDisplay() { shutdown(); }
    SimDisplay(SimDisplay&& other) noexcept
        : ready_(other.ready_), snapshot_path_(std::move(other.snapshot_path_)),
          frame_(std::move(other.frame_)), frames_(other.frames_) {
        other.ready_ = false;
    }
    SimDisplay& operator=(SimDisplay&&) = delete;

    InitResult init(const PanelConfig& cfg); // never fails
    TransferResult present(const PixelBuffer& frame);
    TransferResult clear(Rgb color);
    void shutdown();

    bool initialized() const { return ready_; }
    const std::optional<PixelBuffer>& frame() const { return frame_; }
    uint32_t frames_presented() const { return frames_; }

private:
    TransferResult snapshot();

    bool ready_ = false;
    std::string snapshot_path_;
    std::optional<PixelBuffer> frame_;
    uint32_t frames_ = 0;
};

} // namespace ashface
