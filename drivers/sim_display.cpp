#include "sim_display.hpp"

#include <spdlog/spdlog.h>

#include "png_image.hpp"

namespace ashface {

InitResult SimDisplay::init(const PanelConfig& cfg) {
    snapshot_path_ = cfg.sim_snapshot_path;
    frame_.reset();
    frames_ = 0;
    ready_ = true;
    if (snapshot_path_.empty()) {
        spdlog::info("[Sim] {}x{} in-memory panel", kPanelWidth, kPanelHeight);
    } else {
        spdlog::info("[Sim] {}x{} panel, snapshots to {}", kPanelWidth, kPanelHeight, snapshot_path_);
    }
    return InitResult::Ok;
}

TransferResult SimDisplay::present(const PixelBuffer& frame) {
    if (!ready_) return TransferResult::NotInitialized;
    frame_ = frame;
    ++frames_;
    return snapshot();
}

TransferResult SimDisplay::clear(Rgb color) {
    if (!ready_) return TransferResult::NotInitialized;
    frame_ = PixelBuffer::solid(frame_ ? frame_->format() : PixelFormat::RGB888, color);
    return snapshot();
}

void SimDisplay::shutdown() {
    if (!ready_) return;
    ready_ = false;
    spdlog::debug("[Sim] shut down after {} frames", frames_);
}

TransferResult SimDisplay::snapshot() {
    if (snapshot_path_.empty()) return TransferResult::Ok;
    if (!write_png(snapshot_path_, *frame_)) return TransferResult::IoError;
    return TransferResult::Ok;
}

} // namespace ashface
