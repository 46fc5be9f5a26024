#include <gtest/gtest.h>

#include <vector>

#include "face_renderer.hpp"
#include "fbdev_display.hpp"

using namespace ashface;

namespace {

FbLayout rgb565_layout(uint32_t padding) {
    FbLayout l;
    l.width = kPanelWidth;
    l.height = kPanelHeight;
    l.bits_per_pixel = 16;
    l.line_length = kPanelWidth * 2 + padding;
    l.red_offset = 11;
    l.red_length = 5;
    l.green_offset = 5;
    l.green_length = 6;
    l.blue_offset = 0;
    l.blue_length = 5;
    return l;
}

FbLayout xrgb8888_layout() {
    FbLayout l;
    l.width = kPanelWidth;
    l.height = kPanelHeight;
    l.bits_per_pixel = 32;
    l.line_length = kPanelWidth * 4;
    l.red_offset = 16;
    l.red_length = 8;
    l.green_offset = 8;
    l.green_length = 8;
    l.blue_offset = 0;
    l.blue_length = 8;
    return l;
}

TEST(FbPack, PlacesChannelsAtReportedOffsets) {
    EXPECT_EQ(fb_pack(Rgb{0xFF, 0, 0}, rgb565_layout(0)), 0xF800u);
    EXPECT_EQ(fb_pack(Rgb{0, 0xFF, 0}, rgb565_layout(0)), 0x07E0u);
    EXPECT_EQ(fb_pack(Rgb{0x12, 0x34, 0x56}, xrgb8888_layout()), 0x123456u);

    FbLayout bgr = xrgb8888_layout();
    bgr.red_offset = 0;
    bgr.blue_offset = 16;
    EXPECT_EQ(fb_pack(Rgb{0x12, 0x34, 0x56}, bgr), 0x563412u);
}

TEST(FbWriteFrame, Rgb565WithPaddedStride) {
    const FbLayout l = rgb565_layout(64);
    std::vector<uint8_t> mem(static_cast<size_t>(l.line_length) * l.height, 0xAA);

    fb_write_frame(PixelBuffer::solid(PixelFormat::RGB888, Rgb{0xFF, 0, 0}), l, mem.data());

    for (uint32_t y : {0u, 1u, 319u}) {
        const uint8_t* row = mem.data() + static_cast<size_t>(y) * l.line_length;
        EXPECT_EQ(row[0], 0x00);
        EXPECT_EQ(row[1], 0xF8);
        EXPECT_EQ(row[479 * 2 + 1], 0xF8);
        // Padding past the visible width is untouched
        EXPECT_EQ(row[480 * 2], 0xAA);
        EXPECT_EQ(row[l.line_length - 1], 0xAA);
    }
}

TEST(FbWriteFrame, Xrgb8888MatchesSourcePixels) {
    const FbLayout l = xrgb8888_layout();
    std::vector<uint8_t> mem(static_cast<size_t>(l.line_length) * l.height, 0);
    const PixelBuffer face = render_face(Expression::Happy);

    fb_write_frame(face, l, mem.data());

    for (uint16_t y : {0, 100, 160, 230, 319}) {
        for (uint16_t x : {0, 120, 240, 479}) {
            const uint8_t* p = mem.data() + static_cast<size_t>(y) * l.line_length + x * 4u;
            const Rgb c = face.pixel(x, y);
            EXPECT_EQ(p[0], c.b);
            EXPECT_EQ(p[1], c.g);
            EXPECT_EQ(p[2], c.r);
        }
    }
}

TEST(FbWriteFrame, HonoursVisibleOffset) {
    FbLayout l = rgb565_layout(0);
    l.visible_offset = static_cast<size_t>(l.line_length) * kPanelHeight; // second page
    std::vector<uint8_t> mem(static_cast<size_t>(l.line_length) * l.height * 2, 0xAA);

    fb_fill(Rgb{0, 0, 0xFF}, l, mem.data());

    EXPECT_EQ(mem[0], 0xAA);
    EXPECT_EQ(mem[l.visible_offset - 1], 0xAA);
    EXPECT_EQ(mem[l.visible_offset], 0x1F);
    EXPECT_EQ(mem[l.visible_offset + 1], 0x00);
    EXPECT_EQ(mem.back(), 0x00);
}

TEST(FbFill, FillsEveryRowOnly) {
    const FbLayout l = rgb565_layout(16);
    std::vector<uint8_t> mem(static_cast<size_t>(l.line_length) * l.height, 0xAA);
    fb_fill(Rgb{0xFF, 0xFF, 0xFF}, l, mem.data());
    for (uint32_t y = 0; y < l.height; ++y) {
        const uint8_t* row = mem.data() + static_cast<size_t>(y) * l.line_length;
        ASSERT_EQ(row[0], 0xFF);
        ASSERT_EQ(row[959], 0xFF);
        ASSERT_EQ(row[960], 0xAA);
    }
}

TEST(FbdevDisplay, MissingDeviceReportsNotFound) {
    PanelConfig cfg;
    cfg.fb_device = 250;
    FbdevDisplay fb;
    EXPECT_EQ(fb.init(cfg), InitResult::DeviceNotFound);
    EXPECT_FALSE(fb.initialized());
    EXPECT_EQ(fb.present(PixelBuffer::solid(PixelFormat::RGB888, Rgb{})), TransferResult::NotInitialized);
    EXPECT_EQ(fb.clear(Rgb{}), TransferResult::NotInitialized);
}

} // namespace
