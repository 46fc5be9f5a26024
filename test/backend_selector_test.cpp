#include <gtest/gtest.h>

#include "backend_selector.hpp"
#include "face_renderer.hpp"

using namespace ashface;

namespace {

PanelConfig absent_devices() {
    PanelConfig cfg;
    cfg.spi_bus = 99;
    cfg.gpio_chip = 99;
    cfg.fb_device = 99;
    return cfg;
}

TEST(BackendSelector, DevicePaths) {
    PanelConfig cfg;
    EXPECT_EQ(spidev_path(cfg), "/dev/spidev0.0");
    EXPECT_EQ(gpiochip_path(cfg), "/dev/gpiochip0");
    EXPECT_EQ(fbdev_path(cfg), "/dev/fb1");
}

TEST(BackendSelector, ProbesReportAbsentDevices) {
    const PanelConfig cfg = absent_devices();
    EXPECT_NE(probe_hardware(cfg).find("/dev/spidev99.0"), std::string::npos);
    EXPECT_NE(probe_framebuffer(cfg).find("/dev/fb99"), std::string::npos);
}

TEST(BackendSelector, FallsBackToSimulation) {
    DisplayBackend backend = select_backend(absent_devices());
    EXPECT_EQ(backend.kind(), BackendKind::Simulated);
    EXPECT_STREQ(backend.name(), "simulated");
    EXPECT_TRUE(backend.initialized());
    EXPECT_NE(backend.get_if<SimDisplay>(), nullptr);
    EXPECT_EQ(backend.get_if<Ili9486Display>(), nullptr);

    const PixelBuffer face = render_face(Expression::Thinking);
    ASSERT_EQ(backend.present(face), TransferResult::Ok);
    EXPECT_EQ(*backend.get_if<SimDisplay>()->frame(), face);

    backend.shutdown();
    EXPECT_FALSE(backend.initialized());
    EXPECT_EQ(backend.present(face), TransferResult::NotInitialized);
}

} // namespace
