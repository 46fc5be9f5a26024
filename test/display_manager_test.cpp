#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "display_manager.hpp"
#include "face_renderer.hpp"
#include "ili9486_display.hpp"
#include "pixel_format.hpp"
#include "png_image.hpp"
#include "recording_panel_io.hpp"
#include "temp_dir.hpp"

using namespace ashface;
using ashface::test::IoEvent;
using ashface::test::IoLog;
using ashface::test::RecordingPanelIo;
using ashface::test::TempDir;

namespace {

class DisplayManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.ok());
        for (Expression e : kAllExpressions) {
            ASSERT_TRUE(write_png(dir_.file(std::string(to_string(e)) + ".png"), render_face(e)));
        }
        auto r = ExpressionCache::load(dir_.path().string());
        ASSERT_TRUE(std::holds_alternative<ExpressionCache>(r));
        cache_.emplace(std::move(std::get<ExpressionCache>(r)));
    }

    static DisplayBackend sim_backend() {
        SimDisplay sim;
        EXPECT_EQ(sim.init(PanelConfig{}), InitResult::Ok);
        return DisplayBackend(std::move(sim));
    }

    static std::optional<PixelBuffer> shown(DisplayManager& mgr) {
        return mgr.with_backend([](DisplayBackend& b) { return b.get_if<SimDisplay>()->frame(); });
    }

    TempDir dir_;
    std::optional<ExpressionCache> cache_;
};

TEST_F(DisplayManagerTest, ShowPresentsCachedFrame) {
    DisplayManager mgr(sim_backend(), *cache_);
    EXPECT_FALSE(mgr.current().has_value());

    ASSERT_EQ(mgr.show(Expression::Happy), TransferResult::Ok);
    EXPECT_EQ(mgr.current(), Expression::Happy);
    auto frame = shown(mgr);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, render_face(Expression::Happy));
}

TEST_F(DisplayManagerTest, ShowByName) {
    DisplayManager mgr(sim_backend(), *cache_);
    EXPECT_TRUE(mgr.show("sad"));
    EXPECT_EQ(mgr.current(), Expression::Sad);

    EXPECT_FALSE(mgr.show("grumpy"));
    EXPECT_EQ(mgr.current(), Expression::Sad);
    EXPECT_EQ(*shown(mgr), cache_->get(Expression::Sad));
}

TEST_F(DisplayManagerTest, ClearForgetsCurrentExpression) {
    DisplayManager mgr(sim_backend(), *cache_);
    ASSERT_EQ(mgr.show(Expression::Speaking), TransferResult::Ok);
    ASSERT_EQ(mgr.clear(), TransferResult::Ok);
    EXPECT_FALSE(mgr.current().has_value());
    EXPECT_EQ(shown(mgr)->pixel(240, 160), (Rgb{0, 0, 0}));
}

TEST_F(DisplayManagerTest, TourVisitsEveryExpression) {
    DisplayManager mgr(sim_backend(), *cache_);
    ASSERT_EQ(mgr.tour(0), TransferResult::Ok);
    EXPECT_EQ(mgr.current(), Expression::Error);
    const uint32_t frames = mgr.with_backend(
        [](DisplayBackend& b) { return b.get_if<SimDisplay>()->frames_presented(); });
    EXPECT_EQ(frames, kExpressionCount);
}

TEST_F(DisplayManagerTest, CloseShutsBackendDown) {
    DisplayManager mgr(sim_backend(), *cache_);
    ASSERT_EQ(mgr.show(Expression::Happy), TransferResult::Ok);
    mgr.close();
    EXPECT_FALSE(mgr.current().has_value());
    EXPECT_EQ(mgr.show(Expression::Happy), TransferResult::NotInitialized);
    EXPECT_FALSE(mgr.with_backend([](DisplayBackend& b) { return b.initialized(); }));
    mgr.close();
}

TEST_F(DisplayManagerTest, ConcurrentCallersAreSerialized) {
    DisplayManager mgr(sim_backend(), *cache_);
    std::vector<std::thread> threads;
    for (Expression e : kAllExpressions) {
        threads.emplace_back([&mgr, e] {
            for (int i = 0; i < 5; ++i) EXPECT_EQ(mgr.show(e), TransferResult::Ok);
        });
    }
    for (auto& t : threads) t.join();

    const uint32_t frames = mgr.with_backend(
        [](DisplayBackend& b) { return b.get_if<SimDisplay>()->frames_presented(); });
    EXPECT_EQ(frames, kExpressionCount * 5);
    ASSERT_TRUE(mgr.current().has_value());
    EXPECT_EQ(*shown(mgr), cache_->get(*mgr.current()));
}

// Startup to first expression over the hardware driver with a recording link
TEST_F(DisplayManagerTest, HardwarePanelReceivesCachedFaceBytes) {
    auto log = std::make_shared<IoLog>();
    Ili9486Display panel(std::make_unique<RecordingPanelIo>(log));
    ASSERT_EQ(panel.init(PanelConfig{}), InitResult::Ok);
    DisplayManager mgr(DisplayBackend(std::move(panel)), *cache_);
    EXPECT_EQ(mgr.backend_kind(), BackendKind::Hardware);
    log->reset_events();

    ASSERT_EQ(mgr.show(Expression::Happy), TransferResult::Ok);

    std::vector<uint8_t> sent;
    bool streaming = false;
    for (const auto& e : log->events) {
        if (e.type != IoEvent::Type::Write) continue;
        if (!e.dc_data) {
            streaming = e.bytes[0] == Ili9486Display::CMD_RAMWR;
            continue;
        }
        if (streaming) sent.insert(sent.end(), e.bytes.begin(), e.bytes.end());
    }
    std::vector<uint8_t> expected;
    encode_wire(cache_->get(Expression::Happy), PixelFormat::RGB565, expected);
    EXPECT_EQ(sent, expected);

    mgr.close();
    EXPECT_FALSE(log->open);
}

} // namespace
