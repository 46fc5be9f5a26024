#include <gtest/gtest.h>

#include "face_renderer.hpp"

using namespace ashface;

namespace {

constexpr Rgb kBackground{0x2C, 0x3E, 0x50};
constexpr Rgb kFace{0xEC, 0xF0, 0xF1};
constexpr Rgb kSclera{0xFF, 0xFF, 0xFF};
constexpr Rgb kAccent{0xE7, 0x4C, 0x3C};

TEST(FaceRenderer, FullPanelRgbFrame) {
    const PixelBuffer f = render_face(Expression::Neutral);
    EXPECT_EQ(f.format(), PixelFormat::RGB888);
    EXPECT_EQ(f.size(), frame_bytes(PixelFormat::RGB888));
}

TEST(FaceRenderer, BackgroundFaceAndEyes) {
    const PixelBuffer f = render_face(Expression::Neutral);
    EXPECT_EQ(f.pixel(0, 0), kBackground);
    EXPECT_EQ(f.pixel(479, 319), kBackground);
    EXPECT_EQ(f.pixel(240, 70), kFace);
    // Sclera beside the pupil in both eyes
    const EyeShape eye = eye_shape_for(Expression::Neutral);
    const uint16_t y = static_cast<uint16_t>(eye.top + eye.height / 2);
    EXPECT_EQ(f.pixel(147, y), kSclera);
    EXPECT_EQ(f.pixel(297, y), kSclera);
    // Pupil centre
    EXPECT_EQ(f.pixel(165, static_cast<uint16_t>(eye.top + 20)), kBackground);
}

TEST(FaceRenderer, EyeShapesPerExpression) {
    EXPECT_EQ(eye_shape_for(Expression::Neutral).top, 115);
    EXPECT_EQ(eye_shape_for(Expression::Listening).height, 50);
    EXPECT_EQ(eye_shape_for(Expression::Thinking).pupil_offset, -10);
    EXPECT_EQ(eye_shape_for(Expression::Sad).pupil_offset, -5);
}

TEST(FaceRenderer, ErrorEyesAreCrossedOut) {
    const PixelBuffer f = render_face(Expression::Error);
    const EyeShape eye = eye_shape_for(Expression::Error);
    const uint16_t cy = static_cast<uint16_t>(eye.top + eye.height / 2);
    EXPECT_EQ(f.pixel(165, cy), kAccent);
    EXPECT_EQ(f.pixel(315, cy), kAccent);
    EXPECT_NE(render_face(Expression::Sad).pixel(165, cy), kAccent);
}

TEST(FaceRenderer, HappyMouthHasTongue) {
    const PixelBuffer f = render_face(Expression::Happy);
    EXPECT_EQ(f.pixel(240, 225), kAccent);
    EXPECT_EQ(render_face(Expression::Neutral).pixel(240, 225), kFace);
}

TEST(FaceRenderer, EveryExpressionDistinct) {
    for (size_t i = 0; i < kAllExpressions.size(); ++i) {
        for (size_t j = i + 1; j < kAllExpressions.size(); ++j) {
            EXPECT_NE(render_face(kAllExpressions[i]), render_face(kAllExpressions[j]))
                << to_string(kAllExpressions[i]) << " vs " << to_string(kAllExpressions[j]);
        }
    }
}

TEST(FaceRenderer, Deterministic) {
    EXPECT_EQ(render_face(Expression::Speaking), render_face(Expression::Speaking));
}

} // namespace
