// Sample face rendering (placeholder artwork for bring-up and tests)
#pragma once

#include <cstdint>

#include "expression.hpp"
#include "pixel_buffer.hpp"

namespace ashface {

struct FaceRenderParams {
    Rgb background{0x2C, 0x3E, 0x50};
    Rgb face{0xEC, 0xF0, 0xF1};
    Rgb outline{0x34, 0x49, 0x5E};
    Rgb sclera{0xFF, 0xFF, 0xFF};
    Rgb pupil{0x2C, 0x3E, 0x50};
    Rgb accent{0xE7, 0x4C, 0x3C};   // tongue, error marks
    Rgb sound{0x34, 0x98, 0xDB};    // speaking waves
    Rgb thought{0x95, 0xA5, 0xA6};  // thinking bubble
};

// Eye placement per expression. Both eyes are 50 px wide at x 140 and 290.
struct EyeShape {
    int top;
    int height;
    int pupil_offset; // negative looks up
};

EyeShape eye_shape_for(Expression e);

// Draws background, face disc, eyes with pupils and the expression's mouth
// into a full-panel RGB888 frame. Error gets crossed-out eyes.
PixelBuffer render_face(Expression e, const FaceRenderParams& params = FaceRenderParams{});

} // namespace ashface
