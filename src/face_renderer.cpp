// Sample face rendering implementation
#include "face_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace ashface {

namespace {

constexpr float kPi = 3.14159265358979323846f;

struct Box {
    int x0, y0, x1, y1;
};

// Scratch RGB888 surface. Pixel (x, y) covers [x, x+1) x [y, y+1); shapes
// test the pixel centre.
class Canvas {
public:
    explicit Canvas(Rgb fill) : px_(frame_bytes(PixelFormat::RGB888)) {
        for (size_t i = 0; i < px_.size(); i += 3) {
            px_[i] = fill.r; px_[i + 1] = fill.g; px_[i + 2] = fill.b;
        }
    }

    void put(int x, int y, Rgb c) {
        if (x < 0 || y < 0 || x >= kPanelWidth || y >= kPanelHeight) return;
        size_t i = (static_cast<size_t>(y) * kPanelWidth + x) * 3;
        px_[i] = c.r; px_[i + 1] = c.g; px_[i + 2] = c.b;
    }

    void fill_ellipse(const Box& b, Rgb c) {
        for_each_in(b, [&](int x, int y, float nx, float ny) {
            if (nx * nx + ny * ny <= 1.f) put(x, y, c);
        });
    }

    // Ring of the given width along the inside of the ellipse edge
    void ellipse_outline(const Box& b, int width, Rgb c) {
        arc(b, 0.f, 360.f, width, c);
    }

    // Angles in degrees, clockwise from 3 o'clock (y grows downward)
    void arc(const Box& b, float start_deg, float end_deg, int width, Rgb c) {
        const Box inner{b.x0 + width, b.y0 + width, b.x1 - width, b.y1 - width};
        const bool has_inner = inner.x1 > inner.x0 && inner.y1 > inner.y0;
        for_each_in(b, [&](int x, int y, float nx, float ny) {
            if (nx * nx + ny * ny > 1.f) return;
            if (has_inner && inside(inner, x, y)) return;
            if (!angle_in(nx, ny, start_deg, end_deg)) return;
            put(x, y, c);
        });
    }

    // Region of the ellipse cut off by the straight line joining the arc ends
    void chord(const Box& b, float start_deg, float end_deg, Rgb c) {
        const float cx = (b.x0 + b.x1) * 0.5f, cy = (b.y0 + b.y1) * 0.5f;
        const float rx = (b.x1 - b.x0) * 0.5f, ry = (b.y1 - b.y0) * 0.5f;
        auto at = [&](float deg, float& ox, float& oy) {
            float a = deg * kPi / 180.f;
            ox = cx + rx * std::cos(a);
            oy = cy + ry * std::sin(a);
        };
        float ax, ay, bx, by, mx, my;
        at(start_deg, ax, ay);
        at(end_deg, bx, by);
        at((start_deg + end_deg) * 0.5f, mx, my);
        auto side = [&](float px, float py) { return (bx - ax) * (py - ay) - (by - ay) * (px - ax); };
        const bool arc_side = side(mx, my) >= 0.f;
        for_each_in(b, [&](int x, int y, float nx, float ny) {
            if (nx * nx + ny * ny > 1.f) return;
            if ((side(x + 0.5f, y + 0.5f) >= 0.f) == arc_side) put(x, y, c);
        });
    }

    void line(int x0, int y0, int x1, int y1, int width, Rgb c) {
        const float half = width * 0.5f;
        const int minx = static_cast<int>(std::floor(std::min(x0, x1) - half));
        const int maxx = static_cast<int>(std::ceil(std::max(x0, x1) + half));
        const int miny = static_cast<int>(std::floor(std::min(y0, y1) - half));
        const int maxy = static_cast<int>(std::ceil(std::max(y0, y1) + half));
        const float dx = static_cast<float>(x1 - x0), dy = static_cast<float>(y1 - y0);
        const float len_sq = dx * dx + dy * dy;
        for (int y = miny; y <= maxy; ++y) {
            for (int x = minx; x <= maxx; ++x) {
                float px = x + 0.5f - x0, py = y + 0.5f - y0;
                float t = len_sq > 0.f ? std::clamp((px * dx + py * dy) / len_sq, 0.f, 1.f) : 0.f;
                float ex = px - t * dx, ey = py - t * dy;
                if (ex * ex + ey * ey <= half * half) put(x, y, c);
            }
        }
    }

    PixelBuffer finish() {
        // Size always matches frame_bytes(RGB888)
        return *PixelBuffer::from_bytes(PixelFormat::RGB888, std::move(px_));
    }

private:
    template <typename Fn> void for_each_in(const Box& b, Fn&& fn) {
        const float cx = (b.x0 + b.x1) * 0.5f, cy = (b.y0 + b.y1) * 0.5f;
        const float rx = (b.x1 - b.x0) * 0.5f, ry = (b.y1 - b.y0) * 0.5f;
        if (rx <= 0.f || ry <= 0.f) return;
        for (int y = b.y0; y <= b.y1; ++y) {
            for (int x = b.x0; x <= b.x1; ++x) {
                fn(x, y, (x + 0.5f - cx) / rx, (y + 0.5f - cy) / ry);
            }
        }
    }

    static bool inside(const Box& b, int x, int y) {
        const float cx = (b.x0 + b.x1) * 0.5f, cy = (b.y0 + b.y1) * 0.5f;
        const float rx = (b.x1 - b.x0) * 0.5f, ry = (b.y1 - b.y0) * 0.5f;
        float nx = (x + 0.5f - cx) / rx, ny = (y + 0.5f - cy) / ry;
        return nx * nx + ny * ny <= 1.f;
    }

    static bool angle_in(float nx, float ny, float start_deg, float end_deg) {
        float a = std::atan2(ny, nx) * 180.f / kPi;
        if (a < 0.f) a += 360.f;
        float s = std::fmod(start_deg, 360.f);
        float e = end_deg - start_deg >= 360.f ? s + 360.f : std::fmod(end_deg, 360.f);
        if (e <= s) e += 360.f;
        if (a < s) a += 360.f;
        return a <= e;
    }

    std::vector<uint8_t> px_;
};

void draw_eye(Canvas& cv, int left, const EyeShape& eye, const FaceRenderParams& p) {
    const Box white{left, eye.top, left + 50, eye.top + eye.height};
    cv.fill_ellipse(white, p.sclera);
    cv.ellipse_outline(white, 2, p.outline);
    const int py = eye.top + 10 + eye.pupil_offset;
    cv.fill_ellipse(Box{left + 15, py, left + 35, py + 20}, p.pupil);
}

void draw_cross(Canvas& cv, int left, const EyeShape& eye, Rgb c) {
    const int top = eye.top + 5, bottom = eye.top + eye.height - 5;
    cv.line(left + 5, top, left + 45, bottom, 4, c);
    cv.line(left + 45, top, left + 5, bottom, 4, c);
}

void draw_mouth(Canvas& cv, Expression e, const FaceRenderParams& p) {
    const Rgb mouth = p.pupil;
    switch (e) {
    case Expression::Happy:
        cv.arc(Box{180, 190, 300, 250}, 0.f, 180.f, 6, mouth);
        cv.chord(Box{180, 190, 300, 240}, 0.f, 180.f, p.accent);
        break;
    case Expression::Sad:
        cv.arc(Box{180, 200, 300, 260}, 180.f, 360.f, 6, mouth);
        break;
    case Expression::Neutral:
        cv.line(190, 215, 290, 215, 5, mouth);
        break;
    case Expression::Listening:
        cv.ellipse_outline(Box{220, 200, 260, 230}, 5, mouth);
        // ears
        cv.arc(Box{60, 130, 100, 170}, 300.f, 420.f, 4, p.outline);
        cv.arc(Box{380, 130, 420, 170}, 120.f, 240.f, 4, p.outline);
        break;
    case Expression::Speaking:
        cv.fill_ellipse(Box{210, 195, 270, 235}, p.outline);
        cv.ellipse_outline(Box{210, 195, 270, 235}, 3, mouth);
        cv.arc(Box{320, 180, 360, 220}, 90.f, 270.f, 3, p.sound);
        cv.arc(Box{365, 175, 410, 225}, 90.f, 270.f, 2, p.sound);
        break;
    case Expression::Thinking: {
        static constexpr int kWave[][2] = {{190, 215}, {210, 220}, {230, 215},
                                           {250, 220}, {270, 215}, {290, 220}};
        for (size_t i = 0; i + 1 < std::size(kWave); ++i) {
            cv.line(kWave[i][0], kWave[i][1], kWave[i + 1][0], kWave[i + 1][1], 5, mouth);
        }
        cv.ellipse_outline(Box{330, 50, 370, 80}, 2, p.thought);
        cv.ellipse_outline(Box{350, 75, 365, 90}, 2, p.thought);
        cv.ellipse_outline(Box{360, 85, 370, 95}, 2, p.thought);
        break;
    }
    case Expression::Error:
        cv.fill_ellipse(Box{215, 200, 265, 240}, p.outline);
        cv.ellipse_outline(Box{215, 200, 265, 240}, 3, p.accent);
        break;
    case Expression::COUNT:
        break;
    }
}

} // namespace

EyeShape eye_shape_for(Expression e) {
    switch (e) {
    case Expression::Happy:     return {110, 40, 5};
    case Expression::Sad:       return {120, 40, -5};
    case Expression::Listening: return {110, 50, 0};
    case Expression::Speaking:  return {115, 35, 0};
    case Expression::Thinking:  return {110, 40, -10};
    case Expression::Error:     return {120, 40, 0};
    case Expression::Neutral:
    case Expression::COUNT:     break;
    }
    return {115, 40, 0};
}

PixelBuffer render_face(Expression e, const FaceRenderParams& p) {
    Canvas cv(p.background);
    const Box face{90, 40, 390, 280};
    cv.fill_ellipse(face, p.face);
    cv.ellipse_outline(face, 3, p.outline);

    const EyeShape eye = eye_shape_for(e);
    draw_eye(cv, 140, eye, p);
    draw_eye(cv, 290, eye, p);
    if (e == Expression::Error) {
        draw_cross(cv, 140, eye, p.accent);
        draw_cross(cv, 290, eye, p.accent);
    }

    draw_mouth(cv, e, p);
    return cv.finish();
}

} // namespace ashface
