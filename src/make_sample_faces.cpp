// Writes placeholder <expression>.png files for every expression.
// ashface_make_faces [output_dir]
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <system_error>

#include "expression.hpp"
#include "face_renderer.hpp"
#include "png_image.hpp"

using namespace ashface;

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    const std::filesystem::path dir = argc > 1 ? argv[1] : "assets/faces";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::error("[Faces] cannot create {}: {}", dir.string(), ec.message());
        return 1;
    }

    for (Expression e : kAllExpressions) {
        const std::string path = (dir / (std::string(to_string(e)) + ".png")).string();
        if (!write_png(path, render_face(e))) {
            spdlog::error("[Faces] failed to write {}", path);
            return 1;
        }
        spdlog::info("[Faces] wrote {}", path);
    }
    return 0;
}
