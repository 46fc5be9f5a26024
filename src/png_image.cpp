#include "png_image.hpp"

#include <png.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <system_error>
#include <filesystem>

#include "pixel_format.hpp"

namespace ashface {

PngRead read_png_rgb(const std::string& path, uint32_t expect_w, uint32_t expect_h,
                     std::vector<uint8_t>& out, uint32_t* width, uint32_t* height) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return PngRead::NotFound;

    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, path.c_str())) {
        spdlog::debug("[Png] {}: {}", path, image.message);
        return PngRead::DecodeFailure;
    }

    if (width) *width = image.width;
    if (height) *height = image.height;
    if (image.width != expect_w || image.height != expect_h) {
        png_image_free(&image);
        return PngRead::WrongSize;
    }

    image.format = PNG_FORMAT_RGB;
    out.assign(PNG_IMAGE_SIZE(image), 0);
    if (!png_image_finish_read(&image, nullptr, out.data(), 0, nullptr)) {
        spdlog::debug("[Png] {}: {}", path, image.message);
        out.clear();
        return PngRead::DecodeFailure;
    }
    return PngRead::Ok;
}

bool write_png_rgb(const std::string& path, uint32_t width, uint32_t height, const uint8_t* rgb) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    image.width = width;
    image.height = height;
    image.format = PNG_FORMAT_RGB;
    if (!png_image_write_to_file(&image, path.c_str(), 0, rgb, 0, nullptr)) {
        spdlog::error("[Png] write {} failed: {}", path, image.message);
        return false;
    }
    return true;
}

bool write_png(const std::string& path, const PixelBuffer& frame) {
    const PixelBuffer rgb = convert(frame, PixelFormat::RGB888);
    return write_png_rgb(path, rgb.width(), rgb.height(), rgb.data());
}

} // namespace ashface
