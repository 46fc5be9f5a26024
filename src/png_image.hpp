// PNG file I/O on top of libpng's simplified API
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pixel_buffer.hpp"

namespace ashface {

enum class PngRead : uint8_t { Ok, NotFound, DecodeFailure, WrongSize };

// Decodes path to packed RGB888 (alpha composited onto black). Size is checked
// from the header before any pixel data is decoded; on WrongSize, width and
// height hold the size found.
PngRead read_png_rgb(const std::string& path, uint32_t expect_w, uint32_t expect_h,
                     std::vector<uint8_t>& out, uint32_t* width = nullptr, uint32_t* height = nullptr);

// Writes any frame as 8-bit RGB PNG
bool write_png(const std::string& path, const PixelBuffer& frame);
// Raw RGB888 rows of arbitrary size (test fixtures, tools)
bool write_png_rgb(const std::string& path, uint32_t width, uint32_t height, const uint8_t* rgb);

} // namespace ashface
