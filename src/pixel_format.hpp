// Pixel format conversion and transfer chunk planning (pure helpers)
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pixel_buffer.hpp"

namespace ashface {

// 5-6-5 packing. fmt must be RGB565 or BGR565.
uint16_t pack565(Rgb c, PixelFormat fmt);
Rgb unpack565(uint16_t v, PixelFormat fmt);

// Returns src unchanged (shared payload) when formats already match.
PixelBuffer convert(const PixelBuffer& src, PixelFormat target);

// Writes src in `wire` (RGB565 or BGR565) big-endian order into out.
// out is resized to exactly frame_bytes(wire); its capacity is reused.
void encode_wire(const PixelBuffer& src, PixelFormat wire, std::vector<uint8_t>& out);

struct Chunk {
    size_t offset{0};
    size_t length{0};
};

// Largest multiple of unit not above max_chunk (at least one unit)
size_t chunk_size_for(size_t max_chunk, size_t unit);

// Splits total bytes into consecutive pieces of chunk_size_for(max_chunk, unit)
// bytes; only the last may be shorter. Boundaries never fall inside a unit.
std::vector<Chunk> plan_chunks(size_t total, size_t max_chunk, size_t unit);

} // namespace ashface
