#include "pixel_format.hpp"

#include <algorithm>

namespace ashface {

uint16_t pack565(Rgb c, PixelFormat fmt) {
    uint16_t hi = fmt == PixelFormat::BGR565 ? c.b : c.r;
    uint16_t lo = fmt == PixelFormat::BGR565 ? c.r : c.b;
    return static_cast<uint16_t>(((hi >> 3) << 11) | ((c.g >> 2) << 5) | (lo >> 3));
}

Rgb unpack565(uint16_t v, PixelFormat fmt) {
    uint8_t hi5 = static_cast<uint8_t>((v >> 11) & 0x1F);
    uint8_t g6  = static_cast<uint8_t>((v >> 5) & 0x3F);
    uint8_t lo5 = static_cast<uint8_t>(v & 0x1F);
    // Replicate high bits into the low ones so full-scale stays full-scale
    uint8_t hi = static_cast<uint8_t>((hi5 << 3) | (hi5 >> 2));
    uint8_t g  = static_cast<uint8_t>((g6 << 2) | (g6 >> 4));
    uint8_t lo = static_cast<uint8_t>((lo5 << 3) | (lo5 >> 2));
    if (fmt == PixelFormat::BGR565) return Rgb{lo, g, hi};
    return Rgb{hi, g, lo};
}

namespace {

inline Rgb read_pixel(const uint8_t* p, PixelFormat fmt) {
    if (fmt == PixelFormat::RGB888) return Rgb{p[0], p[1], p[2]};
    return unpack565(static_cast<uint16_t>((p[0] << 8) | p[1]), fmt);
}

inline void write_pixel(uint8_t* p, Rgb c, PixelFormat fmt) {
    if (fmt == PixelFormat::RGB888) {
        p[0] = c.r; p[1] = c.g; p[2] = c.b;
        return;
    }
    uint16_t v = pack565(c, fmt);
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

void transcode(const PixelBuffer& src, PixelFormat target, uint8_t* dst) {
    const size_t count = static_cast<size_t>(src.width()) * src.height();
    const size_t sbpp = bytes_per_pixel(src.format());
    const size_t dbpp = bytes_per_pixel(target);
    const uint8_t* s = src.data();
    for (size_t i = 0; i < count; ++i) {
        write_pixel(dst + i * dbpp, read_pixel(s + i * sbpp, src.format()), target);
    }
}

} // namespace

PixelBuffer convert(const PixelBuffer& src, PixelFormat target) {
    if (src.format() == target) return src;
    std::vector<uint8_t> out(frame_bytes(target));
    transcode(src, target, out.data());
    return *PixelBuffer::from_bytes(target, std::move(out));
}

void encode_wire(const PixelBuffer& src, PixelFormat wire, std::vector<uint8_t>& out) {
    out.resize(frame_bytes(wire));
    if (src.format() == wire) {
        std::copy(src.data(), src.data() + src.size(), out.begin());
        return;
    }
    transcode(src, wire, out.data());
}

size_t chunk_size_for(size_t max_chunk, size_t unit) {
    if (unit == 0) return max_chunk;
    size_t n = max_chunk - (max_chunk % unit);
    return n == 0 ? unit : n;
}

std::vector<Chunk> plan_chunks(size_t total, size_t max_chunk, size_t unit) {
    std::vector<Chunk> chunks;
    const size_t step = chunk_size_for(max_chunk, unit);
    if (step == 0) return chunks;
    chunks.reserve((total + step - 1) / step);
    for (size_t off = 0; off < total; off += step) {
        chunks.push_back(Chunk{off, std::min(step, total - off)});
    }
    return chunks;
}

} // namespace ashface
