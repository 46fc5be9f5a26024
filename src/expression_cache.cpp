#include "expression_cache.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

#include "png_image.hpp"

namespace ashface {

const char* to_string(LoadError::Kind k) {
    switch (k) {
    case LoadError::Kind::Missing:       return "missing";
    case LoadError::Kind::WrongSize:     return "wrong size";
    case LoadError::Kind::DecodeFailure: return "decode failure";
    }
    return "?";
}

std::variant<ExpressionCache, LoadError> ExpressionCache::load(const std::string& directory) {
    std::vector<PixelBuffer> frames;
    frames.reserve(kExpressionCount);

    for (Expression e : kAllExpressions) {
        const std::string path =
            (std::filesystem::path(directory) / (std::string(to_string(e)) + ".png")).string();

        std::vector<uint8_t> rgb;
        uint32_t w = 0, h = 0;
        switch (read_png_rgb(path, kPanelWidth, kPanelHeight, rgb, &w, &h)) {
        case PngRead::Ok:
            break;
        case PngRead::NotFound:
            spdlog::error("[Cache] missing face image {}", path);
            return LoadError{LoadError::Kind::Missing, e, path};
        case PngRead::WrongSize:
            spdlog::error("[Cache] {} is {}x{}, expected {}x{}", path, w, h, kPanelWidth, kPanelHeight);
            return LoadError{LoadError::Kind::WrongSize, e, path};
        case PngRead::DecodeFailure:
            spdlog::error("[Cache] cannot decode {}", path);
            return LoadError{LoadError::Kind::DecodeFailure, e, path};
        }

        auto frame = PixelBuffer::from_bytes(PixelFormat::RGB888, std::move(rgb));
        if (!frame) {
            spdlog::error("[Cache] {} decoded to an unexpected payload size", path);
            return LoadError{LoadError::Kind::DecodeFailure, e, path};
        }
        frames.push_back(std::move(*frame));
        spdlog::debug("[Cache] loaded {}", to_string(e));
    }

    spdlog::info("[Cache] {} expressions loaded from {}", frames.size(), directory);
    return ExpressionCache(std::move(frames));
}

} // namespace ashface
