#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "expression.hpp"
#include "pixel_buffer.hpp"

namespace ashface {

struct LoadError {
    enum class Kind : uint8_t { Missing, WrongSize, DecodeFailure };
    Kind kind;
    Expression which;
    std::string path;
};

const char* to_string(LoadError::Kind k);

// All seven expression frames, loaded once and read-only afterwards.
// Safe to share between threads without locking.
class ExpressionCache {
public:
    // Reads <directory>/<name>.png for every expression. Either every frame
    // loads and validates, or the first failure (in enum order) is returned.
    static std::variant<ExpressionCache, LoadError> load(const std::string& directory);

    // Throws std::out_of_range for Expression::COUNT
    const PixelBuffer& get(Expression e) const { return frames_.at(index_of(e)); }

private:
    explicit ExpressionCache(std::vector<PixelBuffer> frames) : frames_(std::move(frames)) {}

    std::vector<PixelBuffer> frames_; // indexed by Expression
};

} // namespace ashface
