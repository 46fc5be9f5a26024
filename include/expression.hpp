#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ashface {

enum class Expression : uint8_t { Neutral, Happy, Sad, Listening, Speaking, Thinking, Error, COUNT };

constexpr size_t kExpressionCount = static_cast<size_t>(Expression::COUNT);

constexpr std::array<Expression, kExpressionCount> kAllExpressions{
    Expression::Neutral, Expression::Happy, Expression::Sad, Expression::Listening,
    Expression::Speaking, Expression::Thinking, Expression::Error,
};

constexpr size_t index_of(Expression e) { return static_cast<size_t>(e); }

// Lower-case name, also the image file stem ("happy" -> happy.png)
const char* to_string(Expression e);

std::optional<Expression> expression_from_name(std::string_view name);

} // namespace ashface
