#include "expression.hpp"

namespace ashface {

const char* to_string(Expression e) {
    switch (e) {
    case Expression::Neutral:   return "neutral";
    case Expression::Happy:     return "happy";
    case Expression::Sad:       return "sad";
    case Expression::Listening: return "listening";
    case Expression::Speaking:  return "speaking";
    case Expression::Thinking:  return "thinking";
    case Expression::Error:     return "error";
    case Expression::COUNT:     break;
    }
    return "?";
}

std::optional<Expression> expression_from_name(std::string_view name) {
    for (Expression e : kAllExpressions) {
        if (name == to_string(e)) return e;
    }
    return std::nullopt;
}

} // namespace ashface
