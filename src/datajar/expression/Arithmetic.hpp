#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace DJ::Arithmetic {

struct Token {
    enum class Type {
        Number,
        Plus,
        Minus,
        Star,
        Slash,
        Percent,
        LeftParen,
        RightParen,
        End
    };

    Type        type     = Type::End;
    double      value    = 0.0;
    std::size_t position = 0;
};

// Deepest run of nested parentheses and unary signs evaluate() accepts.
constexpr std::size_t MaxNestingDepth = 256;

// Splits an arithmetic string into tokens. Whitespace separates tokens and is dropped.
[[nodiscard]] auto tokenize(std::string_view text) -> Expected<std::vector<Token>>;

/**
 * Evaluates a 4-function expression with modulo and parentheses over doubles.
 *
 *   expression := term (('+' | '-') term)*
 *   term       := unary (('*' | '/' | '%') unary)*
 *   unary      := ('-' | '+') unary | primary
 *   primary    := number | '(' expression ')'
 *
 * Operators are left associative. Division and modulo follow IEEE semantics,
 * so x / 0 is an infinity and x % 0 is NaN. Malformed input, or nesting
 * deeper than MaxNestingDepth, returns Error::Code::ArithmeticError.
 */
[[nodiscard]] auto evaluate(std::string_view text) -> Expected<double>;

} // namespace DJ::Arithmetic
