#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace DJ {

inline constexpr std::string_view EvaluationErrorSentinel = "ERR";

struct Evaluation {
    std::variant<std::string, double> result;
    std::optional<Error>              error;

    [[nodiscard]] auto failed() const noexcept -> bool { return this->error.has_value(); }
    [[nodiscard]] auto isNumber() const noexcept -> bool { return std::holds_alternative<double>(this->result); }
    [[nodiscard]] auto toString() const -> std::string;
};

/**
 * Evaluates a formula against the whole jar.
 *
 * Every {{path}} token is replaced by the referenced node's value. A referenced
 * Expression contributes its formula text, it is not evaluated in turn. When at
 * least one reference was substituted and the result looks like arithmetic it is
 * computed, provided it only holds digits, + - * / ( ) . and whitespace;
 * anything else is returned as text.
 *
 * Failures yield the "ERR" sentinel with ReferenceNotFound or ArithmeticError.
 */
[[nodiscard]] auto evaluateExpression(std::string_view formula, Nodes const& root) -> Evaluation;

// Text a reference token is replaced with.
[[nodiscard]] auto substitutionText(Node const& node) -> std::string;

// One-line rendering of a node as the jar listing shows it.
[[nodiscard]] auto displayValue(Node const& node, Nodes const& root) -> std::string;

} // namespace DJ
