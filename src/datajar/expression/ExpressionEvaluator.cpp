#include "ExpressionEvaluator.hpp"
#include "expression/Arithmetic.hpp"
#include "log/TaggedLogger.hpp"
#include "path/DotPath.hpp"
#include "path/PathResolver.hpp"
#include "serialization/JsonCodec.hpp"

#include <charconv>
#include <cmath>

namespace DJ {

namespace {

constexpr std::string_view ReferenceOpen  = "{{";
constexpr std::string_view ReferenceClose = "}}";

auto isReferenceChar(char c) -> bool {
    return isPathSegmentChar(c) || c == DotPathIterator::Separator;
}

auto isSpace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

// Blank text counts as a number, the way numeric coercion treats it.
auto isNumeric(std::string_view text) -> bool {
    auto const trimmed = trim(text);
    if (trimmed.empty())
        return true;
    if (trimmed == "Infinity" || trimmed == "+Infinity" || trimmed == "-Infinity")
        return true;
    double value = 0.0;
    auto const [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    return ec == std::errc{} && ptr == trimmed.data() + trimmed.size();
}

auto hasArithmeticOperator(std::string_view text) -> bool {
    return text.find_first_of("+-*/%()") != std::string_view::npos;
}

auto isStrictArithmetic(std::string_view text) -> bool {
    if (text.empty())
        return false;
    for (char c : text) {
        bool const allowed = (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '*' || c == '/' || c == '(' || c == ')'
                             || c == '.' || isSpace(c);
        if (!allowed)
            return false;
    }
    return true;
}

auto failure(Error error) -> Evaluation {
    dj_log("Expression failed: " + describeError(error), "Expression", "WARN");
    return Evaluation{std::string{EvaluationErrorSentinel}, std::move(error)};
}

} // namespace

auto Evaluation::toString() const -> std::string {
    if (auto const* number = std::get_if<double>(&this->result))
        return formatNumber(*number);
    return std::get<std::string>(this->result);
}

auto substitutionText(Node const& node) -> std::string {
    switch (node.kind()) {
    case NodeKind::Text:
        return std::get<Text>(node.payload).value;
    case NodeKind::Number:
        return formatNumber(std::get<Number>(node.payload).value);
    case NodeKind::Boolean:
        return std::get<Boolean>(node.payload).value ? "true" : "false";
    case NodeKind::Expression:
        return std::get<Expression>(node.payload).formula;
    case NodeKind::Dictionary:
    case NodeKind::List:
        return dumpJson(exportNodeValue(node));
    }
    return {};
}

auto evaluateExpression(std::string_view formula, Nodes const& root) -> Evaluation {
    if (formula.empty())
        return Evaluation{std::string{}, std::nullopt};

    std::string substituted;
    substituted.reserve(formula.size());
    bool        hasReferences = false;
    std::size_t pos           = 0;

    while (pos < formula.size()) {
        auto const open = formula.find(ReferenceOpen, pos);
        if (open == std::string_view::npos) {
            substituted.append(formula.substr(pos));
            break;
        }

        auto pathEnd = open + ReferenceOpen.size();
        while (pathEnd < formula.size() && isReferenceChar(formula[pathEnd]))
            ++pathEnd;

        bool const isToken = pathEnd > open + ReferenceOpen.size() && formula.substr(pathEnd, ReferenceClose.size()) == ReferenceClose;
        if (!isToken) {
            // Not a token here; a later '{' may still start one.
            substituted.append(formula.substr(pos, open + 1 - pos));
            pos = open + 1;
            continue;
        }

        auto const path = formula.substr(open + ReferenceOpen.size(), pathEnd - open - ReferenceOpen.size());
        auto const* node = resolve(root, path);
        if (node == nullptr)
            return failure(Error{Error::Code::ReferenceNotFound, "Key not found: " + std::string(path)});

        substituted.append(formula.substr(pos, open - pos));
        substituted.append(substitutionText(*node));
        hasReferences = true;
        pos           = pathEnd + ReferenceClose.size();
    }

    if (!hasReferences)
        return Evaluation{std::string(formula), std::nullopt};

    bool const looksLikeMath = hasArithmeticOperator(substituted) || isNumeric(substituted);
    if (!looksLikeMath || !isStrictArithmetic(substituted))
        return Evaluation{std::move(substituted), std::nullopt};

    auto value = Arithmetic::evaluate(substituted);
    if (!value)
        return failure(value.error());
    return Evaluation{*value, std::nullopt};
}

auto displayValue(Node const& node, Nodes const& root) -> std::string {
    if (auto const* children = node.children())
        return std::to_string(children->size()) + " items";

    if (auto const* expression = std::get_if<Expression>(&node.payload)) {
        auto const evaluation = evaluateExpression(expression->formula, root);
        auto       text       = "= " + evaluation.toString();
        if (evaluation.failed() && evaluation.error->message)
            text += " (" + *evaluation.error->message + ")";
        return text;
    }
    return substitutionText(node);
}

} // namespace DJ
