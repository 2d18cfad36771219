#include "Node.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <utility>

namespace DJ {

Node::Node(std::string name, Payload payload)
    : Node(nextNodeId(), std::move(name), std::move(payload)) {}

Node::Node(NodeId id, std::string name, Payload payload)
    : id(id), name(std::move(name)), payload(std::move(payload)) {}

auto Node::kind() const noexcept -> NodeKind {
    return kindOf(this->payload);
}

auto Node::isContainer() const noexcept -> bool {
    return isContainerKind(this->kind());
}

auto Node::children() noexcept -> Nodes* {
    if (auto* dictionary = std::get_if<Dictionary>(&this->payload))
        return &dictionary->children;
    if (auto* list = std::get_if<List>(&this->payload))
        return &list->children;
    return nullptr;
}

auto Node::children() const noexcept -> Nodes const* {
    if (auto const* dictionary = std::get_if<Dictionary>(&this->payload))
        return &dictionary->children;
    if (auto const* list = std::get_if<List>(&this->payload))
        return &list->children;
    return nullptr;
}

auto kindOf(Payload const& payload) noexcept -> NodeKind {
    return static_cast<NodeKind>(payload.index());
}

auto isContainerKind(NodeKind kind) noexcept -> bool {
    return kind == NodeKind::Dictionary || kind == NodeKind::List;
}

auto kindName(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
    case NodeKind::Text:
        return "text";
    case NodeKind::Number:
        return "number";
    case NodeKind::Boolean:
        return "boolean";
    case NodeKind::Dictionary:
        return "dictionary";
    case NodeKind::List:
        return "list";
    case NodeKind::Expression:
        return "expression";
    }
    return "text";
}

auto parseKind(std::string_view name) noexcept -> std::optional<NodeKind> {
    for (auto kind : {NodeKind::Text, NodeKind::Number, NodeKind::Boolean, NodeKind::Dictionary, NodeKind::List, NodeKind::Expression}) {
        if (kindName(kind) == name)
            return kind;
    }
    return std::nullopt;
}

auto emptyPayload(NodeKind kind) -> Payload {
    switch (kind) {
    case NodeKind::Text:
        return Text{};
    case NodeKind::Number:
        return Number{};
    case NodeKind::Boolean:
        return Boolean{};
    case NodeKind::Dictionary:
        return Dictionary{};
    case NodeKind::List:
        return List{};
    case NodeKind::Expression:
        return Expression{};
    }
    return Text{};
}

auto findChild(Nodes& nodes, std::string_view name) noexcept -> Node* {
    for (auto& node : nodes) {
        if (node.name == name)
            return &node;
    }
    return nullptr;
}

auto findChild(Nodes const& nodes, std::string_view name) noexcept -> Node const* {
    for (auto const& node : nodes) {
        if (node.name == name)
            return &node;
    }
    return nullptr;
}

auto formatNumber(double value) -> std::string {
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value > 0 ? "Infinity" : "-Infinity";
    if (value == 0.0)
        return "0";

    // Large enough for the fixed form of DBL_MAX.
    std::array<char, 512> buffer{};
    auto const [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
    if (ec != std::errc{})
        return "NaN";
    return std::string(buffer.data(), end);
}

namespace {

auto sameNumber(double lhs, double rhs) -> bool {
    return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
}

} // namespace

auto structurallyEqual(Node const& lhs, Node const& rhs) -> bool {
    if (lhs.name != rhs.name || lhs.kind() != rhs.kind())
        return false;

    switch (lhs.kind()) {
    case NodeKind::Text:
        return std::get<Text>(lhs.payload).value == std::get<Text>(rhs.payload).value;
    case NodeKind::Number:
        return sameNumber(std::get<Number>(lhs.payload).value, std::get<Number>(rhs.payload).value);
    case NodeKind::Boolean:
        return std::get<Boolean>(lhs.payload).value == std::get<Boolean>(rhs.payload).value;
    case NodeKind::Expression:
        return std::get<Expression>(lhs.payload).formula == std::get<Expression>(rhs.payload).formula;
    case NodeKind::Dictionary:
    case NodeKind::List:
        return structurallyEqual(*lhs.children(), *rhs.children());
    }
    return false;
}

auto structurallyEqual(Nodes const& lhs, Nodes const& rhs) -> bool {
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!structurallyEqual(lhs[i], rhs[i]))
            return false;
    }
    return true;
}

} // namespace DJ
