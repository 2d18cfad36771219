#pragma once

#include "core/NodeId.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DJ {

struct Node;

/// An ordered sequence of nodes. The jar root is one, and so is every container payload.
using Nodes = std::vector<Node>;

enum class NodeKind {
    Text,
    Number,
    Boolean,
    Dictionary,
    List,
    Expression
};

struct Text {
    std::string value;
};

struct Number {
    double value = 0.0;
};

struct Boolean {
    bool value = false;
};

struct Dictionary {
    Nodes children;
};

struct List {
    Nodes children;
};

struct Expression {
    std::string formula;
};

/**
 * Kind-dependent node payload.
 *
 * The kind of a node is the active alternative, so a Number node can never hold
 * children and a Dictionary can never hold a scalar.
 *
 * The alternative order matches NodeKind.
 */
using Payload = std::variant<Text, Number, Boolean, Dictionary, List, Expression>;

/**
 * Element of the jar tree.
 *
 * Structure:
 * - id: process-unique identity used for delete/update targeting, never for path lookup
 * - name: key under a Dictionary parent, stringified creation index under a List parent
 * - payload: the value, see Payload
 *
 * Containers exclusively own their children by value; there is no sharing and no
 * back-reference to the parent.
 */
struct Node final {
    NodeId      id = InvalidNodeId;
    std::string name;
    Payload     payload;

    Node() = default;
    Node(std::string name, Payload payload);
    Node(NodeId id, std::string name, Payload payload);

    [[nodiscard]] auto kind() const noexcept -> NodeKind;
    [[nodiscard]] auto isContainer() const noexcept -> bool;

    // Child sequence of a Dictionary or List, nullptr for leaves.
    [[nodiscard]] auto children() noexcept -> Nodes*;
    [[nodiscard]] auto children() const noexcept -> Nodes const*;
};

[[nodiscard]] auto kindOf(Payload const& payload) noexcept -> NodeKind;
[[nodiscard]] auto isContainerKind(NodeKind kind) noexcept -> bool;
[[nodiscard]] auto kindName(NodeKind kind) noexcept -> std::string_view;
[[nodiscard]] auto parseKind(std::string_view name) noexcept -> std::optional<NodeKind>;
[[nodiscard]] auto emptyPayload(NodeKind kind) -> Payload;

// First child whose name matches, nullptr when absent.
[[nodiscard]] auto findChild(Nodes& nodes, std::string_view name) noexcept -> Node*;
[[nodiscard]] auto findChild(Nodes const& nodes, std::string_view name) noexcept -> Node const*;

// Shortest decimal text that reads back as the same double, never in exponent form.
[[nodiscard]] auto formatNumber(double value) -> std::string;

// Compares names, kinds and payloads recursively. Ids are ignored.
[[nodiscard]] auto structurallyEqual(Node const& lhs, Node const& rhs) -> bool;
[[nodiscard]] auto structurallyEqual(Nodes const& lhs, Nodes const& rhs) -> bool;

} // namespace DJ
