#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <string_view>
#include <vector>

namespace DJ {

/// Breadcrumb of container ids from the root to the container being edited. Empty is the root.
using Scope = std::vector<NodeId>;

enum class DeepSetOutcome {
    Created,  // a new leaf was appended at the final segment
    Replaced, // an existing node at the final segment received the value
    Blocked   // an intermediate segment named a non-container, nothing changed
};

struct DeepSetResult {
    Nodes          root;
    DeepSetOutcome outcome = DeepSetOutcome::Created;
};

struct AddResult {
    Nodes  root;
    NodeId id = InvalidNodeId;
};

/**
 * Path-addressed upsert.
 *
 * Segments match children by name only. Missing intermediate segments are created
 * as Dictionary nodes; an intermediate segment naming a leaf blocks the write and
 * the tree is returned unchanged. At the final segment an existing node keeps its
 * id and position and takes the new payload (and with it the new kind); otherwise a
 * leaf is appended. Applying the same call twice gives the same tree as applying
 * it once.
 */
[[nodiscard]] auto deepSet(Nodes const& root, std::string_view path, Payload value) -> Expected<DeepSetResult>;

/**
 * Replaces the payload of the node with `id` among the children at `scope`.
 * An unknown id leaves the tree as it is. Containers cannot be edited and the new
 * payload must be of the node's kind; both fail with TypeMismatch.
 */
[[nodiscard]] auto updateValue(Nodes const& root, Scope const& scope, NodeId id, Payload value) -> Expected<Nodes>;

// Removes the node with `id` wherever it is. Siblings keep their order and names.
[[nodiscard]] auto remove(Nodes const& root, NodeId id) -> Nodes;

/**
 * Appends a node at `scope`. Under a List the name is the current child count and
 * `name` is ignored. Elsewhere the name must be non-blank and replaces an existing
 * child of the same name in place.
 */
[[nodiscard]] auto addNode(Nodes const& root, Scope const& scope, std::string_view name, Payload value) -> Expected<AddResult>;

// Children at `scope`, nullptr when a step is missing or not a container.
[[nodiscard]] auto scopeNodes(Nodes const& root, Scope const& scope) -> Nodes const*;
[[nodiscard]] auto scopeContainer(Nodes const& root, Scope const& scope) -> Node const*;

// Scope naming the container at a dotted path. "" is the root.
[[nodiscard]] auto scopeForPath(Nodes const& root, std::string_view path) -> Expected<Scope>;

/**
 * Payload of `kind` built from user text: numbers parse a leading decimal (NaN
 * when there is none), booleans are true only for exactly "true", containers
 * start empty.
 */
[[nodiscard]] auto coerceValue(NodeKind kind, std::string_view text) -> Payload;

} // namespace DJ
