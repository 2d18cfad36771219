#include "TreeMutator.hpp"
#include "log/TaggedLogger.hpp"
#include "path/DotPath.hpp"
#include "path/PathResolver.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace DJ {

namespace {

auto deepSetInPlace(Nodes& nodes, DotPathIterator it, Payload& value) -> DeepSetOutcome {
    auto const segment  = *it;
    Node*      existing = findChild(nodes, segment);

    if (it.isAtFinalComponent()) {
        if (existing != nullptr) {
            existing->payload = std::move(value);
            return DeepSetOutcome::Replaced;
        }
        nodes.emplace_back(std::string(segment), std::move(value));
        return DeepSetOutcome::Created;
    }

    if (existing == nullptr) {
        nodes.emplace_back(std::string(segment), Dictionary{});
        return deepSetInPlace(*nodes.back().children(), it.next(), value);
    }

    auto* children = existing->children();
    if (children == nullptr)
        return DeepSetOutcome::Blocked;
    return deepSetInPlace(*children, it.next(), value);
}

template <typename NodeT, typename NodesT>
auto scopeContainerImpl(NodesT& root, Scope const& scope) -> NodeT* {
    NodesT* current   = &root;
    NodeT*  container = nullptr;
    for (auto const stepId : scope) {
        container = nullptr;
        for (auto& node : *current) {
            if (node.id == stepId) {
                container = &node;
                break;
            }
        }
        if (container == nullptr || !container->isContainer())
            return nullptr;
        current = container->children();
    }
    return container;
}

auto scopeContainerMutable(Nodes& root, Scope const& scope) -> Node* {
    return scopeContainerImpl<Node>(root, scope);
}

auto scopeNodesMutable(Nodes& root, Scope const& scope) -> Nodes* {
    if (scope.empty())
        return &root;
    auto* container = scopeContainerMutable(root, scope);
    return container != nullptr ? container->children() : nullptr;
}

auto removeInPlace(Nodes& nodes, NodeId id) -> bool {
    for (auto it = nodes.begin(); it != nodes.end(); ++it) {
        if (it->id == id) {
            nodes.erase(it);
            return true;
        }
        if (auto* children = it->children(); children != nullptr && removeInPlace(*children, id))
            return true;
    }
    return false;
}

auto isBlank(std::string_view text) -> bool {
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
            return false;
    }
    return true;
}

auto parseLeadingNumber(std::string_view text) -> double {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n' || text.front() == '\r'))
        text.remove_prefix(1);

    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.starts_with("Infinity"))
        return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    // from_chars would otherwise accept these spellings.
    if (text.starts_with("inf") || text.starts_with("nan") || text.starts_with("INF") || text.starts_with("NAN"))
        return std::nan("");

    double value = 0.0;
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data())
        return std::nan("");
    return negative ? -value : value;
}

} // namespace

auto deepSet(Nodes const& root, std::string_view path, Payload value) -> Expected<DeepSetResult> {
    if (auto error = validateDotPath(path))
        return std::unexpected(*error);

    Nodes next    = root;
    auto  outcome = deepSetInPlace(next, DotPathIterator{path}, value);
    if (outcome == DeepSetOutcome::Blocked) {
        dj_log("deepSet blocked by a leaf on path " + std::string(path), "TreeMutator");
        return DeepSetResult{root, outcome};
    }
    return DeepSetResult{std::move(next), outcome};
}

auto updateValue(Nodes const& root, Scope const& scope, NodeId id, Payload value) -> Expected<Nodes> {
    Nodes next  = root;
    auto* nodes = scopeNodesMutable(next, scope);
    if (nodes == nullptr)
        return std::unexpected(Error{Error::Code::NoSuchPath, "Scope does not name a container"});

    for (auto& node : *nodes) {
        if (node.id != id)
            continue;
        if (node.isContainer())
            return std::unexpected(Error{Error::Code::TypeMismatch, "Cannot edit the value of container '" + node.name + "'"});
        if (kindOf(value) != node.kind())
            return std::unexpected(Error{Error::Code::TypeMismatch,
                                         "Node '" + node.name + "' holds a " + std::string(kindName(node.kind())) + ", not a "
                                             + std::string(kindName(kindOf(value)))});
        node.payload = std::move(value);
        return next;
    }
    return next;
}

auto remove(Nodes const& root, NodeId id) -> Nodes {
    Nodes next = root;
    if (!removeInPlace(next, id))
        dj_log("remove: no node with id " + std::to_string(id), "TreeMutator");
    return next;
}

auto addNode(Nodes const& root, Scope const& scope, std::string_view name, Payload value) -> Expected<AddResult> {
    Nodes next      = root;
    auto* container = scope.empty() ? nullptr : scopeContainerMutable(next, scope);
    if (!scope.empty() && container == nullptr)
        return std::unexpected(Error{Error::Code::NoSuchPath, "Scope does not name a container"});

    auto& nodes = container != nullptr ? *container->children() : next;
    if (container != nullptr && container->kind() == NodeKind::List) {
        Node node{std::to_string(nodes.size()), std::move(value)};
        auto id = node.id;
        nodes.push_back(std::move(node));
        return AddResult{std::move(next), id};
    }

    if (name.empty() || isBlank(name))
        return std::unexpected(Error{Error::Code::InvalidPath, "A key name is required"});

    Node node{std::string(name), std::move(value)};
    auto id = node.id;
    if (auto* existing = findChild(nodes, name))
        *existing = std::move(node);
    else
        nodes.push_back(std::move(node));
    return AddResult{std::move(next), id};
}

auto scopeContainer(Nodes const& root, Scope const& scope) -> Node const* {
    return scopeContainerImpl<Node const>(root, scope);
}

auto scopeNodes(Nodes const& root, Scope const& scope) -> Nodes const* {
    if (scope.empty())
        return &root;
    auto const* container = scopeContainer(root, scope);
    return container != nullptr ? container->children() : nullptr;
}

auto scopeForPath(Nodes const& root, std::string_view path) -> Expected<Scope> {
    Scope scope;
    if (path.empty())
        return scope;
    if (auto error = validateDotPath(path))
        return std::unexpected(*error);

    for (DotPathIterator it{path}; !it.isAtEnd(); ++it) {
        auto const  prefix = path.substr(0, static_cast<std::size_t>(it->data() + it->size() - path.data()));
        auto const* node   = resolve(root, prefix);
        if (node == nullptr)
            return std::unexpected(Error{Error::Code::NoSuchPath, "Nothing at '" + std::string(prefix) + "'"});
        if (!node->isContainer())
            return std::unexpected(Error{Error::Code::TypeMismatch, "'" + std::string(prefix) + "' is not a dictionary or list"});
        scope.push_back(node->id);
    }
    return scope;
}

auto coerceValue(NodeKind kind, std::string_view text) -> Payload {
    switch (kind) {
    case NodeKind::Text:
        return Text{std::string(text)};
    case NodeKind::Number:
        return Number{parseLeadingNumber(text)};
    case NodeKind::Boolean:
        return Boolean{text == "true"};
    case NodeKind::Dictionary:
        return Dictionary{};
    case NodeKind::List:
        return List{};
    case NodeKind::Expression:
        return Expression{std::string(text)};
    }
    return Text{std::string(text)};
}

} // namespace DJ
