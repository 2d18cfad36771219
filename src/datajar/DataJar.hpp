#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "expression/ExpressionEvaluator.hpp"
#include "mutation/TreeMutator.hpp"
#include "serialization/JsonCodec.hpp"
#include "trigger/TriggerRequest.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace DJ {

/**
 * The jar: one ordered tree of named nodes plus the operations that edit it.
 *
 * Every mutation builds the next tree from the current one and only swaps it in
 * when the operation succeeded, so a failed call leaves the jar as it was. After
 * each successful swap the change listener (if any) is handed the new tree; the
 * command line tool uses it to persist to a JarStore.
 */
class DataJar {
public:
    using ChangeListener = std::function<void(Nodes const&)>;

    DataJar() = default;
    explicit DataJar(Nodes root);

    [[nodiscard]] auto nodes() const noexcept -> Nodes const& { return this->root; }
    [[nodiscard]] auto resolve(std::string_view path) const -> Node const*;
    [[nodiscard]] auto evaluate(std::string_view formula) const -> Evaluation;
    [[nodiscard]] auto display(Node const& node) const -> std::string;
    [[nodiscard]] auto scopeForPath(std::string_view path) const -> Expected<Scope>;
    [[nodiscard]] auto children(Scope const& scope) const -> Nodes const*;

    auto deepSet(std::string_view path, Payload value) -> Expected<DeepSetOutcome>;
    auto add(Scope const& scope, std::string_view name, Payload value) -> Expected<NodeId>;
    auto updateValue(Scope const& scope, NodeId id, Payload value) -> Expected<void>;
    auto remove(NodeId id) -> void;
    auto replace(Nodes next) -> void;

    // Replaces the whole jar with a parsed JSON document. Nothing changes on failure.
    auto importJson(std::string_view text) -> Expected<void>;
    [[nodiscard]] auto exportJson() const -> Json;
    [[nodiscard]] auto exportJsonText(int indent = 2) const -> std::string;

    // Applies a trigger and returns the acknowledgement text.
    auto applyTrigger(TriggerRequest const& request) -> Expected<std::string>;
    // Applies the inbox's pending trigger, if any. The inbox is emptied either way.
    auto consume(TriggerInbox& inbox) -> Expected<std::optional<std::string>>;

    auto setChangeListener(ChangeListener listener) -> void;

private:
    auto commit(Nodes next) -> void;

    Nodes          root;
    ChangeListener changeListener;
};

} // namespace DJ
