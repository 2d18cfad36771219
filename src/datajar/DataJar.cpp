#include "DataJar.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathResolver.hpp"

#include <utility>

namespace DJ {

DataJar::DataJar(Nodes root) : root(std::move(root)) {}

auto DataJar::resolve(std::string_view path) const -> Node const* {
    return DJ::resolve(this->root, path);
}

auto DataJar::evaluate(std::string_view formula) const -> Evaluation {
    return evaluateExpression(formula, this->root);
}

auto DataJar::display(Node const& node) const -> std::string {
    return displayValue(node, this->root);
}

auto DataJar::scopeForPath(std::string_view path) const -> Expected<Scope> {
    return DJ::scopeForPath(this->root, path);
}

auto DataJar::children(Scope const& scope) const -> Nodes const* {
    return scopeNodes(this->root, scope);
}

auto DataJar::deepSet(std::string_view path, Payload value) -> Expected<DeepSetOutcome> {
    auto result = DJ::deepSet(this->root, path, std::move(value));
    if (!result)
        return std::unexpected(result.error());
    if (result->outcome != DeepSetOutcome::Blocked)
        this->commit(std::move(result->root));
    return result->outcome;
}

auto DataJar::add(Scope const& scope, std::string_view name, Payload value) -> Expected<NodeId> {
    auto result = addNode(this->root, scope, name, std::move(value));
    if (!result)
        return std::unexpected(result.error());
    this->commit(std::move(result->root));
    return result->id;
}

auto DataJar::updateValue(Scope const& scope, NodeId id, Payload value) -> Expected<void> {
    auto next = DJ::updateValue(this->root, scope, id, std::move(value));
    if (!next)
        return std::unexpected(next.error());
    this->commit(std::move(*next));
    return {};
}

auto DataJar::remove(NodeId id) -> void {
    this->commit(DJ::remove(this->root, id));
}

auto DataJar::replace(Nodes next) -> void {
    this->commit(std::move(next));
}

auto DataJar::importJson(std::string_view text) -> Expected<void> {
    auto next = importJsonText(text);
    if (!next) {
        dj_log("import rejected: " + describeError(next.error()), "DataJar", "WARN");
        return std::unexpected(next.error());
    }
    this->commit(std::move(*next));
    return {};
}

auto DataJar::exportJson() const -> Json {
    return DJ::exportJson(this->root);
}

auto DataJar::exportJsonText(int indent) const -> std::string {
    return dumpJson(this->exportJson(), indent);
}

auto DataJar::applyTrigger(TriggerRequest const& request) -> Expected<std::string> {
    auto result = DJ::applyTrigger(this->root, request);
    if (!result)
        return std::unexpected(result.error());
    if (result->set.outcome != DeepSetOutcome::Blocked)
        this->commit(std::move(result->set.root));
    return std::move(result->acknowledgement);
}

auto DataJar::consume(TriggerInbox& inbox) -> Expected<std::optional<std::string>> {
    auto request = inbox.take();
    if (!request)
        return std::optional<std::string>{};
    auto acknowledgement = this->applyTrigger(*request);
    if (!acknowledgement)
        return std::unexpected(acknowledgement.error());
    return std::optional<std::string>{std::move(*acknowledgement)};
}

auto DataJar::setChangeListener(ChangeListener listener) -> void {
    this->changeListener = std::move(listener);
}

auto DataJar::commit(Nodes next) -> void {
    this->root = std::move(next);
    if (this->changeListener)
        this->changeListener(this->root);
}

} // namespace DJ
