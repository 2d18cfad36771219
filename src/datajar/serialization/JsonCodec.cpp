#include "JsonCodec.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace DJ {

namespace {

// Every integer of smaller magnitude is exactly representable as a double.
constexpr double MaxExactInteger = 9007199254740992.0; // 2^53

auto exportNumber(double value) -> Json {
    if (!std::isfinite(value))
        return Json(nullptr);
    // Integral values print without a fraction, as they were typed. -0 keeps its sign as a float.
    auto const negativeZero = value == 0.0 && std::signbit(value);
    if (std::trunc(value) == value && std::fabs(value) < MaxExactInteger && !negativeZero)
        return Json(static_cast<std::int64_t>(value));
    return Json(value);
}

auto exportChildren(Nodes const& children) -> Json {
    Json object = Json::object();
    for (auto const& child : children)
        object[child.name] = exportNodeValue(child);
    return object;
}

auto importObject(Json const& object) -> Nodes;

auto importScalar(Json const& value) -> Payload {
    if (value.is_boolean())
        return Boolean{value.get<bool>()};
    if (value.is_number())
        return Number{value.get<double>()};
    if (value.is_string())
        return Text{value.get<std::string>()};
    return Text{};
}

auto importArrayElements(Json const& array) -> Nodes;

// Elements are inferred one level deep: any structured element is a Dictionary.
auto importArrayElement(Json const& element) -> Payload {
    if (element.is_object())
        return Dictionary{importObject(element)};
    if (element.is_array())
        return Dictionary{importArrayElements(element)};
    return importScalar(element);
}

auto importArrayElements(Json const& array) -> Nodes {
    Nodes       nodes;
    std::size_t index = 0;
    nodes.reserve(array.size());
    for (auto const& element : array)
        nodes.emplace_back(std::to_string(index++), importArrayElement(element));
    return nodes;
}

auto importValue(Json const& value) -> Payload {
    if (value.is_object())
        return Dictionary{importObject(value)};
    if (value.is_array())
        return List{importArrayElements(value)};
    return importScalar(value);
}

auto importObject(Json const& object) -> Nodes {
    Nodes nodes;
    nodes.reserve(object.size());
    for (auto const& [key, value] : object.items())
        nodes.emplace_back(key, importValue(value));
    return nodes;
}

auto persistFormatError(std::string const& where, std::string const& what) -> Error {
    return Error{Error::Code::PersistFormatError, where.empty() ? what : where + ": " + what};
}

auto decodeNodes(Json const& array, std::string const& where) -> Expected<Nodes>;

auto decodeNode(Json const& entry, std::string const& where) -> Expected<Node> {
    if (!entry.is_object())
        return std::unexpected(persistFormatError(where, "node entry must be an object"));

    auto const name = entry.find("name");
    if (name == entry.end() || !name->is_string())
        return std::unexpected(persistFormatError(where, "node entry needs a string 'name'"));
    auto const type = entry.find("type");
    if (type == entry.end() || !type->is_string())
        return std::unexpected(persistFormatError(where, "node entry needs a string 'type'"));
    auto const kind = parseKind(type->get<std::string>());
    if (!kind)
        return std::unexpected(persistFormatError(where, "unknown node type '" + type->get<std::string>() + "'"));

    auto const  nodeName = name->get<std::string>();
    auto const  nodeWhere = where.empty() ? nodeName : where + "." + nodeName;
    auto const  value     = entry.find("value");
    Json const& raw       = value == entry.end() ? Json{} : *value;

    switch (*kind) {
    case NodeKind::Text:
        if (!raw.is_string())
            return std::unexpected(persistFormatError(nodeWhere, "text value must be a string"));
        return Node{nodeName, Text{raw.get<std::string>()}};
    case NodeKind::Expression:
        if (!raw.is_string())
            return std::unexpected(persistFormatError(nodeWhere, "expression value must be a string"));
        return Node{nodeName, Expression{raw.get<std::string>()}};
    case NodeKind::Number:
        // Non-finite numbers are stored as null.
        if (raw.is_null())
            return Node{nodeName, Number{std::nan("")}};
        if (!raw.is_number())
            return std::unexpected(persistFormatError(nodeWhere, "number value must be a number"));
        return Node{nodeName, Number{raw.get<double>()}};
    case NodeKind::Boolean:
        if (!raw.is_boolean())
            return std::unexpected(persistFormatError(nodeWhere, "boolean value must be a boolean"));
        return Node{nodeName, Boolean{raw.get<bool>()}};
    case NodeKind::Dictionary:
    case NodeKind::List: {
        auto children = decodeNodes(raw, nodeWhere);
        if (!children)
            return std::unexpected(children.error());
        if (*kind == NodeKind::Dictionary)
            return Node{nodeName, Dictionary{std::move(*children)}};
        return Node{nodeName, List{std::move(*children)}};
    }
    }
    return std::unexpected(persistFormatError(nodeWhere, "unhandled node type"));
}

auto decodeNodes(Json const& array, std::string const& where) -> Expected<Nodes> {
    if (!array.is_array())
        return std::unexpected(persistFormatError(where, "expected an array of nodes"));

    Nodes nodes;
    nodes.reserve(array.size());
    for (auto const& entry : array) {
        auto node = decodeNode(entry, where);
        if (!node)
            return std::unexpected(node.error());
        nodes.push_back(std::move(*node));
    }
    return nodes;
}

} // namespace

auto exportNodeValue(Node const& node) -> Json {
    return std::visit(
        [](auto const& payload) -> Json {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, Text>) {
                return Json(payload.value);
            } else if constexpr (std::is_same_v<T, Number>) {
                return exportNumber(payload.value);
            } else if constexpr (std::is_same_v<T, Boolean>) {
                return Json(payload.value);
            } else if constexpr (std::is_same_v<T, Dictionary>) {
                return exportChildren(payload.children);
            } else if constexpr (std::is_same_v<T, List>) {
                Json array = Json::array();
                for (auto const& child : payload.children)
                    array.push_back(exportNodeValue(child));
                return array;
            } else {
                return Json(payload.formula);
            }
        },
        node.payload);
}

auto exportJson(Nodes const& root) -> Json {
    return exportChildren(root);
}

auto importJson(Json const& document) -> Expected<Nodes> {
    if (!document.is_object())
        return std::unexpected(Error{Error::Code::ImportFormatError, "Top-level JSON value must be an object"});
    return importObject(document);
}

auto importJsonText(std::string_view text) -> Expected<Nodes> {
    auto document = Json::parse(text, nullptr, false);
    if (document.is_discarded())
        return std::unexpected(Error{Error::Code::ImportFormatError, "Invalid JSON"});
    return importJson(document);
}

auto encodePersisted(Nodes const& root) -> Json {
    Json array = Json::array();
    for (auto const& node : root) {
        Json entry    = Json::object();
        entry["name"] = node.name;
        entry["type"] = std::string(kindName(node.kind()));
        if (auto const* children = node.children()) {
            entry["value"] = encodePersisted(*children);
        } else if (auto const* number = std::get_if<Number>(&node.payload)) {
            entry["value"] = std::isfinite(number->value) ? Json(number->value) : Json(nullptr);
        } else {
            entry["value"] = exportNodeValue(node);
        }
        array.push_back(std::move(entry));
    }
    return array;
}

auto decodePersisted(Json const& document) -> Expected<Nodes> {
    return decodeNodes(document, "");
}

auto decodePersistedText(std::string_view text) -> Expected<Nodes> {
    auto document = Json::parse(text, nullptr, false);
    if (document.is_discarded())
        return std::unexpected(Error{Error::Code::PersistFormatError, "Malformed JSON document"});
    return decodePersisted(document);
}

auto dumpJson(Json const& document, int indent) -> std::string {
    return document.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace DJ
