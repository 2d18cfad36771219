#pragma once

#include "core/Error.hpp"
#include "core/Node.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace DJ {

// Object key order is part of the jar, so the codec uses the insertion-ordered variant.
using Json = nlohmann::ordered_json;

/**
 * Plain JSON view of the jar, the export format.
 *
 * Dictionaries become objects keyed by child name, lists become arrays (child
 * names are dropped), scalars become primitives. Expression nodes export their
 * formula text, not the computed value.
 */
[[nodiscard]] auto exportJson(Nodes const& root) -> Json;
[[nodiscard]] auto exportNodeValue(Node const& node) -> Json;

/**
 * Builds a jar from a plain JSON object, inferring each node kind from the JSON
 * type. Array elements that are objects or arrays are imported as Dictionary
 * nodes, so arrays nested in arrays come back as objects keyed "0", "1", ...
 * Every node receives a fresh id.
 */
[[nodiscard]] auto importJson(Json const& document) -> Expected<Nodes>;
[[nodiscard]] auto importJsonText(std::string_view text) -> Expected<Nodes>;

/**
 * Lossless persisted form: an array of {"name", "type", "value"} objects where
 * container values are nested arrays of the same shape. An "id" member, when
 * present, is ignored; decoded nodes get fresh ids.
 */
[[nodiscard]] auto encodePersisted(Nodes const& root) -> Json;
[[nodiscard]] auto decodePersisted(Json const& document) -> Expected<Nodes>;
[[nodiscard]] auto decodePersistedText(std::string_view text) -> Expected<Nodes>;

// Serializes without throwing: invalid UTF-8 in text payloads is written as U+FFFD.
// A negative indent gives the compact form.
[[nodiscard]] auto dumpJson(Json const& document, int indent = -1) -> std::string;

} // namespace DJ
