#pragma once
#include "core/Node.hpp"

#include <string_view>

namespace DJ {

/**
 * Looks up a dotted path against a node sequence.
 *
 * Each segment first matches a child by name, then falls back to a zero-based
 * position in the same sequence. A miss, a malformed path, or a non-final segment
 * landing on a leaf all return nullptr. The final segment yields the node itself.
 */
[[nodiscard]] auto resolve(Nodes const& root, std::string_view path) -> Node const*;
[[nodiscard]] auto resolve(Nodes& root, std::string_view path) -> Node*;

} // namespace DJ
