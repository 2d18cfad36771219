#pragma once
#include <cstdint>

namespace DJ {

// Unique for the lifetime of the process. Ids are never persisted.
using NodeId = std::uint64_t;

inline constexpr NodeId InvalidNodeId = 0;

[[nodiscard]] auto nextNodeId() -> NodeId;

} // namespace DJ
