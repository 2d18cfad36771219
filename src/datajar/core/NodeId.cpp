#include "NodeId.hpp"

#include <atomic>

namespace DJ {

auto nextNodeId() -> NodeId {
    static std::atomic<NodeId> counter{InvalidNodeId};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace DJ
