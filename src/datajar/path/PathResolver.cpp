#include "PathResolver.hpp"
#include "path/DotPath.hpp"

namespace DJ {

namespace {

template <typename NodeT, typename NodesT>
auto resolveImpl(NodesT& root, std::string_view path) -> NodeT* {
    if (validateDotPath(path))
        return nullptr;

    NodesT* current = &root;
    for (DotPathIterator it{path}; !it.isAtEnd(); ++it) {
        auto const segment = *it;

        NodeT* found = findChild(*current, segment);
        if (found == nullptr) {
            auto const index = parseIndex(segment);
            if (!index || *index >= current->size())
                return nullptr;
            found = &(*current)[*index];
        }

        if (it.isAtFinalComponent())
            return found;

        current = found->children();
        if (current == nullptr)
            return nullptr;
    }
    return nullptr;
}

} // namespace

auto resolve(Nodes const& root, std::string_view path) -> Node const* {
    return resolveImpl<Node const>(root, path);
}

auto resolve(Nodes& root, std::string_view path) -> Node* {
    return resolveImpl<Node>(root, path);
}

} // namespace DJ
