#include <scopegraph/graph/GraphTypes.hpp>

namespace SG {

auto toString(NodeId id) -> std::string {
    if (!id.isValid()) {
        return "node#invalid";
    }
    return "node#" + std::to_string(id.index) + "." + std::to_string(id.generation);
}

auto toString(Edge const& edge) -> std::string {
    return toString(edge.source.node) + ":" + edge.source.pin + " -> " + toString(edge.destination.node) + ":"
           + edge.destination.pin;
}

} // namespace SG
