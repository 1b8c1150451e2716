#include <scopegraph/graph/TickReport.hpp>

#include <algorithm>

namespace SG {

auto TickReport::evaluated(NodeId node) const -> bool {
    return std::ranges::find(evaluatedNodes, node) != evaluatedNodes.end();
}

auto TickReport::errorFor(NodeId node) const -> Error const* {
    auto it = std::ranges::find_if(nodeErrors, [node](NodeFailure const& failure) { return failure.node == node; });
    return it == nodeErrors.end() ? nullptr : &it->error;
}

} // namespace SG
