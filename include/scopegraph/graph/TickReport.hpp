#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/graph/GraphTypes.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace SG {

struct NodeFailure {
    NodeId      node;
    std::string kind;
    Error       error;
};

struct EventFailure {
    std::size_t index = 0; // Position in the order the tick applied its events.
    std::string event;
    Error       error;
};

// Summary of one GraphRuntime::tick.
struct TickReport {
    std::uint64_t tick  = 0;
    double        time  = 0.0;
    double        delta = 0.0;

    std::vector<NodeId>       evaluatedNodes; // In evaluation order.
    std::size_t               skippedNodes = 0;
    std::vector<NodeFailure>  nodeErrors;
    std::size_t               appliedEvents  = 0;
    std::size_t               deferredEvents = 0;
    std::vector<EventFailure> eventErrors;
    std::vector<NodeId>       createdNodes; // Nodes added by AddNode events.

    auto evaluated(NodeId node) const -> bool;
    auto errorFor(NodeId node) const -> Error const*;
    auto ok() const -> bool { return nodeErrors.empty() && eventErrors.empty(); }
};

} // namespace SG
