#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/graph/ErrorLog.hpp>
#include <scopegraph/graph/Events.hpp>
#include <scopegraph/graph/GraphTypes.hpp>
#include <scopegraph/graph/InputBinding.hpp>
#include <scopegraph/graph/RuntimeOptions.hpp>
#include <scopegraph/graph/TickReport.hpp>
#include <scopegraph/logic/EvaluationContext.hpp>
#include <scopegraph/logic/NodeCatalog.hpp>
#include <scopegraph/logic/NodeKind.hpp>
#include <scopegraph/registry/ScopeRegistry.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SG {

// Structural warnings about a graph that is otherwise valid. Orphaned nodes have
// no incoming and no outgoing edge.
struct GraphValidation {
    std::vector<NodeId>      orphanedNodes;
    std::vector<std::string> warnings;

    auto clean() const -> bool { return warnings.empty(); }
};

/**
 * Owns the node graph and the scope registry and evaluates the graph once per
 * externally supplied tick.
 *
 * Structure
 * - Every node gets a child scope of the graph root scope. Nodes read through
 *   that scope (falling back to ancestors) and write only into it.
 * - Edges are validated before they are committed: missing nodes, unknown
 *   pins, occupied input pins, incompatible kinds and cycles are rejected and
 *   leave the graph untouched. The graph is therefore a DAG between ticks.
 *
 * Evaluation
 * - tick() applies queued interaction events, publishes the clock, then runs
 *   every dirty or never-evaluated node in topological order. Clean nodes keep
 *   their cached outputs.
 * - A registry write dirties only the nodes whose scope can see it. A node
 *   whose outputs change bumps its version and dirties its consumers, so a
 *   change travels exactly as far as outputs keep changing.
 * - Nodes with an input bound to the clock paths are re-evaluated whenever the
 *   published clock value changes.
 * - A failing node keeps its previous outputs (or empty sentinels when it never
 *   succeeded); the failure is reported and evaluation carries on.
 *
 * Options with a path that does not parse fall back to the default for that
 * field; the rejection is recorded in the error log.
 *
 * The runtime is single threaded. UI code writes to the registry only through
 * events, which are applied at the start of the next tick.
 */
class GraphRuntime {
public:
    explicit GraphRuntime(RuntimeOptions options = RuntimeOptions{});
    GraphRuntime(NodeCatalog catalog, RuntimeOptions options = RuntimeOptions{});

    GraphRuntime(GraphRuntime const&)            = delete;
    GraphRuntime& operator=(GraphRuntime const&) = delete;
    GraphRuntime(GraphRuntime&&)                 = default;
    GraphRuntime& operator=(GraphRuntime&&)      = default;

    // Graph edits
    auto addNode(std::unique_ptr<NodeKind> kind, std::string label = {}) -> Expected<NodeId>;
    auto addNode(std::string_view kind, std::string label = {}) -> Expected<NodeId>;
    // Also removes every edge touching the node and tears down its scope subtree.
    auto removeNode(NodeId node) -> Expected<void>;
    auto connect(Edge const& edge) -> Expected<void>;
    auto connect(NodeId source, std::string_view sourcePin, NodeId destination, std::string_view destinationPin)
        -> Expected<void>;
    auto disconnect(Edge const& edge) -> Expected<void>;
    auto setInputBinding(NodeId node, std::string_view pin, InputBinding binding) -> Expected<void>;
    // Clearing a pin without a binding is not an error.
    auto clearInputBinding(NodeId node, std::string_view pin) -> Expected<void>;
    // Marks the node and everything downstream of it for re-evaluation.
    auto markDirty(NodeId node) -> Expected<void>;

    // Evaluation
    auto enqueue(InteractionEvent event) -> void;
    auto pendingEvents() const -> std::size_t { return pending_.size(); }
    auto tick(double deltaSeconds) -> TickReport;
    // Applies the queued events, then `events`, then evaluates.
    auto tick(double deltaSeconds, std::vector<InteractionEvent> events) -> TickReport;

    // Queries
    [[nodiscard]] auto contains(NodeId node) const -> bool;
    auto nodeOutputs(NodeId node) const -> Expected<OutputMap const*>;
    auto nodeOutput(NodeId node, std::string_view pin) const -> Expected<Value>;
    auto nodeError(NodeId node) const -> Expected<std::optional<Error>>;
    auto nodeVersion(NodeId node) const -> Expected<std::uint64_t>;
    auto isDirty(NodeId node) const -> Expected<bool>;
    auto nodeScope(NodeId node) const -> Expected<ScopeId>;
    auto nodeKind(NodeId node) const -> Expected<std::string>;
    auto nodeLabel(NodeId node) const -> Expected<std::string>;
    auto nodeSignature(NodeId node) const -> Expected<NodeSignature const*>;
    auto inputBinding(NodeId node, std::string_view pin) const -> Expected<std::optional<InputBinding>>;

    auto nodes() const -> std::vector<NodeId>;
    auto topologicalOrder() const -> std::vector<NodeId> const& { return order_; }
    auto edges() const -> std::vector<Edge> const& { return edges_; }
    auto incomingEdges(NodeId node) const -> std::vector<Edge>;
    auto outgoingEdges(NodeId node) const -> std::vector<Edge>;
    auto nodeCount() const -> std::size_t { return liveNodes_; }
    auto edgeCount() const -> std::size_t { return edges_.size(); }
    auto validate() const -> GraphValidation;

    auto registry() const -> ScopeRegistry const& { return registry_; }
    auto rootScope() const -> ScopeId { return root_; }
    auto errorLog() const -> ErrorLog const& { return errorLog_; }
    auto clearErrorLog() -> void { errorLog_.clear(); }
    auto catalog() const -> NodeCatalog const& { return catalog_; }
    auto options() const -> RuntimeOptions const& { return options_; }
    auto clock() const -> TickClock const& { return clock_; }

private:
    struct NodeSlot {
        bool                                             alive      = false;
        std::uint32_t                                    generation = 0;
        std::unique_ptr<NodeKind>                        kind;
        NodeSignature                                    signature;
        std::string                                      label;
        ScopeId                                          scope;
        std::optional<OutputMap>                         cache;
        std::optional<Error>                             error;
        std::uint64_t                                    version = 0;
        bool                                             dirty   = true;
        phmap::flat_hash_map<std::string, InputBinding>  bindings;
        std::vector<Edge>                                incoming;
        std::vector<Edge>                                outgoing;
    };

    auto slotFor(NodeId node) -> NodeSlot*;
    auto slotFor(NodeId node) const -> NodeSlot const*;
    auto idOf(std::uint32_t index) const -> NodeId;
    auto validateEdge(Edge const& edge) const -> Expected<void>;
    auto reaches(NodeId from, NodeId to) const -> bool;
    auto rebuildOrder() -> void;
    auto propagateDirty(NodeId node) -> void;
    auto markScopeDirty(ScopeId scope) -> void;
    auto markPathReaders(DotPath const& path) -> void;
    auto insertNode(std::unique_ptr<NodeKind> kind, NodeSignature signature, std::string label) -> Expected<NodeId>;
    auto restoreInvalidOptions() -> void;

    auto applyEvent(InteractionEvent const& event, TickReport& report) -> Expected<void>;
    auto gatherInputs(NodeSlot const& slot, EvaluationContext const& context) const -> InputMap;
    auto evaluateNode(NodeId node, TickReport& report) -> void;
    auto recordFailure(NodeId node, NodeSlot& slot, Error error, TickReport& report) -> void;
    auto publishOutputs(NodeSlot const& slot) -> Expected<void>;
    auto publishClock() -> void;
    auto publishClockValue(std::string const& path, double value) -> void;

    RuntimeOptions   options_;
    NodeCatalog      catalog_;
    ScopeRegistry    registry_;
    ScopeId          root_;
    ErrorLog         errorLog_;
    TickClock        clock_;

    std::vector<NodeSlot>        slots_;
    std::vector<std::uint32_t>   freeSlots_;
    std::size_t                  liveNodes_ = 0;
    std::vector<Edge>            edges_;
    std::vector<NodeId>          order_;
    std::deque<InteractionEvent> pending_;
};

} // namespace SG
