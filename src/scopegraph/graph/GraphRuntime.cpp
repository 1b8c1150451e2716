#include <scopegraph/graph/GraphRuntime.hpp>

#include "scopegraph/log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace SG {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

auto node_not_found(NodeId node) -> Error {
    return Error{Error::Code::NodeNotFound, "Node not found: " + toString(node)};
}

} // namespace

GraphRuntime::GraphRuntime(RuntimeOptions options)
    : GraphRuntime(NodeCatalog::withBuiltins(), std::move(options)) {}

GraphRuntime::GraphRuntime(NodeCatalog catalog, RuntimeOptions options)
    : options_(std::move(options)),
      catalog_(std::move(catalog)),
      registry_(),
      root_(registry_.createRootScope("graph")),
      errorLog_(options_.error_log_capacity) {
    restoreInvalidOptions();
    sg_log("GraphRuntime created with root scope " + toString(root_), "GraphRuntime");
}

auto GraphRuntime::restoreInvalidOptions() -> void {
    for (auto& error : resetInvalidPaths(options_)) {
        sg_log("Invalid runtime option, using the default: " + describeError(error), "GraphRuntime", "ERROR");
        errorLog_.append(NodeErrorRecord{.tick = 0, .node = NodeId{}, .source = "options", .error = std::move(error)});
    }
}

auto GraphRuntime::slotFor(NodeId node) -> NodeSlot* {
    if (!node.isValid() || node.index >= slots_.size()) {
        return nullptr;
    }
    auto& slot = slots_[node.index];
    if (!slot.alive || slot.generation != node.generation) {
        return nullptr;
    }
    return &slot;
}

auto GraphRuntime::slotFor(NodeId node) const -> NodeSlot const* {
    if (!node.isValid() || node.index >= slots_.size()) {
        return nullptr;
    }
    auto const& slot = slots_[node.index];
    if (!slot.alive || slot.generation != node.generation) {
        return nullptr;
    }
    return &slot;
}

auto GraphRuntime::idOf(std::uint32_t index) const -> NodeId {
    return NodeId{.index = index, .generation = slots_[index].generation};
}

auto GraphRuntime::contains(NodeId node) const -> bool {
    return slotFor(node) != nullptr;
}

auto GraphRuntime::addNode(std::unique_ptr<NodeKind> kind, std::string label) -> Expected<NodeId> {
    if (!kind) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Cannot add a node without a kind"});
    }
    auto signature = kind->signature();
    return insertNode(std::move(kind), std::move(signature), std::move(label));
}

// Nodes added by name carry the catalog's signature, so an alias registration
// reports the name it was registered under.
auto GraphRuntime::addNode(std::string_view kind, std::string label) -> Expected<NodeId> {
    auto created = catalog_.create(kind);
    if (!created) {
        sg_log("Rejected node of unknown kind " + std::string{kind}, "GraphRuntime", "ERROR");
        return std::unexpected(created.error());
    }
    auto signature = catalog_.signature(kind);
    if (!signature) {
        return std::unexpected(signature.error());
    }
    return insertNode(std::move(*created), std::move(*signature), std::move(label));
}

auto GraphRuntime::insertNode(std::unique_ptr<NodeKind> kind, NodeSignature signature, std::string label)
    -> Expected<NodeId> {
    auto scope = registry_.createChildScope(root_, label.empty() ? signature.kind : label);
    if (!scope) {
        return std::unexpected(scope.error());
    }

    std::uint32_t index = 0;
    if (!freeSlots_.empty()) {
        index = freeSlots_.back();
        freeSlots_.pop_back();
    } else {
        index = static_cast<std::uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    auto& slot     = slots_[index];
    slot.alive     = true;
    slot.signature = std::move(signature);
    slot.kind      = std::move(kind);
    slot.label     = std::move(label);
    slot.scope     = *scope;
    slot.cache.reset();
    slot.error.reset();
    slot.version = 0;
    slot.dirty   = true;
    slot.bindings.clear();
    slot.incoming.clear();
    slot.outgoing.clear();
    ++liveNodes_;

    // A node without edges is valid anywhere in the order.
    auto id = idOf(index);
    order_.push_back(id);
    sg_log("Added node " + toString(id) + " (" + slot.signature.kind + ")", "GraphRuntime");
    return id;
}

auto GraphRuntime::removeNode(NodeId node) -> Expected<void> {
    auto* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    auto destroyed = registry_.destroyScopeTree(slot->scope);
    if (!destroyed) {
        return std::unexpected(destroyed.error());
    }

    std::vector<NodeId> downstream;
    for (auto const& edge : slot->outgoing) {
        std::erase(slots_[edge.destination.node.index].incoming, edge);
        downstream.push_back(edge.destination.node);
    }
    for (auto const& edge : slot->incoming) {
        std::erase(slots_[edge.source.node.index].outgoing, edge);
    }
    std::erase_if(edges_, [&](Edge const& edge) {
        return edge.source.node == node || edge.destination.node == node;
    });

    slot->alive = false;
    ++slot->generation;
    slot->kind.reset();
    slot->signature = NodeSignature{};
    slot->label.clear();
    slot->scope = ScopeId{};
    slot->cache.reset();
    slot->error.reset();
    slot->bindings.clear();
    slot->incoming.clear();
    slot->outgoing.clear();
    freeSlots_.push_back(node.index);
    --liveNodes_;

    rebuildOrder();
    for (auto const& destination : downstream) {
        propagateDirty(destination);
    }
    sg_log("Removed node " + toString(node), "GraphRuntime");
    return {};
}

auto GraphRuntime::validateEdge(Edge const& edge) const -> Expected<void> {
    auto const* source      = slotFor(edge.source.node);
    auto const* destination = slotFor(edge.destination.node);
    if (source == nullptr) {
        return std::unexpected(node_not_found(edge.source.node));
    }
    if (destination == nullptr) {
        return std::unexpected(node_not_found(edge.destination.node));
    }

    auto const* sourcePin = source->signature.findOutput(edge.source.pin);
    if (sourcePin == nullptr) {
        return std::unexpected(Error{Error::Code::DanglingEdge,
                                     "Unknown output pin '" + edge.source.pin + "' on " + source->signature.kind});
    }
    auto const* destinationPin = destination->signature.findInput(edge.destination.pin);
    if (destinationPin == nullptr) {
        return std::unexpected(Error{Error::Code::DanglingEdge,
                                     "Unknown input pin '" + edge.destination.pin + "' on "
                                         + destination->signature.kind});
    }

    auto occupied = std::ranges::any_of(destination->incoming, [&](Edge const& existing) {
        return existing.destination.pin == edge.destination.pin;
    });
    if (occupied) {
        return std::unexpected(Error{Error::Code::DuplicateEdge,
                                     "Input pin already connected: " + toString(edge.destination.node) + ":"
                                         + edge.destination.pin});
    }

    if (!pinsCompatible(*sourcePin, *destinationPin)) {
        return std::unexpected(Error{Error::Code::IncompatiblePins, "Incompatible pins: " + toString(edge)});
    }

    if (reaches(edge.destination.node, edge.source.node)) {
        return std::unexpected(Error{Error::Code::CycleDetected, "Edge would close a cycle: " + toString(edge)});
    }
    return {};
}

// Depth-first search along outgoing edges. A node always reaches itself.
auto GraphRuntime::reaches(NodeId from, NodeId to) const -> bool {
    std::vector<bool>   visited(slots_.size(), false);
    std::vector<NodeId> stack{from};
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        if (current == to) {
            return true;
        }
        if (visited[current.index]) {
            continue;
        }
        visited[current.index] = true;
        for (auto const& edge : slots_[current.index].outgoing) {
            if (!visited[edge.destination.node.index]) {
                stack.push_back(edge.destination.node);
            }
        }
    }
    return false;
}

auto GraphRuntime::connect(Edge const& edge) -> Expected<void> {
    if (auto valid = validateEdge(edge); !valid) {
        sg_log("Rejected edge " + toString(edge) + ": " + describeError(valid.error()), "GraphRuntime", "ERROR");
        return valid;
    }
    edges_.push_back(edge);
    slots_[edge.source.node.index].outgoing.push_back(edge);
    slots_[edge.destination.node.index].incoming.push_back(edge);
    rebuildOrder();
    propagateDirty(edge.destination.node);
    sg_log("Connected " + toString(edge), "GraphRuntime");
    return {};
}

auto GraphRuntime::connect(NodeId source, std::string_view sourcePin, NodeId destination, std::string_view destinationPin)
    -> Expected<void> {
    return connect(Edge{.source      = PinRef{.node = source, .pin = std::string{sourcePin}},
                        .destination = PinRef{.node = destination, .pin = std::string{destinationPin}}});
}

auto GraphRuntime::disconnect(Edge const& edge) -> Expected<void> {
    if (!contains(edge.source.node)) {
        return std::unexpected(node_not_found(edge.source.node));
    }
    if (!contains(edge.destination.node)) {
        return std::unexpected(node_not_found(edge.destination.node));
    }
    auto it = std::ranges::find(edges_, edge);
    if (it == edges_.end()) {
        return std::unexpected(Error{Error::Code::EdgeNotFound, "Edge not found: " + toString(edge)});
    }
    edges_.erase(it);
    std::erase(slots_[edge.source.node.index].outgoing, edge);
    std::erase(slots_[edge.destination.node.index].incoming, edge);
    rebuildOrder();
    propagateDirty(edge.destination.node);
    sg_log("Disconnected " + toString(edge), "GraphRuntime");
    return {};
}

auto GraphRuntime::setInputBinding(NodeId node, std::string_view pin, InputBinding binding) -> Expected<void> {
    auto* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    auto const* pinSpec = slot->signature.findInput(pin);
    if (pinSpec == nullptr) {
        return std::unexpected(Error{Error::Code::DanglingEdge,
                                     "Unknown input pin '" + std::string{pin} + "' on " + slot->signature.kind});
    }
    if (auto const* literal = binding.literalValue(); literal != nullptr && !literal->isEmpty()) {
        auto literalPin = PinSpec::output("literal", literal->kind());
        if (!pinsCompatible(literalPin, *pinSpec)) {
            return std::unexpected(Error{Error::Code::IncompatiblePins,
                                         "Literal of kind " + std::string{literal->typeName()}
                                             + " cannot feed pin '" + std::string{pin} + "'"});
        }
    }
    slot->bindings.insert_or_assign(std::string{pin}, std::move(binding));
    propagateDirty(node);
    return {};
}

auto GraphRuntime::clearInputBinding(NodeId node, std::string_view pin) -> Expected<void> {
    auto* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    if (slot->bindings.erase(std::string{pin}) > 0) {
        propagateDirty(node);
    }
    return {};
}

auto GraphRuntime::markDirty(NodeId node) -> Expected<void> {
    if (!contains(node)) {
        return std::unexpected(node_not_found(node));
    }
    propagateDirty(node);
    return {};
}

// Breadth-first walk from `node` along outgoing edges, marking every node reached.
auto GraphRuntime::propagateDirty(NodeId node) -> void {
    if (!contains(node)) {
        return;
    }
    std::vector<bool>         visited(slots_.size(), false);
    std::deque<std::uint32_t> queue{node.index};
    visited[node.index] = true;
    while (!queue.empty()) {
        auto index = queue.front();
        queue.pop_front();
        slots_[index].dirty = true;
        for (auto const& edge : slots_[index].outgoing) {
            auto const next = edge.destination.node.index;
            if (!visited[next]) {
                visited[next] = true;
                queue.push_back(next);
            }
        }
    }
}

// Registry writes only dirty the nodes that can read them. Consumers follow
// during evaluation if those nodes' outputs change.
auto GraphRuntime::markScopeDirty(ScopeId scope) -> void {
    for (auto& slot : slots_) {
        if (slot.alive && registry_.isWithin(slot.scope, scope)) {
            slot.dirty = true;
        }
    }
}

// Dirties every node with an input bound to `path`. Used for values the runtime
// writes into the root scope, which every node scope can see.
auto GraphRuntime::markPathReaders(DotPath const& path) -> void {
    for (auto& slot : slots_) {
        if (!slot.alive) {
            continue;
        }
        for (auto const& [pin, binding] : slot.bindings) {
            if (auto const* bound = binding.path(); bound != nullptr && *bound == path) {
                slot.dirty = true;
                break;
            }
        }
    }
}

// Kahn's algorithm over the live nodes. Sources are seeded in slot order so the
// order is stable for a given graph.
auto GraphRuntime::rebuildOrder() -> void {
    std::vector<std::size_t>  indegree(slots_.size(), 0);
    std::deque<std::uint32_t> ready;
    for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        if (!slots_[index].alive) {
            continue;
        }
        indegree[index] = slots_[index].incoming.size();
        if (indegree[index] == 0) {
            ready.push_back(index);
        }
    }

    order_.clear();
    order_.reserve(liveNodes_);
    while (!ready.empty()) {
        auto index = ready.front();
        ready.pop_front();
        order_.push_back(idOf(index));
        for (auto const& edge : slots_[index].outgoing) {
            if (--indegree[edge.destination.node.index] == 0) {
                ready.push_back(edge.destination.node.index);
            }
        }
    }
}

auto GraphRuntime::enqueue(InteractionEvent event) -> void {
    pending_.push_back(std::move(event));
}

auto GraphRuntime::tick(double deltaSeconds) -> TickReport {
    return tick(deltaSeconds, {});
}

auto GraphRuntime::tick(double deltaSeconds, std::vector<InteractionEvent> events) -> TickReport {
    for (auto& event : events) {
        pending_.push_back(std::move(event));
    }

    clock_.tick += 1;
    clock_.delta = deltaSeconds;
    clock_.time += deltaSeconds;

    TickReport report;
    report.tick  = clock_.tick;
    report.time  = clock_.time;
    report.delta = clock_.delta;

    auto const limit = options_.max_events_per_tick == 0 ? pending_.size()
                                                          : std::min(options_.max_events_per_tick, pending_.size());
    for (std::size_t index = 0; index < limit; ++index) {
        auto event = std::move(pending_.front());
        pending_.pop_front();
        auto applied = applyEvent(event, report);
        if (applied) {
            ++report.appliedEvents;
            continue;
        }
        auto name = std::string{eventName(event)};
        sg_log("Rejected " + name + " event: " + describeError(applied.error()), "GraphRuntime", "ERROR");
        errorLog_.append(NodeErrorRecord{.tick = clock_.tick, .node = NodeId{}, .source = name, .error = applied.error()});
        report.eventErrors.push_back(EventFailure{.index = index, .event = std::move(name), .error = applied.error()});
    }
    report.deferredEvents = pending_.size();

    publishClock();

    if (deltaSeconds != 0.0) {
        for (auto& slot : slots_) {
            if (slot.alive && slot.kind->timeDependent()) {
                slot.dirty = true;
            }
        }
    }

    for (auto const& node : order_) {
        auto const& slot = slots_[node.index];
        if (!slot.dirty && slot.cache) {
            ++report.skippedNodes;
            continue;
        }
        evaluateNode(node, report);
    }

    if (options_.trace_ticks) {
        sg_log("tick " + std::to_string(report.tick) + " evaluated " + std::to_string(report.evaluatedNodes.size())
                   + " skipped " + std::to_string(report.skippedNodes) + " errors "
                   + std::to_string(report.nodeErrors.size() + report.eventErrors.size()),
               "Tick");
    }
    return report;
}

auto GraphRuntime::applyEvent(InteractionEvent const& event, TickReport& report) -> Expected<void> {
    return std::visit(
        Overloaded{
            [&](Events::SetValue const& set) -> Expected<void> {
                if (auto stored = registry_.set(set.scope, set.path, set.value); !stored) {
                    return stored;
                }
                markScopeDirty(set.scope);
                return {};
            },
            [&](Events::RemoveValue const& remove) -> Expected<void> {
                if (auto removed = registry_.remove(remove.scope, remove.path); !removed) {
                    return removed;
                }
                markScopeDirty(remove.scope);
                return {};
            },
            [&](Events::AddNode const& add) -> Expected<void> {
                auto created = addNode(add.kind, add.label);
                if (!created) {
                    return std::unexpected(created.error());
                }
                report.createdNodes.push_back(*created);
                return {};
            },
            [&](Events::RemoveNode const& remove) -> Expected<void> { return removeNode(remove.node); },
            [&](Events::Connect const& connection) -> Expected<void> { return connect(connection.edge); },
            [&](Events::Disconnect const& connection) -> Expected<void> { return disconnect(connection.edge); },
            [&](Events::SetBinding const& binding) -> Expected<void> {
                return setInputBinding(binding.node, binding.pin, binding.binding);
            },
            [&](Events::ClearBinding const& binding) -> Expected<void> {
                return clearInputBinding(binding.node, binding.pin);
            },
        },
        event);
}

auto GraphRuntime::gatherInputs(NodeSlot const& slot, EvaluationContext const& context) const -> InputMap {
    InputMap inputs;
    for (auto const& pin : slot.signature.inputs) {
        auto edge = std::ranges::find_if(slot.incoming, [&](Edge const& candidate) {
            return candidate.destination.pin == pin.name;
        });
        if (edge != slot.incoming.end()) {
            auto const& source = slots_[edge->source.node.index];
            Value       value;
            if (source.cache) {
                if (auto it = source.cache->find(edge->source.pin); it != source.cache->end()) {
                    value = it->second;
                }
            }
            inputs.emplace(pin.name, std::move(value));
            continue;
        }
        if (auto binding = slot.bindings.find(pin.name); binding != slot.bindings.end()) {
            if (auto value = binding->second.resolve(context)) {
                inputs.emplace(pin.name, std::move(*value));
            }
        }
    }
    return inputs;
}

auto GraphRuntime::evaluateNode(NodeId node, TickReport& report) -> void {
    auto& slot = slots_[node.index];
    EvaluationContext context{registry_, slot.scope, clock_};
    auto inputs = gatherInputs(slot, context);

    Expected<OutputMap> result = std::unexpected(Error{Error::Code::UnknownError, "Node produced no result"});
    try {
        result = slot.kind->evaluate(inputs, context);
    } catch (std::exception const& ex) {
        result = std::unexpected(Error{Error::Code::Custom, ex.what()});
    } catch (...) {
        result = std::unexpected(Error{Error::Code::Custom, "Node threw a non-standard exception"});
    }

    report.evaluatedNodes.push_back(node);
    slot.dirty = false;

    if (!result) {
        recordFailure(node, slot, std::move(result.error()), report);
        return;
    }

    slot.error.reset();
    if (!slot.cache || !(*slot.cache == *result)) {
        slot.cache = std::move(*result);
        ++slot.version;
        // Consumers come later in the order; each one passes the change on
        // only if its own outputs change.
        for (auto const& edge : slot.outgoing) {
            slots_[edge.destination.node.index].dirty = true;
        }
    }

    if (options_.publish_outputs) {
        if (auto published = publishOutputs(slot); !published) {
            sg_log("Could not publish outputs of " + toString(node) + ": " + describeError(published.error()),
                   "GraphRuntime",
                   "ERROR");
            errorLog_.append(
                NodeErrorRecord{.tick = clock_.tick, .node = node, .source = "publish", .error = published.error()});
        }
    }
}

auto GraphRuntime::recordFailure(NodeId node, NodeSlot& slot, Error error, TickReport& report) -> void {
    sg_log("Node " + toString(node) + " (" + slot.signature.kind + ") failed: " + describeError(error),
           "GraphRuntime",
           "ERROR");
    if (!slot.cache) {
        OutputMap sentinel;
        for (auto const& pin : slot.signature.outputs) {
            sentinel.emplace(pin.name, Value{});
        }
        slot.cache = std::move(sentinel);
        ++slot.version;
        for (auto const& edge : slot.outgoing) {
            slots_[edge.destination.node.index].dirty = true;
        }
    }
    slot.error = error;
    errorLog_.append(NodeErrorRecord{.tick = clock_.tick, .node = node, .source = slot.signature.kind, .error = error});
    report.nodeErrors.push_back(NodeFailure{.node = node, .kind = slot.signature.kind, .error = std::move(error)});
}

auto GraphRuntime::publishOutputs(NodeSlot const& slot) -> Expected<void> {
    for (auto const& [pin, value] : *slot.cache) {
        auto stored = registry_.set(slot.scope, options_.outputs_prefix + "." + pin, value);
        if (!stored) {
            return stored;
        }
    }
    return {};
}

auto GraphRuntime::publishClock() -> void {
    publishClockValue(options_.time_path, clock_.time);
    publishClockValue(options_.delta_path, clock_.delta);
}

// Writes one clock value into the root scope and dirties the nodes bound to it
// when the value differs from the one already published.
auto GraphRuntime::publishClockValue(std::string const& path, double value) -> void {
    auto parsed = DotPath::parse(path);
    if (!parsed) {
        return;
    }
    auto previous = registry_.getLocal(root_, *parsed);
    if (previous && *previous == Value{value}) {
        return;
    }
    if (auto stored = registry_.set(root_, *parsed, Value{value}); !stored) {
        sg_log("Could not publish clock at " + path + ": " + describeError(stored.error()), "Tick", "ERROR");
        errorLog_.append(
            NodeErrorRecord{.tick = clock_.tick, .node = NodeId{}, .source = "clock", .error = stored.error()});
        return;
    }
    markPathReaders(*parsed);
}

auto GraphRuntime::nodes() const -> std::vector<NodeId> {
    std::vector<NodeId> ids;
    ids.reserve(liveNodes_);
    for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        if (slots_[index].alive) {
            ids.push_back(idOf(index));
        }
    }
    return ids;
}

auto GraphRuntime::incomingEdges(NodeId node) const -> std::vector<Edge> {
    auto const* slot = slotFor(node);
    return slot == nullptr ? std::vector<Edge>{} : slot->incoming;
}

auto GraphRuntime::outgoingEdges(NodeId node) const -> std::vector<Edge> {
    auto const* slot = slotFor(node);
    return slot == nullptr ? std::vector<Edge>{} : slot->outgoing;
}

auto GraphRuntime::validate() const -> GraphValidation {
    GraphValidation validation;
    for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        auto const& slot = slots_[index];
        if (!slot.alive || !slot.incoming.empty() || !slot.outgoing.empty()) {
            continue;
        }
        auto id = idOf(index);
        validation.orphanedNodes.push_back(id);
        validation.warnings.push_back("Orphaned node: " + toString(id) + " ("
                                      + (slot.label.empty() ? slot.signature.kind : slot.label) + ")");
    }
    for (auto const& warning : validation.warnings) {
        sg_log(warning, "GraphRuntime", "WARNING");
    }
    return validation;
}

auto GraphRuntime::nodeOutputs(NodeId node) const -> Expected<OutputMap const*> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    if (!slot->cache) {
        return std::unexpected(Error{Error::Code::PathNotFound, "Node has not been evaluated: " + toString(node)});
    }
    return &*slot->cache;
}

auto GraphRuntime::nodeOutput(NodeId node, std::string_view pin) const -> Expected<Value> {
    auto outputs = nodeOutputs(node);
    if (!outputs) {
        return std::unexpected(outputs.error());
    }
    auto it = (*outputs)->find(std::string{pin});
    if (it == (*outputs)->end()) {
        return std::unexpected(Error{Error::Code::PathNotFound, "No output '" + std::string{pin} + "' on " + toString(node)});
    }
    return it->second;
}

auto GraphRuntime::nodeError(NodeId node) const -> Expected<std::optional<Error>> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return slot->error;
}

auto GraphRuntime::nodeVersion(NodeId node) const -> Expected<std::uint64_t> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return slot->version;
}

auto GraphRuntime::isDirty(NodeId node) const -> Expected<bool> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return slot->dirty || !slot->cache;
}

auto GraphRuntime::nodeScope(NodeId node) const -> Expected<ScopeId> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return slot->scope;
}

auto GraphRuntime::nodeKind(NodeId node) const -> Expected<std::string> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return slot->signature.kind;
}

auto GraphRuntime::nodeLabel(NodeId node) const -> Expected<std::string> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return slot->label;
}

auto GraphRuntime::nodeSignature(NodeId node) const -> Expected<NodeSignature const*> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    return &slot->signature;
}

auto GraphRuntime::inputBinding(NodeId node, std::string_view pin) const -> Expected<std::optional<InputBinding>> {
    auto const* slot = slotFor(node);
    if (slot == nullptr) {
        return std::unexpected(node_not_found(node));
    }
    auto it = slot->bindings.find(std::string{pin});
    if (it == slot->bindings.end()) {
        return std::optional<InputBinding>{};
    }
    return std::optional<InputBinding>{it->second};
}

} // namespace SG
