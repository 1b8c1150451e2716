#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/path/DotPath.hpp>
#include <scopegraph/registry/ScopeRegistry.hpp>
#include <scopegraph/type/Value.hpp>

#include <cstdint>
#include <string_view>

namespace SG {

// Simulated clock supplied by the caller of GraphRuntime::tick.
struct TickClock {
    double        time  = 0.0; // Seconds accumulated over all ticks.
    double        delta = 0.0; // Seconds supplied for the current tick.
    std::uint64_t tick  = 0;
};

/**
 * What a node sees while it evaluates: the registry, resolved relative to the
 * node's own scope, and the simulated clock.
 *
 * Reads follow the normal ancestor fallback. Writes always land in the node's
 * own scope; a node has no way to write into a parent or sibling scope.
 */
class EvaluationContext {
public:
    EvaluationContext(ScopeRegistry& registry, ScopeId scope, TickClock clock)
        : registry_(registry), scope_(scope), clock_(clock) {}

    auto scope() const -> ScopeId { return scope_; }
    auto clock() const -> TickClock const& { return clock_; }
    auto time() const -> double { return clock_.time; }
    auto deltaTime() const -> double { return clock_.delta; }

    auto read(DotPath const& path) const -> Expected<Value>;
    auto read(std::string_view path) const -> Expected<Value>;
    auto readLocal(DotPath const& path) const -> Expected<Value>;
    auto readLocal(std::string_view path) const -> Expected<Value>;

    auto write(DotPath const& path, Value value) -> Expected<void>;
    auto write(std::string_view path, Value value) -> Expected<void>;

    auto registry() const -> ScopeRegistry const& { return registry_; }

private:
    ScopeRegistry& registry_;
    ScopeId        scope_;
    TickClock      clock_;
};

} // namespace SG
