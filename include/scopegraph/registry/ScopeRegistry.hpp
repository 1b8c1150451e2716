#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/path/DotPath.hpp>
#include <scopegraph/type/Value.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SG {

/**
 * Handle to one scope in a ScopeRegistry.
 *
 * A ScopeId is an index into the registry's scope arena plus the generation of
 * the slot at the time the scope was created. Destroying a scope bumps the
 * slot generation, so stale handles are rejected with ScopeNotFound instead of
 * aliasing whichever scope later reuses the slot.
 */
struct ScopeId {
    static constexpr std::uint32_t kInvalidIndex = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index      = kInvalidIndex;
    std::uint32_t generation = 0;

    auto isValid() const -> bool { return index != kInvalidIndex; }
    auto operator==(ScopeId const&) const -> bool = default;
};

[[nodiscard]] auto toString(ScopeId id) -> std::string;

} // namespace SG

template <>
struct std::hash<SG::ScopeId> {
    auto operator()(SG::ScopeId const& id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(id.generation) << 32) | id.index);
    }
};

namespace SG {

/**
 * Named values stored per scope, with scopes arranged as a parent-linked tree.
 *
 * - get() searches the requested scope, then each ancestor up to the root.
 *   A value in a child scope shadows the same path in any ancestor.
 * - set()/remove() only ever touch the exact scope they are given.
 * - destroyScope() refuses scopes that still have live children; use
 *   destroyScopeTree() to tear down a whole subtree.
 *
 * The registry is not synchronised. It is owned by a single writer (the graph
 * runtime) and UI code reaches it through the runtime's event queue.
 */
class ScopeRegistry {
public:
    using Entries = phmap::flat_hash_map<DotPath, Value>;

    ScopeRegistry()                                = default;
    ScopeRegistry(ScopeRegistry const&)            = delete;
    ScopeRegistry& operator=(ScopeRegistry const&) = delete;
    ScopeRegistry(ScopeRegistry&&)                 = default;
    ScopeRegistry& operator=(ScopeRegistry&&)      = default;

    auto createRootScope(std::string name = "root") -> ScopeId;
    auto createChildScope(ScopeId parent, std::string name = {}) -> Expected<ScopeId>;
    auto destroyScope(ScopeId scope) -> Expected<void>;
    // Destroys the scope and every descendant, children first. Returns the
    // number of scopes removed.
    auto destroyScopeTree(ScopeId scope) -> Expected<std::size_t>;

    [[nodiscard]] auto contains(ScopeId scope) const -> bool;
    auto parent(ScopeId scope) const -> Expected<std::optional<ScopeId>>;
    auto children(ScopeId scope) const -> Expected<std::vector<ScopeId>>;
    auto name(ScopeId scope) const -> Expected<std::string>;
    auto roots() const -> std::vector<ScopeId>;
    // The scope itself followed by its ancestors, nearest first.
    auto ancestry(ScopeId scope) const -> Expected<std::vector<ScopeId>>;
    // True when `ancestor` is `scope` or one of its ancestors.
    [[nodiscard]] auto isWithin(ScopeId scope, ScopeId ancestor) const -> bool;

    auto get(ScopeId scope, DotPath const& path) const -> Expected<Value>;
    auto get(ScopeId scope, std::string_view path) const -> Expected<Value>;
    // The scope that supplies `path` for a lookup starting at `scope`.
    auto resolve(ScopeId scope, DotPath const& path) const -> Expected<ScopeId>;
    auto getLocal(ScopeId scope, DotPath const& path) const -> Expected<Value>;
    auto getAs(ScopeId scope, DotPath const& path, ValueKind kind) const -> Expected<Value>;

    auto set(ScopeId scope, DotPath const& path, Value value) -> Expected<void>;
    auto set(ScopeId scope, std::string_view path, Value value) -> Expected<void>;
    // Removing a path that the scope does not hold is not an error.
    auto remove(ScopeId scope, DotPath const& path) -> Expected<void>;
    auto clearScope(ScopeId scope) -> Expected<void>;

    auto entries(ScopeId scope) const -> Expected<Entries const*>;
    // Paths held directly by the scope, sorted.
    auto listPaths(ScopeId scope) const -> Expected<std::vector<DotPath>>;

    [[nodiscard]] auto scopeCount() const -> std::size_t { return liveScopes_; }

private:
    struct ScopeSlot {
        bool                         alive      = false;
        std::uint32_t                generation = 0;
        std::optional<std::uint32_t> parent;
        std::string                  name;
        std::vector<ScopeId>         children;
        Entries                      entries;
    };

    auto slotFor(ScopeId scope) -> ScopeSlot*;
    auto slotFor(ScopeId scope) const -> ScopeSlot const*;
    auto allocate(std::optional<std::uint32_t> parent, std::string name) -> ScopeId;
    auto release(ScopeId scope) -> void;
    auto idOf(std::uint32_t index) const -> ScopeId;

    std::vector<ScopeSlot>     slots_;
    std::vector<std::uint32_t> freeSlots_;
    std::size_t                liveScopes_ = 0;
};

} // namespace SG
