#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/path/DotPath.hpp>
#include <scopegraph/registry/ScopeRegistry.hpp>
#include <scopegraph/type/Value.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SG {

// Entries held directly by one scope at capture time. Ancestor values are not
// folded in, so applying a snapshot elsewhere never copies shadowed data.
struct RegistrySnapshot {
    ScopeId                  scope;
    std::map<DotPath, Value> entries;
    std::optional<std::string> description;

    auto get(DotPath const& path) const -> Value const*;
    auto contains(DotPath const& path) const -> bool { return entries.contains(path); }
    auto size() const -> std::size_t { return entries.size(); }
};

[[nodiscard]] auto captureScope(ScopeRegistry const& registry, ScopeId scope) -> Expected<RegistrySnapshot>;

struct RegistryChange {
    enum class Type {
        Added,
        Removed,
        Modified
    };

    Type                 type;
    DotPath              path;
    std::optional<Value> previous;
    std::optional<Value> current;
};

class RegistryDiff {
public:
    static auto compare(RegistrySnapshot const& before, RegistrySnapshot const& after) -> RegistryDiff;

    auto changes() const -> std::vector<RegistryChange> const& { return changes_; }
    auto empty() const -> bool { return changes_.empty(); }
    auto size() const -> std::size_t { return changes_.size(); }
    auto find(DotPath const& path) const -> RegistryChange const*;

    // Replays the change set onto `scope`: added and modified paths are set to
    // their new value, removed paths are erased.
    auto applyTo(ScopeRegistry& registry, ScopeId scope) const -> Expected<void>;
    // Applies the inverse change set, restoring the "before" state.
    auto revertOn(ScopeRegistry& registry, ScopeId scope) const -> Expected<void>;

private:
    std::vector<RegistryChange> changes_;
};

} // namespace SG
