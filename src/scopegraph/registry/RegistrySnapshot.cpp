#include <scopegraph/registry/RegistrySnapshot.hpp>

#include <utility>

namespace SG {

auto RegistrySnapshot::get(DotPath const& path) const -> Value const* {
    auto it = entries.find(path);
    if (it == entries.end()) {
        return nullptr;
    }
    return &it->second;
}

auto captureScope(ScopeRegistry const& registry, ScopeId scope) -> Expected<RegistrySnapshot> {
    auto held = registry.entries(scope);
    if (!held) {
        return std::unexpected(held.error());
    }
    RegistrySnapshot snapshot{.scope = scope, .entries = {}, .description = std::nullopt};
    for (auto const& [path, value] : **held) {
        snapshot.entries.emplace(path, value);
    }
    return snapshot;
}

auto RegistryDiff::compare(RegistrySnapshot const& before, RegistrySnapshot const& after) -> RegistryDiff {
    RegistryDiff diff;
    // Both maps are ordered, so a single merge pass keeps the change list sorted by path.
    auto lhs = before.entries.begin();
    auto rhs = after.entries.begin();
    while (lhs != before.entries.end() || rhs != after.entries.end()) {
        if (rhs == after.entries.end() || (lhs != before.entries.end() && lhs->first < rhs->first)) {
            diff.changes_.push_back(RegistryChange{RegistryChange::Type::Removed, lhs->first, lhs->second, std::nullopt});
            ++lhs;
        } else if (lhs == before.entries.end() || rhs->first < lhs->first) {
            diff.changes_.push_back(RegistryChange{RegistryChange::Type::Added, rhs->first, std::nullopt, rhs->second});
            ++rhs;
        } else {
            if (!(lhs->second == rhs->second)) {
                diff.changes_.push_back(RegistryChange{RegistryChange::Type::Modified, lhs->first, lhs->second, rhs->second});
            }
            ++lhs;
            ++rhs;
        }
    }
    return diff;
}

auto RegistryDiff::find(DotPath const& path) const -> RegistryChange const* {
    for (auto const& change : changes_) {
        if (change.path == path) {
            return &change;
        }
    }
    return nullptr;
}

auto RegistryDiff::applyTo(ScopeRegistry& registry, ScopeId scope) const -> Expected<void> {
    if (!registry.contains(scope)) {
        return std::unexpected(Error{Error::Code::ScopeNotFound, "Cannot apply diff to " + toString(scope)});
    }
    for (auto const& change : changes_) {
        Expected<void> status{};
        if (change.type == RegistryChange::Type::Removed) {
            status = registry.remove(scope, change.path);
        } else {
            status = registry.set(scope, change.path, *change.current);
        }
        if (!status) {
            return status;
        }
    }
    return {};
}

auto RegistryDiff::revertOn(ScopeRegistry& registry, ScopeId scope) const -> Expected<void> {
    if (!registry.contains(scope)) {
        return std::unexpected(Error{Error::Code::ScopeNotFound, "Cannot revert diff on " + toString(scope)});
    }
    for (auto it = changes_.rbegin(); it != changes_.rend(); ++it) {
        Expected<void> status{};
        if (it->type == RegistryChange::Type::Added) {
            status = registry.remove(scope, it->path);
        } else {
            status = registry.set(scope, it->path, *it->previous);
        }
        if (!status) {
            return status;
        }
    }
    return {};
}

} // namespace SG
