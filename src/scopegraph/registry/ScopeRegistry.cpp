#include <scopegraph/registry/ScopeRegistry.hpp>

#include "scopegraph/log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace SG {

namespace {

auto scope_not_found(ScopeId scope) -> Error {
    return Error{Error::Code::ScopeNotFound, "Scope " + toString(scope) + " does not exist"};
}

} // namespace

auto toString(ScopeId id) -> std::string {
    if (!id.isValid()) {
        return "scope#invalid";
    }
    return "scope#" + std::to_string(id.index) + "." + std::to_string(id.generation);
}

auto ScopeRegistry::slotFor(ScopeId scope) -> ScopeSlot* {
    if (!scope.isValid() || scope.index >= slots_.size()) {
        return nullptr;
    }
    auto& slot = slots_[scope.index];
    if (!slot.alive || slot.generation != scope.generation) {
        return nullptr;
    }
    return &slot;
}

auto ScopeRegistry::slotFor(ScopeId scope) const -> ScopeSlot const* {
    if (!scope.isValid() || scope.index >= slots_.size()) {
        return nullptr;
    }
    auto const& slot = slots_[scope.index];
    if (!slot.alive || slot.generation != scope.generation) {
        return nullptr;
    }
    return &slot;
}

auto ScopeRegistry::idOf(std::uint32_t index) const -> ScopeId {
    return ScopeId{index, slots_[index].generation};
}

auto ScopeRegistry::allocate(std::optional<std::uint32_t> parent, std::string name) -> ScopeId {
    std::uint32_t index;
    if (!freeSlots_.empty()) {
        index = freeSlots_.back();
        freeSlots_.pop_back();
    } else {
        index = static_cast<std::uint32_t>(slots_.size());
        slots_.emplace_back();
    }
    auto& slot  = slots_[index];
    slot.alive  = true;
    slot.parent = parent;
    slot.name   = std::move(name);
    slot.children.clear();
    slot.entries.clear();
    ++liveScopes_;
    return idOf(index);
}

auto ScopeRegistry::release(ScopeId scope) -> void {
    auto& slot = slots_[scope.index];
    slot.alive = false;
    slot.parent.reset();
    slot.name.clear();
    slot.children.clear();
    slot.entries.clear();
    ++slot.generation;
    freeSlots_.push_back(scope.index);
    --liveScopes_;
}

auto ScopeRegistry::createRootScope(std::string name) -> ScopeId {
    auto id = allocate(std::nullopt, std::move(name));
    sg_log("Created root scope " + toString(id), "ScopeRegistry");
    return id;
}

auto ScopeRegistry::createChildScope(ScopeId parent, std::string name) -> Expected<ScopeId> {
    if (slotFor(parent) == nullptr) {
        return std::unexpected(scope_not_found(parent));
    }
    // allocate() may grow slots_, so the parent slot is looked up again after it.
    auto id = allocate(parent.index, std::move(name));
    slots_[parent.index].children.push_back(id);
    sg_log("Created scope " + toString(id) + " under " + toString(parent), "ScopeRegistry");
    return id;
}

auto ScopeRegistry::destroyScope(ScopeId scope) -> Expected<void> {
    auto* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    if (!slot->children.empty()) {
        return std::unexpected(Error{Error::Code::ScopeHasChildren,
                                     "Scope " + toString(scope) + " still has "
                                         + std::to_string(slot->children.size()) + " child scope(s)"});
    }
    if (slot->parent) {
        auto& siblings = slots_[*slot->parent].children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), scope), siblings.end());
    }
    release(scope);
    sg_log("Destroyed scope " + toString(scope), "ScopeRegistry");
    return {};
}

auto ScopeRegistry::destroyScopeTree(ScopeId scope) -> Expected<std::size_t> {
    if (slotFor(scope) == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }

    // Collect in pre-order, then destroy in reverse so children go first.
    std::vector<ScopeId> order;
    std::vector<ScopeId> stack{scope};
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        order.push_back(current);
        for (auto const& child : slots_[current.index].children) {
            stack.push_back(child);
        }
    }

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (auto destroyed = destroyScope(*it); !destroyed) {
            return std::unexpected(destroyed.error());
        }
    }
    return order.size();
}

auto ScopeRegistry::contains(ScopeId scope) const -> bool {
    return slotFor(scope) != nullptr;
}

auto ScopeRegistry::parent(ScopeId scope) const -> Expected<std::optional<ScopeId>> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    if (!slot->parent) {
        return std::optional<ScopeId>{};
    }
    return std::optional<ScopeId>{idOf(*slot->parent)};
}

auto ScopeRegistry::children(ScopeId scope) const -> Expected<std::vector<ScopeId>> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    return slot->children;
}

auto ScopeRegistry::name(ScopeId scope) const -> Expected<std::string> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    return slot->name;
}

auto ScopeRegistry::roots() const -> std::vector<ScopeId> {
    std::vector<ScopeId> result;
    for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        auto const& slot = slots_[index];
        if (slot.alive && !slot.parent) {
            result.push_back(idOf(index));
        }
    }
    return result;
}

auto ScopeRegistry::ancestry(ScopeId scope) const -> Expected<std::vector<ScopeId>> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    std::vector<ScopeId> chain{scope};
    while (slot->parent) {
        auto parentId = idOf(*slot->parent);
        chain.push_back(parentId);
        slot = &slots_[parentId.index];
    }
    return chain;
}

auto ScopeRegistry::isWithin(ScopeId scope, ScopeId ancestor) const -> bool {
    auto chain = ancestry(scope);
    if (!chain) {
        return false;
    }
    return std::find(chain->begin(), chain->end(), ancestor) != chain->end();
}

auto ScopeRegistry::resolve(ScopeId scope, DotPath const& path) const -> Expected<ScopeId> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    auto current = scope;
    while (true) {
        if (slot->entries.contains(path)) {
            return current;
        }
        if (!slot->parent) {
            break;
        }
        current = idOf(*slot->parent);
        slot    = &slots_[current.index];
    }
    return std::unexpected(Error{Error::Code::PathNotFound,
                                 "'" + path.str() + "' is not visible from " + toString(scope)});
}

auto ScopeRegistry::get(ScopeId scope, DotPath const& path) const -> Expected<Value> {
    auto owner = resolve(scope, path);
    if (!owner) {
        return std::unexpected(owner.error());
    }
    return slots_[owner->index].entries.find(path)->second;
}

auto ScopeRegistry::get(ScopeId scope, std::string_view path) const -> Expected<Value> {
    auto parsed = DotPath::parse(path);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return get(scope, *parsed);
}

auto ScopeRegistry::getLocal(ScopeId scope, DotPath const& path) const -> Expected<Value> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    auto it = slot->entries.find(path);
    if (it == slot->entries.end()) {
        return std::unexpected(Error{Error::Code::PathNotFound,
                                     "'" + path.str() + "' is not set in " + toString(scope)});
    }
    return it->second;
}

auto ScopeRegistry::getAs(ScopeId scope, DotPath const& path, ValueKind kind) const -> Expected<Value> {
    auto value = get(scope, path);
    if (!value) {
        return value;
    }
    if (value->kind() != kind) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "'" + path.str() + "' holds " + std::string{value->typeName()}
                                         + ", expected " + std::string{valueKindName(kind)}});
    }
    return value;
}

auto ScopeRegistry::set(ScopeId scope, DotPath const& path, Value value) -> Expected<void> {
    auto* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    slot->entries.insert_or_assign(path, std::move(value));
    return {};
}

auto ScopeRegistry::set(ScopeId scope, std::string_view path, Value value) -> Expected<void> {
    auto parsed = DotPath::parse(path);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return set(scope, *parsed, std::move(value));
}

auto ScopeRegistry::remove(ScopeId scope, DotPath const& path) -> Expected<void> {
    auto* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    slot->entries.erase(path);
    return {};
}

auto ScopeRegistry::clearScope(ScopeId scope) -> Expected<void> {
    auto* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    slot->entries.clear();
    return {};
}

auto ScopeRegistry::entries(ScopeId scope) const -> Expected<Entries const*> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    return &slot->entries;
}

auto ScopeRegistry::listPaths(ScopeId scope) const -> Expected<std::vector<DotPath>> {
    auto const* slot = slotFor(scope);
    if (slot == nullptr) {
        return std::unexpected(scope_not_found(scope));
    }
    std::vector<DotPath> paths;
    paths.reserve(slot->entries.size());
    for (auto const& [path, value] : slot->entries) {
        paths.push_back(path);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace SG
