#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/logic/NodeKind.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace SG {

/**
 * Registry of the node kinds an editor can place.
 *
 * Each kind is registered under its name with a factory. The signature is
 * captured once at registration so the editor can validate a connection
 * before it instantiates anything.
 */
class NodeCatalog {
public:
    using Factory = std::function<std::unique_ptr<NodeKind>()>;

    // A catalog pre-populated with every built-in kind.
    static auto withBuiltins() -> NodeCatalog;

    auto registerKind(std::string name, Factory factory) -> Expected<void>;
    auto create(std::string_view kind) const -> Expected<std::unique_ptr<NodeKind>>;
    auto signature(std::string_view kind) const -> Expected<NodeSignature>;

    [[nodiscard]] auto contains(std::string_view kind) const -> bool;
    // Registered kind names, sorted.
    auto kinds() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

private:
    struct Entry {
        Factory       factory;
        NodeSignature signature;
    };

    phmap::flat_hash_map<std::string, Entry> entries_;
};

} // namespace SG
