#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/registry/ScopeRegistry.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace SG {

struct RegistryJsonOptions {
    std::optional<ScopeId> root;              // Export only this subtree; every root when unset.
    std::size_t            maxDepth      = 16; // 0 exports the start scopes without children.
    bool                   includeEmpty  = true;
    int                    indent        = 2;  // Negative for compact output.
};

class RegistryJsonExporter {
public:
    static auto Export(ScopeRegistry const& registry, RegistryJsonOptions const& options = RegistryJsonOptions{})
        -> Expected<std::string>;
};

} // namespace SG
