#include <scopegraph/registry/RegistryJsonExporter.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace SG {

namespace {

using Json = nlohmann::json;

auto export_scope(ScopeRegistry const& registry,
                  ScopeId scope,
                  std::size_t depth,
                  RegistryJsonOptions const& options) -> Expected<std::optional<Json>> {
    auto paths = registry.listPaths(scope);
    if (!paths) {
        return std::unexpected(paths.error());
    }
    auto scopeName = registry.name(scope);
    if (!scopeName) {
        return std::unexpected(scopeName.error());
    }

    Json node = Json::object();
    node["id"]   = toString(scope);
    node["name"] = *scopeName;

    Json values = Json::object();
    for (auto const& path : *paths) {
        auto value = registry.getLocal(scope, path);
        if (!value) {
            return std::unexpected(value.error());
        }
        values[path.str()] = toJson(*value);
    }
    node["values"] = std::move(values);

    Json children = Json::array();
    if (depth < options.maxDepth) {
        auto childIds = registry.children(scope);
        if (!childIds) {
            return std::unexpected(childIds.error());
        }
        for (auto const& child : *childIds) {
            auto exported = export_scope(registry, child, depth + 1, options);
            if (!exported) {
                return std::unexpected(exported.error());
            }
            if (*exported) {
                children.push_back(std::move(**exported));
            }
        }
    }

    bool const empty = paths->empty() && children.empty();
    if (empty && !options.includeEmpty) {
        return std::optional<Json>{};
    }
    node["children"] = std::move(children);
    return std::optional<Json>{std::move(node)};
}

} // namespace

auto RegistryJsonExporter::Export(ScopeRegistry const& registry, RegistryJsonOptions const& options)
    -> Expected<std::string> {
    std::vector<ScopeId> starts;
    if (options.root) {
        if (!registry.contains(*options.root)) {
            return std::unexpected(Error{Error::Code::ScopeNotFound,
                                         "Export root " + toString(*options.root) + " does not exist"});
        }
        starts.push_back(*options.root);
    } else {
        starts = registry.roots();
    }

    Json scopes = Json::array();
    for (auto const& start : starts) {
        auto exported = export_scope(registry, start, 0, options);
        if (!exported) {
            return std::unexpected(exported.error());
        }
        if (*exported) {
            scopes.push_back(std::move(**exported));
        }
    }

    Json document = Json::object();
    document["scope_count"] = registry.scopeCount();
    document["scopes"]      = std::move(scopes);
    return document.dump(options.indent);
}

} // namespace SG
