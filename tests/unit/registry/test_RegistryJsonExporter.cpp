#include <scopegraph/registry/RegistryJsonExporter.hpp>

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

using namespace SG;

TEST_SUITE("registry.json_exporter") {
    TEST_CASE("Export renders the scope tree with values") {
        ScopeRegistry registry;
        auto root  = registry.createRootScope("graph");
        auto child = registry.createChildScope(root, "slider");
        REQUIRE(child.has_value());
        REQUIRE(registry.set(root, "system.time", Value{1.5}).has_value());
        REQUIRE(registry.set(*child, "value", Value{0.25}).has_value());
        REQUIRE(registry.set(*child, "tint", Value{Color{1.0f, 0.0f, 0.0f}}).has_value());

        auto text = RegistryJsonExporter::Export(registry);
        REQUIRE(text.has_value());
        auto json = nlohmann::json::parse(*text);

        CHECK(json["scope_count"] == 2);
        REQUIRE(json["scopes"].size() == 1);
        auto const& graph = json["scopes"][0];
        CHECK(graph["name"] == "graph");
        CHECK(graph["id"] == toString(root));
        CHECK(graph["values"]["system.time"] == 1.5);
        REQUIRE(graph["children"].size() == 1);
        auto const& slider = graph["children"][0];
        CHECK(slider["name"] == "slider");
        CHECK(slider["values"]["value"] == 0.25);
        CHECK(slider["values"]["tint"]["color"].size() == 4);
    }

    TEST_CASE("Export options") {
        ScopeRegistry registry;
        auto root  = registry.createRootScope("graph");
        auto empty = registry.createChildScope(root, "empty");
        auto full  = registry.createChildScope(root, "full");
        REQUIRE(empty.has_value());
        REQUIRE(full.has_value());
        REQUIRE(registry.set(*full, "x", Value{1.0}).has_value());

        SUBCASE("Empty scopes can be skipped") {
            RegistryJsonOptions options;
            options.includeEmpty = false;
            auto json = nlohmann::json::parse(*RegistryJsonExporter::Export(registry, options));
            auto const& children = json["scopes"][0]["children"];
            REQUIRE(children.size() == 1);
            CHECK(children[0]["name"] == "full");
        }

        SUBCASE("Depth limit stops at the start scopes") {
            RegistryJsonOptions options;
            options.maxDepth = 0;
            auto json = nlohmann::json::parse(*RegistryJsonExporter::Export(registry, options));
            CHECK(json["scopes"][0]["children"].empty());
        }

        SUBCASE("A root option exports a subtree") {
            RegistryJsonOptions options;
            options.root   = *full;
            options.indent = -1;
            auto text = RegistryJsonExporter::Export(registry, options);
            REQUIRE(text.has_value());
            CHECK(text->find('\n') == std::string::npos);
            auto json = nlohmann::json::parse(*text);
            REQUIRE(json["scopes"].size() == 1);
            CHECK(json["scopes"][0]["name"] == "full");
        }

        SUBCASE("An unknown root is rejected") {
            RegistryJsonOptions options;
            options.root = ScopeId{};
            auto text = RegistryJsonExporter::Export(registry, options);
            REQUIRE_FALSE(text.has_value());
            CHECK(text.error().code == Error::Code::ScopeNotFound);
        }
    }
}
