#include <scopegraph/logic/EvaluationContext.hpp>

#include <doctest/doctest.h>

using namespace SG;

TEST_SUITE("logic.evaluation_context") {
    TEST_CASE("Reads resolve relative to the node scope") {
        ScopeRegistry registry;
        auto root = registry.createRootScope();
        auto node = registry.createChildScope(root, "node");
        REQUIRE(node.has_value());
        REQUIRE(registry.set(root, "gain", Value{2.0}).has_value());
        REQUIRE(registry.set(*node, "value", Value{0.5}).has_value());

        EvaluationContext context{registry, *node, TickClock{.time = 3.0, .delta = 0.5, .tick = 6}};
        CHECK(context.scope() == *node);
        CHECK(context.time() == doctest::Approx(3.0));
        CHECK(context.deltaTime() == doctest::Approx(0.5));
        CHECK(context.clock().tick == 6);

        CHECK(*context.read("gain") == Value{2.0});
        CHECK(*context.read("value") == Value{0.5});

        auto local = context.readLocal("gain");
        REQUIRE_FALSE(local.has_value());
        CHECK(local.error().code == Error::Code::PathNotFound);
    }

    TEST_CASE("Writes land in the node scope only") {
        ScopeRegistry registry;
        auto root = registry.createRootScope();
        auto node = registry.createChildScope(root, "node");
        REQUIRE(node.has_value());
        REQUIRE(registry.set(root, "state", Value{"parent"}).has_value());

        EvaluationContext context{registry, *node, TickClock{}};
        REQUIRE(context.write("state", Value{"child"}).has_value());

        CHECK(*registry.get(root, "state") == Value{"parent"});
        CHECK(*registry.get(*node, "state") == Value{"child"});

        auto bad = context.write("no..path", Value{1.0});
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::InvalidPath);
    }
}
