#include <scopegraph/graph/GraphRuntime.hpp>
#include <scopegraph/logic/BuiltinNodes.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <memory>
#include <vector>

using namespace SG;

namespace {

auto constant(GraphRuntime& runtime, double value, std::string label = {}) -> NodeId {
    auto node = runtime.addNode(std::make_unique<ConstantNode>(Value{value}), std::move(label));
    REQUIRE(node.has_value());
    return *node;
}

auto node(GraphRuntime& runtime, std::string_view kind, std::string label = {}) -> NodeId {
    auto added = runtime.addNode(kind, std::move(label));
    REQUIRE(added.has_value());
    return *added;
}

auto position(std::vector<NodeId> const& order, NodeId id) -> std::ptrdiff_t {
    return std::ranges::find(order, id) - order.begin();
}

} // namespace

TEST_SUITE("graph.runtime") {
    TEST_CASE("Nodes get their own scope under the graph root") {
        GraphRuntime runtime;
        auto sum = node(runtime, "add", "sum");
        auto unnamed = node(runtime, "multiply");

        CHECK(runtime.nodeCount() == 2);
        CHECK(runtime.contains(sum));
        CHECK(*runtime.nodeKind(sum) == "add");
        CHECK(*runtime.nodeLabel(sum) == "sum");

        auto scope = runtime.nodeScope(sum);
        REQUIRE(scope.has_value());
        CHECK(*runtime.registry().name(*scope) == "sum");
        CHECK(*runtime.registry().parent(*scope) == std::optional<ScopeId>{runtime.rootScope()});
        CHECK(*runtime.registry().name(*runtime.nodeScope(unnamed)) == "multiply");
        CHECK(*runtime.registry().name(runtime.rootScope()) == "graph");

        auto signature = runtime.nodeSignature(sum);
        REQUIRE(signature.has_value());
        CHECK((*signature)->kind == "add");
        CHECK((*signature)->inputs.size() == 2);

        CHECK(*runtime.isDirty(sum));
        auto outputs = runtime.nodeOutputs(sum);
        REQUIRE_FALSE(outputs.has_value());
        CHECK(outputs.error().code == Error::Code::PathNotFound);
    }

    TEST_CASE("Unknown kinds are rejected") {
        GraphRuntime runtime;
        auto added = runtime.addNode("teleport");
        REQUIRE_FALSE(added.has_value());
        CHECK(added.error().code == Error::Code::UnknownNodeKind);
        CHECK(runtime.nodeCount() == 0);

        auto empty = runtime.addNode(std::unique_ptr<NodeKind>{});
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("Connections are validated before they are committed") {
        GraphRuntime runtime;
        auto a      = constant(runtime, 1.0, "a");
        auto b      = constant(runtime, 2.0, "b");
        auto sum    = node(runtime, "add");
        auto concat = node(runtime, "concat");

        REQUIRE(runtime.connect(a, "value", sum, "a").has_value());
        CHECK(runtime.edgeCount() == 1);

        SUBCASE("Missing node") {
            auto result = runtime.connect(NodeId{.index = 99, .generation = 0}, "value", sum, "b");
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::NodeNotFound);
        }
        SUBCASE("Unknown pins") {
            auto output = runtime.connect(a, "nope", sum, "b");
            REQUIRE_FALSE(output.has_value());
            CHECK(output.error().code == Error::Code::DanglingEdge);
            auto input = runtime.connect(a, "value", sum, "c");
            REQUIRE_FALSE(input.has_value());
            CHECK(input.error().code == Error::Code::DanglingEdge);
        }
        SUBCASE("Occupied input pin") {
            auto result = runtime.connect(b, "value", sum, "a");
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::DuplicateEdge);
        }
        SUBCASE("Incompatible kinds") {
            auto result = runtime.connect(concat, "result", sum, "b");
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::IncompatiblePins);
        }
        CHECK(runtime.edgeCount() == 1);
        CHECK(runtime.edges().front() == Edge{.source = PinRef{.node = a, .pin = "value"},
                                              .destination = PinRef{.node = sum, .pin = "a"}});
    }

    TEST_CASE("Cycles are rejected and leave the graph unchanged") {
        GraphRuntime runtime;
        auto first  = node(runtime, "add", "first");
        auto second = node(runtime, "add", "second");
        auto third  = node(runtime, "add", "third");

        REQUIRE(runtime.connect(first, "result", second, "a").has_value());
        REQUIRE(runtime.connect(second, "result", third, "a").has_value());
        auto const orderBefore = runtime.topologicalOrder();

        auto cycle = runtime.connect(third, "result", first, "a");
        REQUIRE_FALSE(cycle.has_value());
        CHECK(cycle.error().code == Error::Code::CycleDetected);

        auto self = runtime.connect(first, "result", first, "b");
        REQUIRE_FALSE(self.has_value());
        CHECK(self.error().code == Error::Code::CycleDetected);

        CHECK(runtime.edgeCount() == 2);
        CHECK(runtime.topologicalOrder() == orderBefore);
    }

    TEST_CASE("Topological order respects every edge") {
        GraphRuntime runtime;
        auto late  = node(runtime, "add", "late");
        auto mid   = node(runtime, "add", "mid");
        auto early = constant(runtime, 1.0, "early");

        REQUIRE(runtime.connect(mid, "result", late, "a").has_value());
        REQUIRE(runtime.connect(early, "value", mid, "a").has_value());

        auto const& order = runtime.topologicalOrder();
        REQUIRE(order.size() == 3);
        CHECK(position(order, early) < position(order, mid));
        CHECK(position(order, mid) < position(order, late));
        CHECK(runtime.incomingEdges(mid).size() == 1);
        CHECK(runtime.outgoingEdges(mid).size() == 1);
        CHECK(runtime.outgoingEdges(late).empty());
    }

    TEST_CASE("Disconnect removes exactly one edge") {
        GraphRuntime runtime;
        auto a   = constant(runtime, 1.0);
        auto sum = node(runtime, "add");
        Edge edge{.source = PinRef{.node = a, .pin = "value"}, .destination = PinRef{.node = sum, .pin = "a"}};
        REQUIRE(runtime.connect(edge).has_value());

        REQUIRE(runtime.disconnect(edge).has_value());
        CHECK(runtime.edgeCount() == 0);

        auto again = runtime.disconnect(edge);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::EdgeNotFound);
    }

    TEST_CASE("Removing a node drops its edges, scope and handle") {
        GraphRuntime runtime;
        auto a   = constant(runtime, 1.0, "a");
        auto sum = node(runtime, "add", "sum");
        auto out = node(runtime, "multiply", "out");
        REQUIRE(runtime.connect(a, "value", sum, "a").has_value());
        REQUIRE(runtime.connect(sum, "result", out, "a").has_value());

        auto scope = *runtime.nodeScope(sum);
        auto const scopesBefore = runtime.registry().scopeCount();

        REQUIRE(runtime.removeNode(sum).has_value());
        CHECK(runtime.nodeCount() == 2);
        CHECK(runtime.edgeCount() == 0);
        CHECK_FALSE(runtime.contains(sum));
        CHECK_FALSE(runtime.registry().contains(scope));
        CHECK(runtime.registry().scopeCount() == scopesBefore - 1);
        CHECK(runtime.topologicalOrder().size() == 2);

        auto stale = runtime.nodeKind(sum);
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().code == Error::Code::NodeNotFound);

        // The freed slot is reused under a new generation.
        auto replacement = node(runtime, "subtract");
        CHECK(replacement.index == sum.index);
        CHECK(replacement.generation != sum.generation);
        CHECK_FALSE(runtime.contains(sum));

        CHECK(runtime.removeNode(sum).error().code == Error::Code::NodeNotFound);
    }

    TEST_CASE("Input bindings") {
        GraphRuntime runtime;
        auto sum = node(runtime, "add");

        REQUIRE(runtime.setInputBinding(sum, "a", InputBinding::literal(Value{2.0})).has_value());
        auto binding = runtime.inputBinding(sum, "a");
        REQUIRE(binding.has_value());
        REQUIRE(binding->has_value());
        CHECK((*binding)->type() == InputBinding::Type::Literal);

        auto unknown = runtime.setInputBinding(sum, "z", InputBinding::literal(Value{2.0}));
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::DanglingEdge);

        auto incompatible = runtime.setInputBinding(sum, "b", InputBinding::literal(Value{"two"}));
        REQUIRE_FALSE(incompatible.has_value());
        CHECK(incompatible.error().code == Error::Code::IncompatiblePins);

        REQUIRE(runtime.clearInputBinding(sum, "a").has_value());
        CHECK_FALSE(runtime.inputBinding(sum, "a")->has_value());
        CHECK(runtime.clearInputBinding(sum, "a").has_value());
    }

    TEST_CASE("Nodes added by name report the kind they were registered under") {
        auto catalog = NodeCatalog::withBuiltins();
        REQUIRE(catalog
                    .registerKind("sum",
                                  [] { return std::make_unique<ArithmeticNode>(ArithmeticNode::Operation::Add); })
                    .has_value());
        GraphRuntime runtime{std::move(catalog)};

        auto aliased = node(runtime, "sum");
        CHECK(*runtime.nodeKind(aliased) == "sum");
        CHECK((*runtime.nodeSignature(aliased))->kind == "sum");
        CHECK(*runtime.registry().name(*runtime.nodeScope(aliased)) == "sum");
        CHECK(*runtime.nodeKind(node(runtime, "add")) == "add");

        auto direct = constant(runtime, 1.0);
        CHECK(*runtime.nodeKind(direct) == "constant");
    }

    TEST_CASE("Validation lists orphaned nodes") {
        GraphRuntime runtime;
        auto a      = constant(runtime, 1.0, "a");
        auto sum    = node(runtime, "add", "sum");
        auto lonely = node(runtime, "multiply", "lonely");
        auto spare  = node(runtime, "timer");

        auto before = runtime.validate();
        CHECK(before.orphanedNodes.size() == 4);

        REQUIRE(runtime.connect(a, "value", sum, "a").has_value());
        auto after = runtime.validate();
        CHECK_FALSE(after.clean());
        CHECK(after.orphanedNodes == std::vector<NodeId>{lonely, spare});
        REQUIRE(after.warnings.size() == 2);
        CHECK(after.warnings.front() == "Orphaned node: " + toString(lonely) + " (lonely)");
        CHECK(after.warnings.back() == "Orphaned node: " + toString(spare) + " (timer)");

        REQUIRE(runtime.removeNode(lonely).has_value());
        REQUIRE(runtime.removeNode(spare).has_value());
        CHECK(runtime.validate().clean());

        REQUIRE(runtime.removeNode(a).has_value());
        CHECK(runtime.validate().orphanedNodes == std::vector<NodeId>{sum});
        CHECK(runtime.incomingEdges(sum).empty());
    }
}
