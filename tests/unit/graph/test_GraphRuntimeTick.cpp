#include <scopegraph/graph/GraphRuntime.hpp>
#include <scopegraph/logic/BuiltinNodes.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <stdexcept>

using namespace SG;

namespace {

auto path(std::string_view text) -> DotPath {
    auto parsed = DotPath::parse(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

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

auto number(GraphRuntime const& runtime, NodeId id, std::string_view pin) -> double {
    auto value = runtime.nodeOutput(id, pin);
    REQUIRE(value.has_value());
    auto result = value->asNumber();
    REQUIRE(result.has_value());
    return *result;
}

class ThrowingNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "throwing"; }
    auto inputs() const -> std::vector<PinSpec> override { return {}; }
    auto outputs() const -> std::vector<PinSpec> override { return {PinSpec::output("out", ValueKind::Number)}; }
    auto evaluate(InputMap const&, EvaluationContext&) const -> Expected<OutputMap> override {
        throw std::runtime_error("kaboom");
    }
};

} // namespace

TEST_SUITE("graph.tick") {
    TEST_CASE("A first tick evaluates everything, a second one reuses the cache") {
        GraphRuntime runtime;
        auto a   = constant(runtime, 2.0);
        auto b   = constant(runtime, 3.0);
        auto sum = node(runtime, "add");
        REQUIRE(runtime.connect(a, "value", sum, "a").has_value());
        REQUIRE(runtime.connect(b, "value", sum, "b").has_value());

        auto first = runtime.tick(1.0 / 60.0);
        CHECK(first.ok());
        CHECK(first.tick == 1);
        CHECK(first.evaluatedNodes.size() == 3);
        CHECK(first.skippedNodes == 0);
        CHECK(number(runtime, sum, "result") == doctest::Approx(5.0));
        CHECK(*runtime.nodeVersion(sum) == 1);
        CHECK_FALSE(*runtime.isDirty(sum));

        auto second = runtime.tick(1.0 / 60.0);
        CHECK(second.tick == 2);
        CHECK(second.evaluatedNodes.empty());
        CHECK(second.skippedNodes == 3);
        CHECK(*runtime.nodeVersion(sum) == 1);
    }

    TEST_CASE("Changes propagate only downstream") {
        GraphRuntime runtime;
        auto a = constant(runtime, 1.0, "a");
        auto b = node(runtime, "add", "b");
        auto c = node(runtime, "add", "c");
        auto d = constant(runtime, 7.0, "d");
        REQUIRE(runtime.connect(a, "value", b, "a").has_value());
        REQUIRE(runtime.connect(b, "result", c, "a").has_value());
        REQUIRE(runtime.setInputBinding(b, "b", InputBinding::literal(Value{1.0})).has_value());
        REQUIRE(runtime.setInputBinding(c, "b", InputBinding::literal(Value{10.0})).has_value());

        REQUIRE(runtime.tick(0.0).ok());
        CHECK(number(runtime, c, "result") == doctest::Approx(12.0));

        auto aScope = *runtime.nodeScope(a);
        auto report = runtime.tick(0.0, {Events::SetValue{.scope = aScope, .path = path("value"), .value = Value{5.0}}});
        CHECK(report.appliedEvents == 1);
        CHECK(report.evaluatedNodes == std::vector<NodeId>{a, b, c});
        CHECK_FALSE(report.evaluated(d));
        CHECK(report.skippedNodes == 1);
        CHECK(number(runtime, c, "result") == doctest::Approx(16.0));
        CHECK(*runtime.nodeVersion(d) == 1);
    }

    TEST_CASE("An unchanged output does not dirty its consumers") {
        GraphRuntime runtime;
        auto a   = constant(runtime, 2.0);
        auto sum = node(runtime, "add");
        REQUIRE(runtime.connect(a, "value", sum, "a").has_value());
        REQUIRE(runtime.setInputBinding(sum, "b", InputBinding::literal(Value{0.0})).has_value());
        REQUIRE(runtime.tick(0.0).ok());

        REQUIRE(runtime.markDirty(a).has_value());
        CHECK(*runtime.isDirty(sum));
        auto report = runtime.tick(0.0);
        CHECK(report.evaluated(a));
        CHECK(report.evaluated(sum));
        CHECK(*runtime.nodeVersion(a) == 1);

        auto aScope = *runtime.nodeScope(a);
        report = runtime.tick(0.0, {Events::SetValue{.scope = aScope, .path = path("value"), .value = Value{2.0}}});
        CHECK(report.evaluated(a));
        CHECK_FALSE(report.evaluated(sum));
        CHECK(*runtime.nodeVersion(a) == 1);
    }

    TEST_CASE("A failing node does not stop the tick") {
        GraphRuntime runtime;
        auto six   = constant(runtime, 6.0, "six");
        auto zero  = constant(runtime, 0.0, "zero");
        auto ratio = node(runtime, "divide", "ratio");
        auto after = node(runtime, "add", "after");
        auto other = node(runtime, "multiply", "other");
        REQUIRE(runtime.connect(six, "value", ratio, "a").has_value());
        REQUIRE(runtime.connect(zero, "value", ratio, "b").has_value());
        REQUIRE(runtime.connect(ratio, "result", after, "a").has_value());
        REQUIRE(runtime.setInputBinding(after, "b", InputBinding::literal(Value{1.0})).has_value());
        REQUIRE(runtime.connect(six, "value", other, "a").has_value());
        REQUIRE(runtime.connect(six, "value", other, "b").has_value());

        auto report = runtime.tick(0.0);
        CHECK_FALSE(report.ok());
        REQUIRE(report.nodeErrors.size() == 2);
        REQUIRE(report.errorFor(ratio) != nullptr);
        CHECK(report.errorFor(ratio)->code == Error::Code::Custom);
        REQUIRE(report.errorFor(after) != nullptr);
        CHECK(report.errorFor(after)->code == Error::Code::MissingInput);
        CHECK(report.errorFor(other) == nullptr);
        CHECK(number(runtime, other, "result") == doctest::Approx(36.0));

        // A node that never succeeded exposes empty sentinels.
        auto sentinel = runtime.nodeOutput(ratio, "result");
        REQUIRE(sentinel.has_value());
        CHECK(sentinel->isEmpty());
        auto error = runtime.nodeError(ratio);
        REQUIRE(error.has_value());
        REQUIRE(error->has_value());
        CHECK((*error)->code == Error::Code::Custom);

        CHECK(runtime.errorLog().size() == 2);
        CHECK(runtime.errorLog().all().front().node == ratio);
        CHECK(runtime.errorLog().all().front().source == "divide");

        auto zeroScope = *runtime.nodeScope(zero);
        report = runtime.tick(0.0, {Events::SetValue{.scope = zeroScope, .path = path("value"), .value = Value{3.0}}});
        CHECK(report.ok());
        CHECK(number(runtime, ratio, "result") == doctest::Approx(2.0));
        CHECK(number(runtime, after, "result") == doctest::Approx(3.0));
        CHECK_FALSE(runtime.nodeError(ratio)->has_value());
        CHECK_FALSE(report.evaluated(other));
    }

    TEST_CASE("A failing node keeps its last good outputs") {
        GraphRuntime runtime;
        auto one   = constant(runtime, 1.0, "one");
        auto denom = constant(runtime, 2.0, "denom");
        auto ratio = node(runtime, "divide");
        REQUIRE(runtime.connect(one, "value", ratio, "a").has_value());
        REQUIRE(runtime.connect(denom, "value", ratio, "b").has_value());
        REQUIRE(runtime.tick(0.0).ok());
        CHECK(number(runtime, ratio, "result") == doctest::Approx(0.5));

        auto scope  = *runtime.nodeScope(denom);
        auto report = runtime.tick(0.0, {Events::SetValue{.scope = scope, .path = path("value"), .value = Value{0.0}}});
        CHECK(report.errorFor(ratio) != nullptr);
        CHECK(number(runtime, ratio, "result") == doctest::Approx(0.5));
        CHECK(*runtime.nodeVersion(ratio) == 1);
    }

    TEST_CASE("Exceptions thrown by a node become errors") {
        GraphRuntime runtime;
        auto thrower = runtime.addNode(std::make_unique<ThrowingNode>());
        REQUIRE(thrower.has_value());
        auto sane = constant(runtime, 4.0);

        auto report = runtime.tick(0.0);
        REQUIRE(report.errorFor(*thrower) != nullptr);
        CHECK(report.errorFor(*thrower)->code == Error::Code::Custom);
        CHECK(report.errorFor(*thrower)->message == "kaboom");
        CHECK(number(runtime, sane, "value") == doctest::Approx(4.0));
    }

    TEST_CASE("The clock is published in the root scope") {
        GraphRuntime runtime;
        runtime.tick(0.5);
        auto report = runtime.tick(0.25);
        CHECK(report.time == doctest::Approx(0.75));
        CHECK(report.delta == doctest::Approx(0.25));
        CHECK(*runtime.registry().get(runtime.rootScope(), "system.time") == Value{0.75});
        CHECK(*runtime.registry().get(runtime.rootScope(), "system.delta") == Value{0.25});
        CHECK(runtime.clock().tick == 2);
    }

    TEST_CASE("Timers advance only when time advances") {
        GraphRuntime runtime;
        auto timer = node(runtime, "timer");
        REQUIRE(runtime.setInputBinding(timer, "duration", InputBinding::literal(Value{2.0})).has_value());

        runtime.tick(0.5);
        CHECK(number(runtime, timer, "elapsed") == doctest::Approx(0.0));
        runtime.tick(0.5);
        CHECK(number(runtime, timer, "elapsed") == doctest::Approx(0.5));
        CHECK(number(runtime, timer, "progress") == doctest::Approx(0.25));

        auto still = runtime.tick(0.0);
        CHECK_FALSE(still.evaluated(timer));
        runtime.tick(2.0);
        CHECK(runtime.nodeOutput(timer, "finished").value() == Value{true});
    }

    TEST_CASE("Slider values arrive through events and are published") {
        GraphRuntime runtime;
        auto slider = node(runtime, "slider", "volume");
        auto scaled = node(runtime, "multiply", "scaled");
        REQUIRE(runtime.setInputBinding(slider, "max", InputBinding::literal(Value{10.0})).has_value());
        REQUIRE(runtime.connect(slider, "value", scaled, "a").has_value());
        REQUIRE(runtime.setInputBinding(scaled, "b", InputBinding::literal(Value{2.0})).has_value());

        REQUIRE(runtime.tick(0.0).ok());
        CHECK(number(runtime, scaled, "result") == doctest::Approx(0.0));

        auto scope = *runtime.nodeScope(slider);
        runtime.enqueue(Events::SetValue{.scope = scope, .path = path("value"), .value = Value{4.0}});
        CHECK(runtime.pendingEvents() == 1);
        auto report = runtime.tick(0.0);
        CHECK(report.appliedEvents == 1);
        CHECK(runtime.pendingEvents() == 0);
        CHECK(number(runtime, scaled, "result") == doctest::Approx(8.0));
        CHECK(*runtime.registry().getLocal(scope, path("outputs.value")) == Value{4.0});
    }

    TEST_CASE("Registry path bindings see ancestor values") {
        GraphRuntime runtime;
        auto sum = node(runtime, "add");
        REQUIRE(runtime.setInputBinding(sum, "a", InputBinding::registryPath(path("settings.gain"))).has_value());
        REQUIRE(runtime.setInputBinding(sum, "b", InputBinding::literal(Value{1.0})).has_value());

        auto report = runtime.tick(0.0);
        REQUIRE(report.errorFor(sum) != nullptr);
        CHECK(report.errorFor(sum)->code == Error::Code::MissingInput);

        report = runtime.tick(
            0.0, {Events::SetValue{.scope = runtime.rootScope(), .path = path("settings.gain"), .value = Value{3.0}}});
        CHECK(report.ok());
        CHECK(number(runtime, sum, "result") == doctest::Approx(4.0));
    }

    TEST_CASE("Graph edits can arrive as events") {
        GraphRuntime runtime;
        auto a = constant(runtime, 1.0);

        auto report = runtime.tick(0.0, {Events::AddNode{.kind = "add", .label = "sum"}, Events::AddNode{.kind = "teleport", .label = ""}});
        CHECK(report.appliedEvents == 1);
        REQUIRE(report.createdNodes.size() == 1);
        REQUIRE(report.eventErrors.size() == 1);
        CHECK(report.eventErrors.front().index == 1);
        CHECK(report.eventErrors.front().event == "add_node");
        CHECK(report.eventErrors.front().error.code == Error::Code::UnknownNodeKind);
        CHECK_FALSE(runtime.errorLog().all().back().node.isValid());
        CHECK(runtime.errorLog().all().back().source == "add_node");

        auto sum  = report.createdNodes.front();
        Edge edge{.source = PinRef{.node = a, .pin = "value"}, .destination = PinRef{.node = sum, .pin = "a"}};
        report = runtime.tick(0.0,
                              {Events::Connect{.edge = edge},
                               Events::SetBinding{.node = sum, .pin = "b", .binding = InputBinding::literal(Value{2.0})}});
        CHECK(report.ok());
        CHECK(number(runtime, sum, "result") == doctest::Approx(3.0));

        report = runtime.tick(0.0, {Events::Disconnect{.edge = edge}, Events::RemoveNode{.node = a}});
        CHECK(report.appliedEvents == 2);
        CHECK(runtime.nodeCount() == 1);
        CHECK(report.errorFor(sum) != nullptr);
    }

    TEST_CASE("Event throughput can be limited per tick") {
        RuntimeOptions options;
        options.max_events_per_tick = 1;
        GraphRuntime runtime{options};
        auto root = runtime.rootScope();

        runtime.enqueue(Events::SetValue{.scope = root, .path = path("x"), .value = Value{1.0}});
        runtime.enqueue(Events::SetValue{.scope = root, .path = path("y"), .value = Value{2.0}});

        auto first = runtime.tick(0.0);
        CHECK(first.appliedEvents == 1);
        CHECK(first.deferredEvents == 1);
        CHECK(runtime.registry().get(root, "x").has_value());
        CHECK_FALSE(runtime.registry().get(root, "y").has_value());

        auto second = runtime.tick(0.0);
        CHECK(second.appliedEvents == 1);
        CHECK(second.deferredEvents == 0);
        CHECK(*runtime.registry().get(root, "y") == Value{2.0});
    }

    TEST_CASE("Output publishing can be switched off") {
        RuntimeOptions options;
        options.publish_outputs = false;
        GraphRuntime runtime{options};
        auto a = constant(runtime, 1.0);
        REQUIRE(runtime.tick(0.0).ok());
        CHECK_FALSE(runtime.registry().getLocal(*runtime.nodeScope(a), path("outputs.value")).has_value());
        CHECK(number(runtime, a, "value") == doctest::Approx(1.0));
    }

    TEST_CASE("Inputs bound to the clock follow it across ticks") {
        GraphRuntime runtime;
        auto sum = node(runtime, "add", "sum");
        REQUIRE(runtime.setInputBinding(sum, "a", InputBinding::registryPath(path("system.time"))).has_value());
        REQUIRE(runtime.setInputBinding(sum, "b", InputBinding::literal(Value{0.0})).has_value());

        for (int step = 1; step <= 4; ++step) {
            auto report = runtime.tick(1.0);
            CHECK(report.ok());
            CHECK(report.evaluated(sum));
            CHECK(number(runtime, sum, "result") == doctest::Approx(static_cast<double>(step)));
        }

        auto paused = runtime.tick(0.0);
        CHECK_FALSE(paused.evaluated(sum));
        CHECK(number(runtime, sum, "result") == doctest::Approx(4.0));
    }

    TEST_CASE("Inputs bound to the delta only re-run when the delta changes") {
        GraphRuntime runtime;
        auto scaled = node(runtime, "multiply", "scaled");
        REQUIRE(runtime.setInputBinding(scaled, "a", InputBinding::registryPath(path("system.delta"))).has_value());
        REQUIRE(runtime.setInputBinding(scaled, "b", InputBinding::literal(Value{10.0})).has_value());

        CHECK(runtime.tick(0.5).evaluated(scaled));
        CHECK_FALSE(runtime.tick(0.5).evaluated(scaled));
        CHECK(runtime.tick(0.25).evaluated(scaled));
        CHECK(number(runtime, scaled, "result") == doctest::Approx(2.5));
    }

    TEST_CASE("A long chain re-evaluates once per change") {
        constexpr std::size_t kLength = 1000;
        GraphRuntime runtime;
        auto slider = node(runtime, "slider", "slider");
        auto last   = slider;
        std::string pin = "value";
        for (std::size_t index = 0; index < kLength; ++index) {
            auto step = node(runtime, "add");
            REQUIRE(runtime.connect(last, pin, step, "a").has_value());
            REQUIRE(runtime.setInputBinding(step, "b", InputBinding::literal(Value{1.0})).has_value());
            last = step;
            pin  = "result";
        }
        CHECK(runtime.topologicalOrder().front() == slider);
        CHECK(runtime.topologicalOrder().back() == last);

        auto first = runtime.tick(0.0);
        CHECK(first.ok());
        CHECK(first.evaluatedNodes.size() == kLength + 1);
        CHECK(number(runtime, last, "result") == doctest::Approx(1000.0));

        CHECK(runtime.tick(0.0).evaluatedNodes.empty());

        auto sliderScope = *runtime.nodeScope(slider);
        auto moved = runtime.tick(0.0, {Events::SetValue{.scope = sliderScope, .path = path("value"), .value = Value{0.5}}});
        CHECK(moved.evaluatedNodes.size() == kLength + 1);
        CHECK(number(runtime, last, "result") == doctest::Approx(1000.5));
        CHECK(*runtime.nodeVersion(last) == 2);
    }

    TEST_CASE("Invalid option paths fall back to their defaults") {
        RuntimeOptions options;
        options.outputs_prefix = "";
        options.time_path      = "system..time";
        GraphRuntime runtime{options};
        CHECK(runtime.options().outputs_prefix == "outputs");
        CHECK(runtime.options().time_path == "system.time");
        CHECK(runtime.options().delta_path == "system.delta");
        REQUIRE(runtime.errorLog().size() == 2);
        CHECK(runtime.errorLog().all().front().source == "options");
        CHECK(runtime.errorLog().all().front().error.code == Error::Code::InvalidPath);

        auto two    = constant(runtime, 2.0, "two");
        auto report = runtime.tick(1.0);
        CHECK(report.ok());
        CHECK(report.nodeErrors.empty());
        CHECK(*runtime.registry().getLocal(*runtime.nodeScope(two), path("outputs.value")) == Value{2.0});
        CHECK(*runtime.registry().get(runtime.rootScope(), "system.time") == Value{1.0});
    }
}
