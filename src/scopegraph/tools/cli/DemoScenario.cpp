#include "DemoScenario.hpp"

#include <scopegraph/graph/RuntimeOptions.hpp>
#include <scopegraph/logic/BuiltinNodes.hpp>
#include <scopegraph/registry/RegistryJsonExporter.hpp>

#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace SG::Tools {

namespace {

auto load_options(DemoSettings const& settings) -> Expected<RuntimeOptions> {
    RuntimeOptions options;
    if (settings.config_path) {
        std::ifstream file(*settings.config_path);
        if (!file) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Cannot open config file " + *settings.config_path});
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        auto loaded = loadRuntimeOptions(buffer.str());
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        options = std::move(*loaded);
    }
    applyEnvironmentFlags(options);
    return options;
}

void print_output(std::ostream& out, GraphRuntime const& runtime, std::string_view name, NodeId node, std::string_view pin) {
    out << "  " << name << "." << pin << " = ";
    if (auto value = runtime.nodeOutput(node, pin)) {
        out << value->toDisplayString();
    } else {
        out << "<" << describeError(value.error()) << ">";
    }
    out << '\n';
}

} // namespace

auto build_demo_graph(GraphRuntime& runtime) -> Expected<DemoGraph> {
    DemoGraph graph;

    auto constant = [&](Value value, std::string label) -> Expected<NodeId> {
        return runtime.addNode(std::make_unique<ConstantNode>(std::move(value)), std::move(label));
    };
    auto assign = [](Expected<NodeId> created, NodeId& target) -> Expected<void> {
        if (!created) {
            return std::unexpected(created.error());
        }
        target = *created;
        return {};
    };

    for (auto step : {assign(constant(6.0, "width"), graph.width),
                      assign(constant(3.0, "height"), graph.height),
                      assign(constant(0.0, "zero"), graph.zero),
                      assign(runtime.addNode("add", "sum"), graph.sum),
                      assign(runtime.addNode("divide", "ratio"), graph.ratio),
                      assign(runtime.addNode("slider", "volume"), graph.volume),
                      assign(runtime.addNode("multiply", "scaled"), graph.scaled),
                      assign(runtime.addNode("timer", "pulse"), graph.pulse)}) {
        if (!step) {
            return std::unexpected(step.error());
        }
    }

    for (auto connected : {runtime.connect(graph.width, "value", graph.sum, "a"),
                           runtime.connect(graph.height, "value", graph.sum, "b"),
                           runtime.connect(graph.sum, "result", graph.ratio, "a"),
                           runtime.connect(graph.zero, "value", graph.ratio, "b"),
                           runtime.connect(graph.volume, "value", graph.scaled, "a"),
                           runtime.connect(graph.sum, "result", graph.scaled, "b"),
                           runtime.setInputBinding(graph.volume, "max", InputBinding::literal(10.0)),
                           runtime.setInputBinding(graph.pulse, "duration", InputBinding::literal(2.0)),
                           runtime.setInputBinding(graph.pulse, "loop", InputBinding::literal(true))}) {
        if (!connected) {
            return std::unexpected(connected.error());
        }
    }
    return graph;
}

auto run_demo(DemoSettings const& settings, std::ostream& out, std::ostream& err) -> int {
    auto options = load_options(settings);
    if (!options) {
        err << "scopegraph_demo: " << describeError(options.error()) << '\n';
        return 1;
    }

    GraphRuntime runtime{std::move(*options)};
    auto graph = build_demo_graph(runtime);
    if (!graph) {
        err << "scopegraph_demo: " << describeError(graph.error()) << '\n';
        return 1;
    }

    auto sliderScope = runtime.nodeScope(graph->volume);
    auto sliderPath  = DotPath::parse("value");
    if (!sliderScope || !sliderPath) {
        err << "scopegraph_demo: slider scope unavailable\n";
        return 1;
    }

    out << std::fixed << std::setprecision(3);
    for (int index = 1; index <= settings.ticks; ++index) {
        std::vector<InteractionEvent> events;
        if (index == 2 && settings.slider) {
            events.emplace_back(Events::SetValue{.scope = *sliderScope, .path = *sliderPath, .value = *settings.slider});
        }
        auto report = runtime.tick(settings.dt, std::move(events));
        out << "tick " << report.tick << " t=" << report.time << " evaluated=" << report.evaluatedNodes.size()
            << " skipped=" << report.skippedNodes << " errors=" << report.nodeErrors.size() << '\n';
        for (auto const& failure : report.nodeErrors) {
            out << "  " << failure.kind << " " << toString(failure.node) << ": " << describeError(failure.error) << '\n';
        }
        for (auto const& failure : report.eventErrors) {
            out << "  event " << failure.event << ": " << describeError(failure.error) << '\n';
        }
    }

    out << "outputs:\n";
    print_output(out, runtime, "sum", graph->sum, "result");
    print_output(out, runtime, "ratio", graph->ratio, "result");
    print_output(out, runtime, "volume", graph->volume, "value");
    print_output(out, runtime, "scaled", graph->scaled, "result");
    print_output(out, runtime, "pulse", graph->pulse, "progress");
    out << "error log: " << runtime.errorLog().size() << " record(s)\n";

    if (settings.print_json) {
        auto json = RegistryJsonExporter::Export(runtime.registry());
        if (!json) {
            err << "scopegraph_demo: " << describeError(json.error()) << '\n';
            return 1;
        }
        out << *json << '\n';
    }
    return 0;
}

} // namespace SG::Tools
