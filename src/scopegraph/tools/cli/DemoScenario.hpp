#pragma once

#include "DemoCli.hpp"

#include <scopegraph/core/Error.hpp>
#include <scopegraph/graph/GraphRuntime.hpp>

#include <iosfwd>

namespace SG::Tools {

// Nodes of the sample graph built by the demo tool.
struct DemoGraph {
    NodeId width;
    NodeId height;
    NodeId zero;
    NodeId sum;
    NodeId ratio;  // Divides by zero on purpose, so the first tick reports a failure.
    NodeId volume; // Slider driven by --slider.
    NodeId scaled;
    NodeId pulse;  // Looping timer.
};

auto build_demo_graph(GraphRuntime& runtime) -> Expected<DemoGraph>;

// Runs the demo and writes its report to `out`. Returns a process exit code.
auto run_demo(DemoSettings const& settings, std::ostream& out, std::ostream& err) -> int;

} // namespace SG::Tools
