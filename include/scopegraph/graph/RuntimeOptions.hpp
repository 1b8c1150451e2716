#pragma once
#include <scopegraph/core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace SG {

struct RuntimeOptions {
    std::string outputs_prefix      = "outputs";      // Committed outputs land at <prefix>.<pin> in the node scope.
    std::string time_path           = "system.time";  // Published in the graph root scope every tick.
    std::string delta_path          = "system.delta";
    std::size_t max_events_per_tick = 0;              // 0 applies every queued event.
    std::size_t error_log_capacity  = 256;
    bool        publish_outputs     = true;
    bool        trace_ticks         = false;
};

// Reads options from a JSON object. Absent keys keep their defaults.
[[nodiscard]] auto loadRuntimeOptions(std::string_view json) -> Expected<RuntimeOptions>;

// Resets every path field that does not parse as a DotPath to its default and
// returns one InvalidPath error per field reset.
auto resetInvalidPaths(RuntimeOptions& options) -> std::vector<Error>;

// Overlays environment flags (SCOPEGRAPH_TRACE_TICKS) onto `options`.
auto applyEnvironmentFlags(RuntimeOptions& options) -> void;

// True when the variable is set to anything other than 0/false/off/no.
[[nodiscard]] auto envFlagEnabled(char const* name) -> bool;

} // namespace SG
