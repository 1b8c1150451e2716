#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace SG {

// Handle to a node in a GraphRuntime: arena index plus slot generation, so a
// handle to a removed node never resolves to whichever node reuses the slot.
struct NodeId {
    static constexpr std::uint32_t kInvalidIndex = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index      = kInvalidIndex;
    std::uint32_t generation = 0;

    auto isValid() const -> bool { return index != kInvalidIndex; }
    auto operator==(NodeId const&) const -> bool = default;
};

[[nodiscard]] auto toString(NodeId id) -> std::string;

struct PinRef {
    NodeId      node;
    std::string pin;

    auto operator==(PinRef const&) const -> bool = default;
};

// (source output pin) -> (destination input pin). An input pin takes at most
// one edge; an output pin may feed any number.
struct Edge {
    PinRef source;
    PinRef destination;

    auto operator==(Edge const&) const -> bool = default;
};

[[nodiscard]] auto toString(Edge const& edge) -> std::string;

} // namespace SG

template <>
struct std::hash<SG::NodeId> {
    auto operator()(SG::NodeId const& id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(id.generation) << 32) | id.index);
    }
};
