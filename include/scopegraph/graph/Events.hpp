#pragma once
#include <scopegraph/graph/GraphTypes.hpp>
#include <scopegraph/graph/InputBinding.hpp>
#include <scopegraph/path/DotPath.hpp>
#include <scopegraph/registry/ScopeRegistry.hpp>
#include <scopegraph/type/Value.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace SG {

// Interaction events queued by the UI and applied at the start of the next
// tick, before any node is evaluated.
namespace Events {

// UI-originated registry write, e.g. a slider moving.
struct SetValue {
    ScopeId scope;
    DotPath path;
    Value   value;
};

struct RemoveValue {
    ScopeId scope;
    DotPath path;
};

struct AddNode {
    std::string kind;
    std::string label;
};

struct RemoveNode {
    NodeId node;
};

struct Connect {
    Edge edge;
};

struct Disconnect {
    Edge edge;
};

struct SetBinding {
    NodeId       node;
    std::string  pin;
    InputBinding binding;
};

struct ClearBinding {
    NodeId      node;
    std::string pin;
};

} // namespace Events

using InteractionEvent = std::variant<Events::SetValue,
                                      Events::RemoveValue,
                                      Events::AddNode,
                                      Events::RemoveNode,
                                      Events::Connect,
                                      Events::Disconnect,
                                      Events::SetBinding,
                                      Events::ClearBinding>;

[[nodiscard]] auto eventName(InteractionEvent const& event) -> std::string_view;

} // namespace SG
