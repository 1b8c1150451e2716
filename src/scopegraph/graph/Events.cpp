#include <scopegraph/graph/Events.hpp>

namespace SG {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

auto eventName(InteractionEvent const& event) -> std::string_view {
    return std::visit(Overloaded{
                          [](Events::SetValue const&) -> std::string_view { return "set_value"; },
                          [](Events::RemoveValue const&) -> std::string_view { return "remove_value"; },
                          [](Events::AddNode const&) -> std::string_view { return "add_node"; },
                          [](Events::RemoveNode const&) -> std::string_view { return "remove_node"; },
                          [](Events::Connect const&) -> std::string_view { return "connect"; },
                          [](Events::Disconnect const&) -> std::string_view { return "disconnect"; },
                          [](Events::SetBinding const&) -> std::string_view { return "set_binding"; },
                          [](Events::ClearBinding const&) -> std::string_view { return "clear_binding"; },
                      },
                      event);
}

} // namespace SG
