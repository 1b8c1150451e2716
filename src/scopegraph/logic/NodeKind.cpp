#include <scopegraph/logic/NodeKind.hpp>

namespace SG {

namespace {

auto find_pin(std::vector<PinSpec> const& pins, std::string_view name) -> PinSpec const* {
    for (auto const& pin : pins) {
        if (pin.name == name) {
            return &pin;
        }
    }
    return nullptr;
}

} // namespace

auto NodeSignature::findInput(std::string_view name) const -> PinSpec const* {
    return find_pin(inputs, name);
}

auto NodeSignature::findOutput(std::string_view name) const -> PinSpec const* {
    return find_pin(outputs, name);
}

auto NodeKind::signature() const -> NodeSignature {
    return NodeSignature{.kind = std::string{kind()}, .inputs = inputs(), .outputs = outputs()};
}

} // namespace SG
