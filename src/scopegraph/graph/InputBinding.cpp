#include <scopegraph/graph/InputBinding.hpp>

namespace SG {

auto InputBinding::literal(Value value) -> InputBinding {
    return InputBinding{std::variant<Value, DotPath>{std::in_place_index<0>, std::move(value)}};
}

auto InputBinding::registryPath(DotPath path) -> InputBinding {
    return InputBinding{std::variant<Value, DotPath>{std::in_place_index<1>, std::move(path)}};
}

auto InputBinding::type() const -> Type {
    return source_.index() == 0 ? Type::Literal : Type::RegistryPath;
}

auto InputBinding::literalValue() const -> Value const* {
    return std::get_if<Value>(&source_);
}

auto InputBinding::path() const -> DotPath const* {
    return std::get_if<DotPath>(&source_);
}

auto InputBinding::resolve(EvaluationContext const& context) const -> std::optional<Value> {
    if (auto const* value = literalValue()) {
        return *value;
    }
    auto resolved = context.read(*path());
    if (!resolved) {
        return std::nullopt;
    }
    return std::move(*resolved);
}

} // namespace SG
