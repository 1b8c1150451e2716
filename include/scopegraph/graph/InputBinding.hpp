#pragma once
#include <scopegraph/logic/EvaluationContext.hpp>
#include <scopegraph/path/DotPath.hpp>
#include <scopegraph/type/Value.hpp>

#include <optional>
#include <variant>

namespace SG {

/**
 * Source for an input pin that has no incoming edge.
 *
 * A Literal passes a fixed value. A RegistryPath is resolved on every
 * evaluation through the node's evaluation context, so it sees the node's own
 * scope first and then its ancestors. An incoming edge on the same pin always
 * wins over the binding.
 */
class InputBinding {
public:
    enum class Type {
        Literal,
        RegistryPath
    };

    static auto literal(Value value) -> InputBinding;
    static auto registryPath(DotPath path) -> InputBinding;

    auto type() const -> Type;
    auto literalValue() const -> Value const*;
    auto path() const -> DotPath const*;

    // The value the binding currently yields; empty when a bound path is absent.
    auto resolve(EvaluationContext const& context) const -> std::optional<Value>;

    auto operator==(InputBinding const&) const -> bool = default;

private:
    explicit InputBinding(std::variant<Value, DotPath> source) : source_(std::move(source)) {}

    std::variant<Value, DotPath> source_;
};

} // namespace SG
