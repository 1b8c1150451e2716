#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/logic/EvaluationContext.hpp>
#include <scopegraph/logic/PinMap.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SG {

struct NodeSignature {
    std::string          kind;
    std::vector<PinSpec> inputs;
    std::vector<PinSpec> outputs;

    auto findInput(std::string_view name) const -> PinSpec const*;
    auto findOutput(std::string_view name) const -> PinSpec const*;
};

/**
 * Evaluation capability shared by every node kind.
 *
 * evaluate() must be reproducible for fixed inputs, registry contents and
 * clock. The only side effects allowed are writes through the context, which
 * land in the node's own scope.
 *
 * The kind name is a stable tag the editor uses for icons and colours; it is
 * also the key under which the kind is registered in a NodeCatalog.
 */
class NodeKind {
public:
    virtual ~NodeKind() = default;

    virtual auto kind() const -> std::string_view          = 0;
    virtual auto inputs() const -> std::vector<PinSpec>  = 0;
    virtual auto outputs() const -> std::vector<PinSpec> = 0;
    virtual auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> = 0;

    // Time-dependent kinds are re-evaluated on every tick that advances the clock.
    virtual auto timeDependent() const -> bool { return false; }

    auto signature() const -> NodeSignature;
};

} // namespace SG
