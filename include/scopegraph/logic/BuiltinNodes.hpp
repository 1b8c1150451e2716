#pragma once
#include <scopegraph/logic/NodeKind.hpp>
#include <scopegraph/type/Value.hpp>

#include <string_view>
#include <vector>

namespace SG {

// Emits `value`. A "value" entry in the node's own scope overrides the value
// given at construction, which lets the UI edit constants through the registry.
class ConstantNode final : public NodeKind {
public:
    explicit ConstantNode(Value value = Value{0.0}) : value_(std::move(value)) {}

    auto kind() const -> std::string_view override { return "constant"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;

private:
    Value value_;
};

// a <op> b -> result. Division by zero is reported as an evaluation error.
class ArithmeticNode final : public NodeKind {
public:
    enum class Operation {
        Add,
        Subtract,
        Multiply,
        Divide
    };

    explicit ArithmeticNode(Operation op) : op_(op) {}

    auto kind() const -> std::string_view override;
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;

    auto operation() const -> Operation { return op_; }

private:
    Operation op_;
};

class CompareNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "compare"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

class BranchNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "branch"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

class ClampNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "clamp"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

class ConcatNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "concat"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

/**
 * Counts simulated time from the first tick it runs on.
 *
 * The start time is kept in the node's own scope under "state.start"; removing
 * it restarts the timer. With `loop` set the elapsed time wraps at `duration`.
 */
class TimerNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "timer"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
    auto timeDependent() const -> bool override { return true; }
};

// UI-bound: the slider widget writes "value" into the node's scope.
class SliderNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "slider"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

// UI-bound: the button widget writes "clicked" into the node's scope.
class ButtonNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "button"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

} // namespace SG
