#include <scopegraph/logic/BuiltinNodes.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace SG {

namespace {

// Reads a node-local registry entry, treating PathNotFound as "not set".
auto read_local_optional(EvaluationContext& context, std::string_view path) -> Expected<std::optional<Value>> {
    auto value = context.readLocal(path);
    if (value) {
        return std::optional<Value>{std::move(*value)};
    }
    if (value.error().code == Error::Code::PathNotFound) {
        return std::optional<Value>{};
    }
    return std::unexpected(value.error());
}

auto custom_error(std::string message) -> Error {
    return Error{Error::Code::Custom, std::move(message)};
}

} // namespace

auto ConstantNode::inputs() const -> std::vector<PinSpec> {
    return {};
}

auto ConstantNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("value", std::nullopt)};
}

auto ConstantNode::evaluate(InputMap const&, EvaluationContext& context) const -> Expected<OutputMap> {
    auto overridden = read_local_optional(context, "value");
    if (!overridden) {
        return std::unexpected(overridden.error());
    }
    OutputMap outputs;
    outputs.emplace("value", overridden->value_or(value_));
    return outputs;
}

auto ArithmeticNode::kind() const -> std::string_view {
    switch (op_) {
    case Operation::Add:
        return "add";
    case Operation::Subtract:
        return "subtract";
    case Operation::Multiply:
        return "multiply";
    case Operation::Divide:
        return "divide";
    }
    return "add";
}

auto ArithmeticNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("a", ValueKind::Number), PinSpec::input("b", ValueKind::Number)};
}

auto ArithmeticNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("result", ValueKind::Number)};
}

auto ArithmeticNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto a = requireNumber(inputs, "a");
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = requireNumber(inputs, "b");
    if (!b) {
        return std::unexpected(b.error());
    }

    double result = 0.0;
    switch (op_) {
    case Operation::Add:
        result = *a + *b;
        break;
    case Operation::Subtract:
        result = *a - *b;
        break;
    case Operation::Multiply:
        result = *a * *b;
        break;
    case Operation::Divide:
        if (*b == 0.0) {
            return std::unexpected(custom_error("Division by zero"));
        }
        result = *a / *b;
        break;
    }

    OutputMap outputs;
    outputs.emplace("result", result);
    return outputs;
}

auto CompareNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("a", ValueKind::Number), PinSpec::input("b", ValueKind::Number)};
}

auto CompareNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("greater", ValueKind::Boolean),
            PinSpec::output("less", ValueKind::Boolean),
            PinSpec::output("equal", ValueKind::Boolean)};
}

auto CompareNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto a = requireNumber(inputs, "a");
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = requireNumber(inputs, "b");
    if (!b) {
        return std::unexpected(b.error());
    }
    OutputMap outputs;
    outputs.emplace("greater", *a > *b);
    outputs.emplace("less", *a < *b);
    outputs.emplace("equal", std::fabs(*a - *b) < std::numeric_limits<double>::epsilon());
    return outputs;
}

auto BranchNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("condition", ValueKind::Boolean),
            PinSpec::optionalInput("true_value", std::nullopt, Value{true}),
            PinSpec::optionalInput("false_value", std::nullopt, Value{false})};
}

auto BranchNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("result", std::nullopt)};
}

auto BranchNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto condition = requireBool(inputs, "condition");
    if (!condition) {
        return std::unexpected(condition.error());
    }
    OutputMap outputs;
    if (*condition) {
        outputs.emplace("result", valueOr(inputs, "true_value", Value{true}));
    } else {
        outputs.emplace("result", valueOr(inputs, "false_value", Value{false}));
    }
    return outputs;
}

auto ClampNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("value", ValueKind::Number),
            PinSpec::optionalInput("min", ValueKind::Number, Value{0.0}),
            PinSpec::optionalInput("max", ValueKind::Number, Value{1.0})};
}

auto ClampNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("result", ValueKind::Number)};
}

auto ClampNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto value = requireNumber(inputs, "value");
    if (!value) {
        return std::unexpected(value.error());
    }
    auto low = numberOr(inputs, "min", 0.0);
    if (!low) {
        return std::unexpected(low.error());
    }
    auto high = numberOr(inputs, "max", 1.0);
    if (!high) {
        return std::unexpected(high.error());
    }
    if (*low > *high) {
        return std::unexpected(custom_error("clamp min is greater than max"));
    }
    OutputMap outputs;
    outputs.emplace("result", std::clamp(*value, *low, *high));
    return outputs;
}

auto ConcatNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("a", ValueKind::Text), PinSpec::input("b", ValueKind::Text)};
}

auto ConcatNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("result", ValueKind::Text)};
}

auto ConcatNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto a = requireText(inputs, "a");
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = requireText(inputs, "b");
    if (!b) {
        return std::unexpected(b.error());
    }
    OutputMap outputs;
    outputs.emplace("result", *a + *b);
    return outputs;
}

auto TimerNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::optionalInput("duration", ValueKind::Number, Value{1.0}),
            PinSpec::optionalInput("loop", ValueKind::Boolean, Value{false})};
}

auto TimerNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("elapsed", ValueKind::Number),
            PinSpec::output("progress", ValueKind::Number),
            PinSpec::output("finished", ValueKind::Boolean)};
}

auto TimerNode::evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> {
    auto duration = numberOr(inputs, "duration", 1.0);
    if (!duration) {
        return std::unexpected(duration.error());
    }
    if (*duration <= 0.0) {
        return std::unexpected(custom_error("timer duration must be positive"));
    }
    auto loop = boolOr(inputs, "loop", false);
    if (!loop) {
        return std::unexpected(loop.error());
    }

    auto stored = read_local_optional(context, "state.start");
    if (!stored) {
        return std::unexpected(stored.error());
    }
    double start = context.time();
    if (*stored) {
        auto number = (*stored)->asNumber();
        if (!number) {
            return std::unexpected(Error{Error::Code::TypeCoercionFailed, "timer start time is not a number"});
        }
        start = *number;
    } else if (auto written = context.write("state.start", Value{start}); !written) {
        return std::unexpected(written.error());
    }

    double elapsed = std::max(0.0, context.time() - start);
    bool   finished = false;
    if (*loop) {
        elapsed = std::fmod(elapsed, *duration);
    } else {
        finished = elapsed >= *duration;
        elapsed  = std::min(elapsed, *duration);
    }

    OutputMap outputs;
    outputs.emplace("elapsed", elapsed);
    outputs.emplace("progress", elapsed / *duration);
    outputs.emplace("finished", finished);
    return outputs;
}

auto SliderNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::optionalInput("min", ValueKind::Number, Value{0.0}),
            PinSpec::optionalInput("max", ValueKind::Number, Value{1.0})};
}

auto SliderNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("value", ValueKind::Number)};
}

auto SliderNode::evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> {
    auto low = numberOr(inputs, "min", 0.0);
    if (!low) {
        return std::unexpected(low.error());
    }
    auto high = numberOr(inputs, "max", 1.0);
    if (!high) {
        return std::unexpected(high.error());
    }
    if (*low > *high) {
        return std::unexpected(custom_error("slider min is greater than max"));
    }

    auto stored = read_local_optional(context, "value");
    if (!stored) {
        return std::unexpected(stored.error());
    }
    double position = *low;
    if (*stored) {
        auto number = (*stored)->asNumber();
        if (!number) {
            return std::unexpected(Error{Error::Code::TypeCoercionFailed,
                                         "slider value holds " + std::string{(*stored)->typeName()}});
        }
        position = *number;
    }

    OutputMap outputs;
    outputs.emplace("value", std::clamp(position, *low, *high));
    return outputs;
}

auto ButtonNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::optionalInput("label", ValueKind::Text, Value{"Button"})};
}

auto ButtonNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("label", ValueKind::Text), PinSpec::output("clicked", ValueKind::Boolean)};
}

auto ButtonNode::evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> {
    auto label = textOr(inputs, "label", "Button");
    if (!label) {
        return std::unexpected(label.error());
    }
    auto stored = read_local_optional(context, "clicked");
    if (!stored) {
        return std::unexpected(stored.error());
    }
    bool clicked = false;
    if (*stored) {
        clicked = (*stored)->asBool().value_or(false);
    }

    OutputMap outputs;
    outputs.emplace("label", *label);
    outputs.emplace("clicked", clicked);
    return outputs;
}

} // namespace SG
