#pragma once
#include <scopegraph/logic/NodeKind.hpp>

#include <string_view>
#include <vector>

namespace SG {

/**
 * Every arithmetic and unary math function of `a` and `b` at once.
 *
 * Outputs without a defined value for the inputs (divide and modulo by zero,
 * the square root of a negative number) are published empty, so a consumer
 * wired to them reports MissingInput instead of reading a made-up number.
 */
class MathNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "math"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

// Text inspection and transformation. Lengths and `index` count bytes.
class StringNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "string"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

/**
 * Checks a form value against a validation type (text, email, number, url,
 * phone) and length limits.
 *
 * Failed checks are reported through the `errors` list and `is_valid`, not as
 * an evaluation error. Only a misconfigured node (unknown type, bad limits)
 * fails. Text values additionally produce `length` and `is_empty`, numbers
 * produce the sign and integer flags.
 */
class ValidationNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "validation"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

// Evaluates one of a fixed set of formulas over x, y and z, e.g. "x + y",
// "sqrt(x)" or "lerp(x,y,z)". Any other expression must be a plain number.
class CalculatorNode final : public NodeKind {
public:
    auto kind() const -> std::string_view override { return "calculator"; }
    auto inputs() const -> std::vector<PinSpec> override;
    auto outputs() const -> std::vector<PinSpec> override;
    auto evaluate(InputMap const& inputs, EvaluationContext& context) const -> Expected<OutputMap> override;
};

} // namespace SG
