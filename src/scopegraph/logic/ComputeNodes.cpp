#include <scopegraph/logic/ComputeNodes.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace SG {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

auto custom_error(std::string message) -> Error {
    return Error{Error::Code::Custom, std::move(message)};
}

auto trim(std::string_view text) -> std::string_view {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

auto transform_case(std::string text, bool upper) -> std::string {
    std::ranges::transform(text, text.begin(), [upper](char ch) {
        auto const byte = static_cast<unsigned char>(ch);
        return static_cast<char>(upper ? std::toupper(byte) : std::tolower(byte));
    });
    return text;
}

// Whole-string parse; trailing characters make it fail.
auto parse_number(std::string_view text) -> std::optional<double> {
    double value = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto split_words(std::string_view text) -> Value::List {
    Value::List words;
    while (true) {
        auto first = text.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) {
            break;
        }
        text.remove_prefix(first);
        auto length = std::min(text.find_first_of(kWhitespace), text.size());
        words.emplace_back(std::string{text.substr(0, length)});
        text.remove_prefix(length);
    }
    return words;
}

// Splits on '\n', dropping a trailing '\r' from each line and the empty line
// after a final newline.
auto split_lines(std::string_view text) -> Value::List {
    Value::List lines;
    while (!text.empty()) {
        auto length = text.find('\n');
        auto line   = text.substr(0, length);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(std::string{line});
        if (length == std::string_view::npos) {
            break;
        }
        text.remove_prefix(length + 1);
    }
    return lines;
}

auto format_fixed(double value, bool scientific) -> std::string {
    std::ostringstream oss;
    if (scientific) {
        oss << std::scientific;
    } else {
        oss << std::fixed;
    }
    oss << std::setprecision(2) << value;
    return oss.str();
}

struct Formula {
    std::string_view expression;
    int              operands;
    auto (*apply)(double x, double y, double z) -> Expected<double>;
};

auto const kFormulas = std::to_array<Formula>({
    {"x + y", 2, [](double x, double y, double) -> Expected<double> { return x + y; }},
    {"x - y", 2, [](double x, double y, double) -> Expected<double> { return x - y; }},
    {"x * y", 2, [](double x, double y, double) -> Expected<double> { return x * y; }},
    {"x / y", 2,
     [](double x, double y, double) -> Expected<double> {
         if (y == 0.0) {
             return std::unexpected(custom_error("Division by zero"));
         }
         return x / y;
     }},
    {"x^2", 1, [](double x, double, double) -> Expected<double> { return x * x; }},
    {"sqrt(x)", 1,
     [](double x, double, double) -> Expected<double> {
         if (x < 0.0) {
             return std::unexpected(custom_error("Square root of a negative number"));
         }
         return std::sqrt(x);
     }},
    {"sin(x)", 1, [](double x, double, double) -> Expected<double> { return std::sin(x); }},
    {"cos(x)", 1, [](double x, double, double) -> Expected<double> { return std::cos(x); }},
    {"x + y + z", 3, [](double x, double y, double z) -> Expected<double> { return x + y + z; }},
    {"x * y * z", 3, [](double x, double y, double z) -> Expected<double> { return x * y * z; }},
    {"avg(x,y)", 2, [](double x, double y, double) -> Expected<double> { return (x + y) / 2.0; }},
    {"avg(x,y,z)", 3, [](double x, double y, double z) -> Expected<double> { return (x + y + z) / 3.0; }},
    {"distance(x,y)", 2, [](double x, double y, double) -> Expected<double> { return std::hypot(x, y); }},
    {"lerp(x,y,z)", 3,
     [](double x, double y, double z) -> Expected<double> { return x + (y - x) * std::clamp(z, 0.0, 1.0); }},
    {"clamp(x,y,z)", 3,
     [](double x, double y, double z) -> Expected<double> {
         if (y > z) {
             return std::unexpected(custom_error("clamp lower bound is greater than upper bound"));
         }
         return std::clamp(x, y, z);
     }},
});

auto operand_pin(std::string name) -> PinSpec {
    return PinSpec{.name = std::move(name), .kind = ValueKind::Number, .required = false, .defaultValue = std::nullopt};
}

} // namespace

auto MathNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("a", ValueKind::Number), PinSpec::input("b", ValueKind::Number)};
}

auto MathNode::outputs() const -> std::vector<PinSpec> {
    std::vector<PinSpec> pins;
    for (auto name : {"add", "subtract", "multiply", "divide", "modulo", "power", "sqrt", "sin", "cos", "tan", "abs",
                      "floor", "ceil", "round", "min", "max"}) {
        pins.push_back(PinSpec::output(name, ValueKind::Number));
    }
    return pins;
}

auto MathNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto a = requireNumber(inputs, "a");
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = requireNumber(inputs, "b");
    if (!b) {
        return std::unexpected(b.error());
    }

    OutputMap outputs;
    outputs.emplace("add", *a + *b);
    outputs.emplace("subtract", *a - *b);
    outputs.emplace("multiply", *a * *b);
    outputs.emplace("divide", *b == 0.0 ? Value{} : Value{*a / *b});
    outputs.emplace("modulo", *b == 0.0 ? Value{} : Value{std::fmod(*a, *b)});
    outputs.emplace("power", std::pow(*a, *b));
    outputs.emplace("sqrt", *a < 0.0 ? Value{} : Value{std::sqrt(*a)});
    outputs.emplace("sin", std::sin(*a));
    outputs.emplace("cos", std::cos(*a));
    outputs.emplace("tan", std::tan(*a));
    outputs.emplace("abs", std::fabs(*a));
    outputs.emplace("floor", std::floor(*a));
    outputs.emplace("ceil", std::ceil(*a));
    outputs.emplace("round", std::round(*a));
    outputs.emplace("min", std::min(*a, *b));
    outputs.emplace("max", std::max(*a, *b));
    return outputs;
}

auto StringNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("text", ValueKind::Text),
            PinSpec::optionalInput("other", ValueKind::Text, Value{""}),
            PinSpec::optionalInput("separator", ValueKind::Text, Value{" "}),
            PinSpec::optionalInput("index", ValueKind::Number, Value{0.0})};
}

auto StringNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("length", ValueKind::Number),
            PinSpec::output("uppercase", ValueKind::Text),
            PinSpec::output("lowercase", ValueKind::Text),
            PinSpec::output("trimmed", ValueKind::Text),
            PinSpec::output("concat", ValueKind::Text),
            PinSpec::output("join", ValueKind::Text),
            PinSpec::output("is_empty", ValueKind::Boolean),
            PinSpec::output("contains", ValueKind::Boolean),
            PinSpec::output("starts_with", ValueKind::Boolean),
            PinSpec::output("ends_with", ValueKind::Boolean),
            PinSpec::output("char_at", ValueKind::Text),
            PinSpec::output("words", ValueKind::List),
            PinSpec::output("lines", ValueKind::List)};
}

auto StringNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto text = requireText(inputs, "text");
    if (!text) {
        return std::unexpected(text.error());
    }
    auto other = textOr(inputs, "other", "");
    if (!other) {
        return std::unexpected(other.error());
    }
    auto separator = textOr(inputs, "separator", " ");
    if (!separator) {
        return std::unexpected(separator.error());
    }
    auto index = numberOr(inputs, "index", 0.0);
    if (!index) {
        return std::unexpected(index.error());
    }
    if (*index < 0.0 || *index != std::floor(*index)) {
        return std::unexpected(custom_error("string index must be a non-negative integer"));
    }

    std::string charAt;
    if (*index < static_cast<double>(text->size())) {
        charAt.push_back((*text)[static_cast<std::size_t>(*index)]);
    }

    OutputMap outputs;
    outputs.emplace("length", static_cast<double>(text->size()));
    outputs.emplace("uppercase", transform_case(*text, true));
    outputs.emplace("lowercase", transform_case(*text, false));
    outputs.emplace("trimmed", std::string{trim(*text)});
    outputs.emplace("concat", *text + *other);
    outputs.emplace("join", *text + *separator + *other);
    outputs.emplace("is_empty", text->empty());
    outputs.emplace("contains", text->find(*other) != std::string::npos);
    outputs.emplace("starts_with", text->starts_with(*other));
    outputs.emplace("ends_with", text->ends_with(*other));
    outputs.emplace("char_at", std::move(charAt));
    outputs.emplace("words", split_words(*text));
    outputs.emplace("lines", split_lines(*text));
    return outputs;
}

auto ValidationNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::optionalInput("value", std::nullopt, Value{""}),
            PinSpec::optionalInput("type", ValueKind::Text, Value{"text"}),
            PinSpec::optionalInput("min_length", ValueKind::Number, Value{0.0}),
            PinSpec::optionalInput("max_length", ValueKind::Number, Value{1000.0}),
            PinSpec::optionalInput("required", ValueKind::Boolean, Value{false})};
}

auto ValidationNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("is_valid", ValueKind::Boolean),
            PinSpec::output("errors", ValueKind::List),
            PinSpec::output("error_count", ValueKind::Number),
            PinSpec::output("validated_value", std::nullopt),
            PinSpec::output("sanitized", std::nullopt),
            PinSpec::output("message", ValueKind::Text),
            PinSpec::output("length", ValueKind::Number),
            PinSpec::output("is_empty", ValueKind::Boolean),
            PinSpec::output("is_positive", ValueKind::Boolean),
            PinSpec::output("is_negative", ValueKind::Boolean),
            PinSpec::output("is_zero", ValueKind::Boolean),
            PinSpec::output("is_integer", ValueKind::Boolean)};
}

auto ValidationNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto value = valueOr(inputs, "value", Value{""});
    auto type  = textOr(inputs, "type", "text");
    if (!type) {
        return std::unexpected(type.error());
    }
    if (*type != "text" && *type != "email" && *type != "number" && *type != "url" && *type != "phone") {
        return std::unexpected(custom_error("Unknown validation type: " + *type));
    }
    auto minLength = numberOr(inputs, "min_length", 0.0);
    if (!minLength) {
        return std::unexpected(minLength.error());
    }
    auto maxLength = numberOr(inputs, "max_length", 1000.0);
    if (!maxLength) {
        return std::unexpected(maxLength.error());
    }
    if (*minLength < 0.0 || *maxLength < *minLength) {
        return std::unexpected(custom_error("validation length limits are out of order"));
    }
    auto required = boolOr(inputs, "required", false);
    if (!required) {
        return std::unexpected(required.error());
    }

    OutputMap   outputs;
    Value::List errors;
    auto fail = [&errors](std::string message) {
        errors.emplace_back(std::move(message));
    };

    if (value.kind() == ValueKind::Text) {
        auto const text   = *value.asText();
        auto const length = static_cast<double>(text.size());
        if (length < *minLength) {
            fail("Minimum length is " + *Value{*minLength}.asText());
        }
        if (length > *maxLength) {
            fail("Maximum length is " + *Value{*maxLength}.asText());
        }
        if (*required && text.empty()) {
            fail("Field is required");
        }
        if (*type == "email" && (text.find('@') == std::string::npos || text.find('.') == std::string::npos)) {
            fail("Invalid email format");
        } else if (*type == "number" && !parse_number(text)) {
            fail("Must be a number");
        } else if (*type == "url" && !text.starts_with("http://") && !text.starts_with("https://")) {
            fail("Must be a valid URL");
        } else if (*type == "phone"
                   && std::ranges::count_if(text, [](unsigned char ch) { return std::isdigit(ch) != 0; }) < 10) {
            fail("Phone number too short");
        }
        outputs.emplace("length", length);
        outputs.emplace("is_empty", text.empty());

        std::string sanitized;
        for (char ch : trim(text)) {
            if (ch == '\n') {
                sanitized.push_back(' ');
            } else if (ch != '\r') {
                sanitized.push_back(ch);
            }
        }
        outputs.emplace("sanitized", std::move(sanitized));
    } else {
        if (value.kind() == ValueKind::Number) {
            auto const number = *value.asNumber();
            outputs.emplace("is_positive", number > 0.0);
            outputs.emplace("is_negative", number < 0.0);
            outputs.emplace("is_zero", std::fabs(number) < std::numeric_limits<double>::epsilon());
            outputs.emplace("is_integer", number == std::trunc(number));
        } else if (*required) {
            fail("Invalid data type");
        }
        outputs.emplace("sanitized", value);
    }

    auto const count = errors.size();
    outputs.emplace("is_valid", count == 0);
    outputs.emplace("error_count", static_cast<double>(count));
    outputs.emplace("errors", std::move(errors));
    outputs.emplace("validated_value", std::move(value));
    outputs.emplace("message", count == 0 ? std::string{"Validation passed"}
                                          : "Validation failed: " + std::to_string(count) + " error(s)");
    return outputs;
}

auto CalculatorNode::inputs() const -> std::vector<PinSpec> {
    return {PinSpec::input("expression", ValueKind::Text), operand_pin("x"), operand_pin("y"), operand_pin("z")};
}

auto CalculatorNode::outputs() const -> std::vector<PinSpec> {
    return {PinSpec::output("result", ValueKind::Number),
            PinSpec::output("expression", ValueKind::Text),
            PinSpec::output("is_valid", ValueKind::Boolean),
            PinSpec::output("is_positive", ValueKind::Boolean),
            PinSpec::output("is_negative", ValueKind::Boolean),
            PinSpec::output("is_zero", ValueKind::Boolean),
            PinSpec::output("absolute", ValueKind::Number),
            PinSpec::output("rounded", ValueKind::Number),
            PinSpec::output("formatted", ValueKind::Text),
            PinSpec::output("scientific", ValueKind::Text)};
}

// The operands a formula uses are required; unused ones may stay unconnected.
auto CalculatorNode::evaluate(InputMap const& inputs, EvaluationContext&) const -> Expected<OutputMap> {
    auto expression = requireText(inputs, "expression");
    if (!expression) {
        return std::unexpected(expression.error());
    }
    auto const trimmed = trim(*expression);

    double result  = 0.0;
    auto   formula = std::ranges::find(kFormulas, trimmed, &Formula::expression);
    if (formula != kFormulas.end()) {
        std::array<double, 3> operands{};
        constexpr std::array<std::string_view, 3> kNames{"x", "y", "z"};
        for (int index = 0; index < formula->operands; ++index) {
            auto operand = requireNumber(inputs, kNames[index]);
            if (!operand) {
                return std::unexpected(operand.error());
            }
            operands[index] = *operand;
        }
        auto computed = formula->apply(operands[0], operands[1], operands[2]);
        if (!computed) {
            return std::unexpected(computed.error());
        }
        result = *computed;
    } else if (auto literal = parse_number(trimmed)) {
        result = *literal;
    } else {
        return std::unexpected(custom_error("Unsupported expression: " + *expression));
    }

    OutputMap outputs;
    outputs.emplace("result", result);
    outputs.emplace("expression", *expression);
    outputs.emplace("is_valid", std::isfinite(result));
    outputs.emplace("is_positive", result > 0.0);
    outputs.emplace("is_negative", result < 0.0);
    outputs.emplace("is_zero", std::fabs(result) < std::numeric_limits<double>::epsilon());
    outputs.emplace("absolute", std::fabs(result));
    outputs.emplace("rounded", std::round(result));
    outputs.emplace("formatted", format_fixed(result, false));
    outputs.emplace("scientific", format_fixed(result, true));
    return outputs;
}

} // namespace SG
