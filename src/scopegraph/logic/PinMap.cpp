#include <scopegraph/logic/PinMap.hpp>

#include <utility>

namespace SG {

namespace {

auto find_present(InputMap const& inputs, std::string_view name) -> Value const* {
    auto it = inputs.find(std::string{name});
    if (it == inputs.end() || it->second.isEmpty()) {
        return nullptr;
    }
    return &it->second;
}

auto missing_input(std::string_view name) -> Error {
    return Error{Error::Code::MissingInput, "Input '" + std::string{name} + "' has no value"};
}

auto coercion_failed(std::string_view name, Value const& value, std::string_view wanted) -> Error {
    return Error{Error::Code::TypeCoercionFailed,
                 "Input '" + std::string{name} + "' holds " + std::string{value.typeName()} + ", expected "
                     + std::string{wanted}};
}

} // namespace

auto PinSpec::input(std::string name, std::optional<ValueKind> kind) -> PinSpec {
    return PinSpec{.name = std::move(name), .kind = kind, .required = true, .defaultValue = std::nullopt};
}

auto PinSpec::optionalInput(std::string name, std::optional<ValueKind> kind, Value fallback) -> PinSpec {
    return PinSpec{.name = std::move(name), .kind = kind, .required = false, .defaultValue = std::move(fallback)};
}

auto PinSpec::output(std::string name, std::optional<ValueKind> kind) -> PinSpec {
    return PinSpec{.name = std::move(name), .kind = kind, .required = false, .defaultValue = std::nullopt};
}

auto pinsCompatible(PinSpec const& source, PinSpec const& destination) -> bool {
    if (!source.kind || !destination.kind) {
        return true;
    }
    if (*source.kind == *destination.kind) {
        return true;
    }
    auto scalar = [](ValueKind kind) { return kind == ValueKind::Number || kind == ValueKind::Boolean; };
    return scalar(*source.kind) && scalar(*destination.kind);
}

auto requireInput(InputMap const& inputs, std::string_view name) -> Expected<Value const*> {
    auto const* value = find_present(inputs, name);
    if (value == nullptr) {
        return std::unexpected(missing_input(name));
    }
    return value;
}

auto requireNumber(InputMap const& inputs, std::string_view name) -> Expected<double> {
    auto const* value = find_present(inputs, name);
    if (value == nullptr) {
        return std::unexpected(missing_input(name));
    }
    if (auto number = value->asNumber()) {
        return *number;
    }
    return std::unexpected(coercion_failed(name, *value, "number"));
}

auto requireBool(InputMap const& inputs, std::string_view name) -> Expected<bool> {
    auto const* value = find_present(inputs, name);
    if (value == nullptr) {
        return std::unexpected(missing_input(name));
    }
    if (auto boolean = value->asBool()) {
        return *boolean;
    }
    return std::unexpected(coercion_failed(name, *value, "boolean"));
}

auto requireText(InputMap const& inputs, std::string_view name) -> Expected<std::string> {
    auto const* value = find_present(inputs, name);
    if (value == nullptr) {
        return std::unexpected(missing_input(name));
    }
    if (auto text = value->asText()) {
        return *text;
    }
    return std::unexpected(coercion_failed(name, *value, "text"));
}

auto numberOr(InputMap const& inputs, std::string_view name, double fallback) -> Expected<double> {
    if (find_present(inputs, name) == nullptr) {
        return fallback;
    }
    return requireNumber(inputs, name);
}

auto boolOr(InputMap const& inputs, std::string_view name, bool fallback) -> Expected<bool> {
    if (find_present(inputs, name) == nullptr) {
        return fallback;
    }
    return requireBool(inputs, name);
}

auto textOr(InputMap const& inputs, std::string_view name, std::string fallback) -> Expected<std::string> {
    if (find_present(inputs, name) == nullptr) {
        return fallback;
    }
    return requireText(inputs, name);
}

auto valueOr(InputMap const& inputs, std::string_view name, Value fallback) -> Value {
    if (auto const* value = find_present(inputs, name)) {
        return *value;
    }
    return fallback;
}

} // namespace SG
