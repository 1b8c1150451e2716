#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/type/Value.hpp>

#include <parallel_hashmap/phmap.h>

#include <optional>
#include <string>
#include <string_view>

namespace SG {

using InputMap  = phmap::flat_hash_map<std::string, Value>;
using OutputMap = phmap::flat_hash_map<std::string, Value>;

/**
 * Declared input or output pin of a node kind.
 *
 * `kind` is the value kind the pin expects; std::nullopt accepts any kind.
 * Optional inputs carry the default the node falls back to, the runtime never
 * substitutes it on the node's behalf.
 */
struct PinSpec {
    std::string              name;
    std::optional<ValueKind> kind;
    bool                     required = true;
    std::optional<Value>     defaultValue;

    static auto input(std::string name, std::optional<ValueKind> kind) -> PinSpec;
    static auto optionalInput(std::string name, std::optional<ValueKind> kind, Value fallback) -> PinSpec;
    static auto output(std::string name, std::optional<ValueKind> kind) -> PinSpec;
};

// Whether a value produced by `source` may feed `destination`. Any-kind pins
// match everything, and number/boolean pins accept each other.
[[nodiscard]] auto pinsCompatible(PinSpec const& source, PinSpec const& destination) -> bool;

// Input accessors used by node kinds. A pin that is absent, or present but
// carrying an empty value (the sentinel of a failed upstream node), is reported
// as MissingInput. A value of the wrong kind is TypeCoercionFailed.
auto requireInput(InputMap const& inputs, std::string_view name) -> Expected<Value const*>;
auto requireNumber(InputMap const& inputs, std::string_view name) -> Expected<double>;
auto requireBool(InputMap const& inputs, std::string_view name) -> Expected<bool>;
auto requireText(InputMap const& inputs, std::string_view name) -> Expected<std::string>;
auto numberOr(InputMap const& inputs, std::string_view name, double fallback) -> Expected<double>;
auto boolOr(InputMap const& inputs, std::string_view name, bool fallback) -> Expected<bool>;
auto textOr(InputMap const& inputs, std::string_view name, std::string fallback) -> Expected<std::string>;
auto valueOr(InputMap const& inputs, std::string_view name, Value fallback) -> Value;

} // namespace SG
