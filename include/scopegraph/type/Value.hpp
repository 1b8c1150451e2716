#pragma once
#include <scopegraph/core/Error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SG {

enum class ValueKind : std::uint8_t {
    Empty = 0,
    Number,
    Boolean,
    Text,
    Color,
    Vector,
    List
};

[[nodiscard]] auto valueKindName(ValueKind kind) -> std::string_view;

// Channels are clamped to [0, 1] on construction.
struct Color {
    Color() = default;
    Color(float r, float g, float b, float a = 1.0f);

    static auto fromBytes(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255) -> Color;

    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    auto operator==(Color const&) const -> bool = default;
};

struct Vector {
    std::vector<double> components;

    auto size() const -> std::size_t { return components.size(); }
    auto operator==(Vector const&) const -> bool = default;
};

class Value {
public:
    using List    = std::vector<Value>;
    using Storage = std::variant<std::monostate, double, bool, std::string, Color, Vector, List>;

    Value() = default;
    Value(double number) : storage_(number) {}
    Value(int number) : storage_(static_cast<double>(number)) {}
    Value(bool boolean) : storage_(boolean) {}
    Value(std::string text) : storage_(std::move(text)) {}
    Value(char const* text) : storage_(std::string{text}) {}
    Value(Color color) : storage_(color) {}
    Value(Vector vector) : storage_(std::move(vector)) {}
    Value(List list) : storage_(std::move(list)) {}

    auto kind() const -> ValueKind { return static_cast<ValueKind>(storage_.index()); }
    auto typeName() const -> std::string_view { return valueKindName(kind()); }
    auto isEmpty() const -> bool { return kind() == ValueKind::Empty; }

    // Lenient accessors: booleans read as 1/0, numbers read as truthy, and
    // scalars render as text. Anything else yields an empty optional.
    auto asNumber() const -> std::optional<double>;
    auto asBool() const -> std::optional<bool>;
    auto asText() const -> std::optional<std::string>;
    auto asColor() const -> std::optional<Color>;
    auto asVector() const -> Vector const*;
    auto asList() const -> List const*;

    auto storage() const -> Storage const& { return storage_; }

    auto operator==(Value const& other) const -> bool;

    auto toDisplayString() const -> std::string;

private:
    Storage storage_;
};

auto toJson(Value const& value) -> nlohmann::json;
auto valueFromJson(nlohmann::json const& json) -> Expected<Value>;

} // namespace SG
