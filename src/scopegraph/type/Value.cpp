#include <scopegraph/type/Value.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace SG {

namespace {

using Json = nlohmann::json;

auto clamp_channel(float value) -> float {
    if (std::isnan(value)) {
        return 0.0f;
    }
    return std::clamp(value, 0.0f, 1.0f);
}

auto format_number(double number) -> std::string {
    if (std::isfinite(number) && number == std::floor(number) && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
    }
    std::ostringstream oss;
    oss << number;
    return oss.str();
}

auto read_number_array(Json const& array, std::string_view field) -> Expected<std::vector<double>> {
    if (!array.is_array()) {
        return std::unexpected(Error{Error::Code::InvalidType, std::string{field} + " must be an array"});
    }
    std::vector<double> numbers;
    numbers.reserve(array.size());
    for (auto const& element : array) {
        if (!element.is_number()) {
            return std::unexpected(Error{Error::Code::InvalidType, std::string{field} + " elements must be numbers"});
        }
        numbers.push_back(element.get<double>());
    }
    return numbers;
}

} // namespace

auto valueKindName(ValueKind kind) -> std::string_view {
    switch (kind) {
    case ValueKind::Empty:
        return "empty";
    case ValueKind::Number:
        return "number";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Text:
        return "text";
    case ValueKind::Color:
        return "color";
    case ValueKind::Vector:
        return "vector";
    case ValueKind::List:
        return "list";
    }
    return "empty";
}

Color::Color(float r, float g, float b, float a)
    : r(clamp_channel(r)), g(clamp_channel(g)), b(clamp_channel(b)), a(clamp_channel(a)) {}

auto Color::fromBytes(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) -> Color {
    return Color{r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
}

auto Value::asNumber() const -> std::optional<double> {
    if (auto const* number = std::get_if<double>(&storage_)) {
        return *number;
    }
    if (auto const* boolean = std::get_if<bool>(&storage_)) {
        return *boolean ? 1.0 : 0.0;
    }
    return std::nullopt;
}

auto Value::asBool() const -> std::optional<bool> {
    if (auto const* boolean = std::get_if<bool>(&storage_)) {
        return *boolean;
    }
    if (auto const* number = std::get_if<double>(&storage_)) {
        return *number != 0.0;
    }
    return std::nullopt;
}

auto Value::asText() const -> std::optional<std::string> {
    if (auto const* text = std::get_if<std::string>(&storage_)) {
        return *text;
    }
    if (auto const* number = std::get_if<double>(&storage_)) {
        return format_number(*number);
    }
    if (auto const* boolean = std::get_if<bool>(&storage_)) {
        return std::string{*boolean ? "true" : "false"};
    }
    return std::nullopt;
}

auto Value::asColor() const -> std::optional<Color> {
    if (auto const* color = std::get_if<Color>(&storage_)) {
        return *color;
    }
    return std::nullopt;
}

auto Value::asVector() const -> Vector const* {
    return std::get_if<Vector>(&storage_);
}

auto Value::asList() const -> List const* {
    return std::get_if<List>(&storage_);
}

auto Value::operator==(Value const& other) const -> bool {
    if (storage_.index() != other.storage_.index()) {
        return false;
    }
    return std::visit(
        [&other](auto const& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return true;
            } else {
                return lhs == std::get<T>(other.storage_);
            }
        },
        storage_);
}

auto Value::toDisplayString() const -> std::string {
    switch (kind()) {
    case ValueKind::Empty:
        return "<empty>";
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Text:
        return asText().value_or(std::string{});
    case ValueKind::Color: {
        auto const& color = std::get<Color>(storage_);
        std::ostringstream oss;
        oss << "rgba(" << color.r << ", " << color.g << ", " << color.b << ", " << color.a << ")";
        return oss.str();
    }
    case ValueKind::Vector: {
        auto const& vector = std::get<Vector>(storage_);
        std::string out = "(";
        for (std::size_t idx = 0; idx < vector.components.size(); ++idx) {
            if (idx > 0) {
                out.append(", ");
            }
            out.append(format_number(vector.components[idx]));
        }
        out.push_back(')');
        return out;
    }
    case ValueKind::List: {
        auto const& list = std::get<List>(storage_);
        std::string out = "[";
        for (std::size_t idx = 0; idx < list.size(); ++idx) {
            if (idx > 0) {
                out.append(", ");
            }
            out.append(list[idx].toDisplayString());
        }
        out.push_back(']');
        return out;
    }
    }
    return {};
}

auto toJson(Value const& value) -> nlohmann::json {
    switch (value.kind()) {
    case ValueKind::Empty:
        return Json(nullptr);
    case ValueKind::Number:
        return Json(std::get<double>(value.storage()));
    case ValueKind::Boolean:
        return Json(std::get<bool>(value.storage()));
    case ValueKind::Text:
        return Json(std::get<std::string>(value.storage()));
    case ValueKind::Color: {
        auto const& color = std::get<Color>(value.storage());
        return Json{{"color", Json::array({color.r, color.g, color.b, color.a})}};
    }
    case ValueKind::Vector:
        return Json{{"vector", std::get<Vector>(value.storage()).components}};
    case ValueKind::List: {
        auto array = Json::array();
        for (auto const& element : std::get<Value::List>(value.storage())) {
            array.push_back(toJson(element));
        }
        return array;
    }
    }
    return Json(nullptr);
}

auto valueFromJson(nlohmann::json const& json) -> Expected<Value> {
    if (json.is_null()) {
        return Value{};
    }
    if (json.is_boolean()) {
        return Value{json.get<bool>()};
    }
    if (json.is_number()) {
        return Value{json.get<double>()};
    }
    if (json.is_string()) {
        return Value{json.get<std::string>()};
    }
    if (json.is_array()) {
        Value::List list;
        list.reserve(json.size());
        for (auto const& element : json) {
            auto converted = valueFromJson(element);
            if (!converted) {
                return std::unexpected(converted.error());
            }
            list.push_back(std::move(*converted));
        }
        return Value{std::move(list)};
    }
    if (json.is_object() && json.size() == 1) {
        if (auto it = json.find("color"); it != json.end()) {
            auto channels = read_number_array(*it, "color");
            if (!channels) {
                return std::unexpected(channels.error());
            }
            if (channels->size() != 3 && channels->size() != 4) {
                return std::unexpected(Error{Error::Code::InvalidType, "color needs 3 or 4 channels"});
            }
            auto const alpha = channels->size() == 4 ? (*channels)[3] : 1.0;
            return Value{Color{static_cast<float>((*channels)[0]),
                               static_cast<float>((*channels)[1]),
                               static_cast<float>((*channels)[2]),
                               static_cast<float>(alpha)}};
        }
        if (auto it = json.find("vector"); it != json.end()) {
            auto components = read_number_array(*it, "vector");
            if (!components) {
                return std::unexpected(components.error());
            }
            return Value{Vector{std::move(*components)}};
        }
    }
    return std::unexpected(Error{Error::Code::InvalidType, "Unsupported JSON value: " + json.dump()});
}

} // namespace SG
