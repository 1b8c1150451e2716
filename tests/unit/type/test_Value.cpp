#include <scopegraph/type/Value.hpp>

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <string>

using namespace SG;

TEST_SUITE("type.value") {
    TEST_CASE("Kinds and type names") {
        CHECK(Value{}.kind() == ValueKind::Empty);
        CHECK(Value{}.isEmpty());
        CHECK(Value{2.5}.kind() == ValueKind::Number);
        CHECK(Value{3}.kind() == ValueKind::Number);
        CHECK(Value{true}.kind() == ValueKind::Boolean);
        CHECK(Value{"hi"}.kind() == ValueKind::Text);
        CHECK(Value{Color{1.0f, 0.0f, 0.0f}}.kind() == ValueKind::Color);
        CHECK(Value{Vector{{1.0, 2.0}}}.kind() == ValueKind::Vector);
        CHECK(Value{Value::List{Value{1.0}, Value{"a"}}}.kind() == ValueKind::List);

        CHECK(Value{}.typeName() == "empty");
        CHECK(Value{1.0}.typeName() == "number");
        CHECK(Value{false}.typeName() == "boolean");
        CHECK(Value{"x"}.typeName() == "text");
        CHECK(Value{Color{}}.typeName() == "color");
        CHECK(Value{Vector{}}.typeName() == "vector");
        CHECK(Value{Value::List{}}.typeName() == "list");
    }

    TEST_CASE("Structural equality compares kind then payload") {
        CHECK(Value{} == Value{});
        CHECK(Value{1.0} == Value{1});
        CHECK_FALSE(Value{1.0} == Value{true});
        CHECK_FALSE(Value{"1"} == Value{1.0});
        CHECK(Value{Value::List{Value{1.0}, Value{"a"}}} == Value{Value::List{Value{1.0}, Value{"a"}}});
        CHECK_FALSE(Value{Value::List{Value{1.0}}} == Value{Value::List{Value{2.0}}});
        CHECK(Value{Vector{{1.0, 2.0}}} == Value{Vector{{1.0, 2.0}}});
        CHECK_FALSE(Value{Vector{{1.0, 2.0}}} == Value{Vector{{1.0}}});
    }

    TEST_CASE("Lenient accessors") {
        CHECK(Value{true}.asNumber() == 1.0);
        CHECK(Value{false}.asNumber() == 0.0);
        CHECK_FALSE(Value{"3"}.asNumber().has_value());
        CHECK(Value{0.0}.asBool() == false);
        CHECK(Value{-2.0}.asBool() == true);
        CHECK_FALSE(Value{}.asBool().has_value());
        CHECK(Value{4.0}.asText() == "4");
        CHECK(Value{2.5}.asText() == "2.5");
        CHECK(Value{true}.asText() == "true");
        CHECK_FALSE(Value{Color{}}.asText().has_value());
        CHECK(Value{Vector{{1.0}}}.asVector() != nullptr);
        CHECK(Value{1.0}.asVector() == nullptr);
        CHECK(Value{Value::List{}}.asList() != nullptr);
    }

    TEST_CASE("Color channels are clamped") {
        Color c{1.5f, -0.5f, 0.25f, std::numeric_limits<float>::quiet_NaN()};
        CHECK(c.r == doctest::Approx(1.0f));
        CHECK(c.g == doctest::Approx(0.0f));
        CHECK(c.b == doctest::Approx(0.25f));
        CHECK(c.a == doctest::Approx(0.0f));

        auto bytes = Color::fromBytes(255, 0, 51);
        CHECK(bytes.r == doctest::Approx(1.0f));
        CHECK(bytes.b == doctest::Approx(0.2f));
        CHECK(bytes.a == doctest::Approx(1.0f));
    }

    TEST_CASE("Display strings") {
        CHECK(Value{}.toDisplayString() == "<empty>");
        CHECK(Value{7.0}.toDisplayString() == "7");
        CHECK(Value{Vector{{1.0, 2.5}}}.toDisplayString() == "(1, 2.5)");
        CHECK(Value{Value::List{Value{1.0}, Value{"a"}}}.toDisplayString() == "[1, a]");
    }

    TEST_CASE("JSON conversion") {
        CHECK(toJson(Value{}).is_null());
        CHECK(toJson(Value{2.0}) == nlohmann::json(2.0));
        CHECK(toJson(Value{"t"}) == nlohmann::json("t"));
        CHECK(toJson(Value{Vector{{1.0, 2.0}}}) == nlohmann::json::parse(R"({"vector":[1.0,2.0]})"));
        CHECK(toJson(Value{Value::List{Value{true}, Value{}}}) == nlohmann::json::parse("[true,null]"));

        auto color = valueFromJson(nlohmann::json::parse(R"({"color":[1,0,0]})"));
        REQUIRE(color.has_value());
        REQUIRE(color->asColor().has_value());
        CHECK(color->asColor()->a == doctest::Approx(1.0f));

        auto list = valueFromJson(nlohmann::json::parse(R"([1, "a", {"vector":[3]}])"));
        REQUIRE(list.has_value());
        REQUIRE(list->asList() != nullptr);
        CHECK(list->asList()->size() == 3);
        CHECK((*list->asList())[2] == Value{Vector{{3.0}}});

        auto badColor = valueFromJson(nlohmann::json::parse(R"({"color":[1,0]})"));
        REQUIRE_FALSE(badColor.has_value());
        CHECK(badColor.error().code == Error::Code::InvalidType);

        auto object = valueFromJson(nlohmann::json::parse(R"({"other":1})"));
        REQUIRE_FALSE(object.has_value());
        CHECK(object.error().code == Error::Code::InvalidType);
    }
}
