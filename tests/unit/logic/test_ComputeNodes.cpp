#include <scopegraph/logic/ComputeNodes.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace SG;

namespace {

struct NodeFixture {
    NodeFixture() {
        root      = registry.createRootScope();
        auto node = registry.createChildScope(root, "node");
        REQUIRE(node.has_value());
        scope = *node;
    }

    auto run(NodeKind const& kind, InputMap const& inputs) -> Expected<OutputMap> {
        EvaluationContext context{registry, scope, TickClock{.time = 0.0, .delta = 0.0, .tick = 0}};
        return kind.evaluate(inputs, context);
    }

    ScopeRegistry registry;
    ScopeId       root;
    ScopeId       scope;
};

auto inputs(std::initializer_list<std::pair<std::string const, Value>> values) -> InputMap {
    return InputMap{values};
}

auto number(OutputMap const& outputs, std::string const& pin) -> double {
    auto value = outputs.at(pin).asNumber();
    REQUIRE(value.has_value());
    return *value;
}

auto texts(Value const& value) -> std::vector<std::string> {
    std::vector<std::string> result;
    auto const* list = value.asList();
    REQUIRE(list != nullptr);
    for (auto const& item : *list) {
        result.push_back(*item.asText());
    }
    return result;
}

} // namespace

TEST_SUITE("logic.compute_nodes") {
    TEST_CASE_FIXTURE(NodeFixture, "Math computes every function of a and b") {
        MathNode math;
        auto out = run(math, inputs({{"a", Value{7.5}}, {"b", Value{2.0}}}));
        REQUIRE(out.has_value());
        CHECK(number(*out, "add") == doctest::Approx(9.5));
        CHECK(number(*out, "subtract") == doctest::Approx(5.5));
        CHECK(number(*out, "multiply") == doctest::Approx(15.0));
        CHECK(number(*out, "divide") == doctest::Approx(3.75));
        CHECK(number(*out, "modulo") == doctest::Approx(1.5));
        CHECK(number(*out, "power") == doctest::Approx(56.25));
        CHECK(number(*out, "floor") == doctest::Approx(7.0));
        CHECK(number(*out, "ceil") == doctest::Approx(8.0));
        CHECK(number(*out, "round") == doctest::Approx(8.0));
        CHECK(number(*out, "min") == doctest::Approx(2.0));
        CHECK(number(*out, "max") == doctest::Approx(7.5));
        CHECK(out->size() == math.outputs().size());
    }

    TEST_CASE_FIXTURE(NodeFixture, "Math leaves undefined results empty") {
        MathNode math;
        auto out = run(math, inputs({{"a", Value{-4.0}}, {"b", Value{0.0}}}));
        REQUIRE(out.has_value());
        CHECK(out->at("divide").isEmpty());
        CHECK(out->at("modulo").isEmpty());
        CHECK(out->at("sqrt").isEmpty());
        CHECK(number(*out, "abs") == doctest::Approx(4.0));

        auto missing = run(math, inputs({{"a", Value{1.0}}}));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::MissingInput);
    }

    TEST_CASE_FIXTURE(NodeFixture, "String inspects and transforms text") {
        StringNode text;
        auto out = run(text, inputs({{"text", Value{"  Hello World  "}}, {"other", Value{"World"}}, {"index", Value{2.0}}}));
        REQUIRE(out.has_value());
        CHECK(number(*out, "length") == doctest::Approx(15.0));
        CHECK(out->at("uppercase") == Value{"  HELLO WORLD  "});
        CHECK(out->at("lowercase") == Value{"  hello world  "});
        CHECK(out->at("trimmed") == Value{"Hello World"});
        CHECK(out->at("concat") == Value{"  Hello World  World"});
        CHECK(out->at("join") == Value{"  Hello World   World"});
        CHECK(out->at("contains") == Value{true});
        CHECK(out->at("starts_with") == Value{false});
        CHECK(out->at("is_empty") == Value{false});
        CHECK(out->at("char_at") == Value{"H"});
        CHECK(texts(out->at("words")) == std::vector<std::string>{"Hello", "World"});
    }

    TEST_CASE_FIXTURE(NodeFixture, "String splits lines and rejects bad indices") {
        StringNode text;
        auto out = run(text, inputs({{"text", Value{"one\r\ntwo\n"}}, {"index", Value{20.0}}}));
        REQUIRE(out.has_value());
        CHECK(texts(out->at("lines")) == std::vector<std::string>{"one", "two"});
        CHECK(out->at("char_at") == Value{""});

        auto negative = run(text, inputs({{"text", Value{"abc"}}, {"index", Value{-1.0}}}));
        REQUIRE_FALSE(negative.has_value());
        CHECK(negative.error().code == Error::Code::Custom);

        auto missing = run(text, {});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::MissingInput);
    }

    TEST_CASE_FIXTURE(NodeFixture, "Validation reports failed checks as data") {
        ValidationNode validation;
        auto out = run(validation, inputs({{"value", Value{"bob"}}, {"type", Value{"email"}}, {"min_length", Value{5.0}}}));
        REQUIRE(out.has_value());
        CHECK(out->at("is_valid") == Value{false});
        CHECK(texts(out->at("errors")) == std::vector<std::string>{"Minimum length is 5", "Invalid email format"});
        CHECK(number(*out, "error_count") == doctest::Approx(2.0));
        CHECK(out->at("message") == Value{"Validation failed: 2 error(s)"});
        CHECK(number(*out, "length") == doctest::Approx(3.0));
        CHECK(out->at("validated_value") == Value{"bob"});

        auto padded = run(validation, inputs({{"value", Value{" https://example.org\n"}}, {"type", Value{"url"}}}));
        REQUIRE(padded.has_value());
        CHECK(padded->at("is_valid") == Value{false});

        auto clean = run(validation, inputs({{"value", Value{"https://example.org"}}, {"type", Value{"url"}}}));
        REQUIRE(clean.has_value());
        CHECK(clean->at("is_valid") == Value{true});
        CHECK(clean->at("message") == Value{"Validation passed"});
    }

    TEST_CASE_FIXTURE(NodeFixture, "Validation sanitizes text and classifies numbers") {
        ValidationNode validation;
        auto text = run(validation, inputs({{"value", Value{"  line one\nline two\r  "}}}));
        REQUIRE(text.has_value());
        CHECK(text->at("sanitized") == Value{"line one line two"});

        auto phone = run(validation, inputs({{"value", Value{"555-123"}}, {"type", Value{"phone"}}}));
        REQUIRE(phone.has_value());
        CHECK(texts(phone->at("errors")) == std::vector<std::string>{"Phone number too short"});

        auto numeric = run(validation, inputs({{"value", Value{-3.0}}}));
        REQUIRE(numeric.has_value());
        CHECK(numeric->at("is_negative") == Value{true});
        CHECK(numeric->at("is_integer") == Value{true});
        CHECK(numeric->at("is_zero") == Value{false});
        CHECK_FALSE(numeric->contains("length"));

        auto required = run(validation, inputs({{"value", Value{""}}, {"required", Value{true}}}));
        REQUIRE(required.has_value());
        CHECK(texts(required->at("errors")) == std::vector<std::string>{"Field is required"});
    }

    TEST_CASE_FIXTURE(NodeFixture, "Validation rejects a misconfigured node") {
        ValidationNode validation;
        auto unknown = run(validation, inputs({{"value", Value{"x"}}, {"type", Value{"postcode"}}}));
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::Custom);

        auto limits = run(validation, inputs({{"min_length", Value{10.0}}, {"max_length", Value{2.0}}}));
        REQUIRE_FALSE(limits.has_value());
        CHECK(limits.error().code == Error::Code::Custom);
    }

    TEST_CASE_FIXTURE(NodeFixture, "Calculator evaluates known formulas") {
        CalculatorNode calculator;
        auto eval = [&](std::string expression) {
            auto out = run(calculator,
                           inputs({{"expression", Value{expression}},
                                   {"x", Value{3.0}},
                                   {"y", Value{4.0}},
                                   {"z", Value{0.5}}}));
            REQUIRE(out.has_value());
            return number(*out, "result");
        };
        CHECK(eval("x + y") == doctest::Approx(7.0));
        CHECK(eval("x^2") == doctest::Approx(9.0));
        CHECK(eval("distance(x,y)") == doctest::Approx(5.0));
        CHECK(eval("lerp(x,y,z)") == doctest::Approx(3.5));
        CHECK(eval("avg(x,y,z)") == doctest::Approx(2.5));
        CHECK(eval(" x * y * z ") == doctest::Approx(6.0));
        CHECK(eval("42") == doctest::Approx(42.0));
    }

    TEST_CASE_FIXTURE(NodeFixture, "Calculator formats its result") {
        CalculatorNode calculator;
        auto out = run(calculator, inputs({{"expression", Value{"x / y"}}, {"x", Value{-10.0}}, {"y", Value{4.0}}}));
        REQUIRE(out.has_value());
        CHECK(out->at("formatted") == Value{"-2.50"});
        CHECK(out->at("scientific") == Value{"-2.50e+00"});
        CHECK(out->at("is_negative") == Value{true});
        CHECK(number(*out, "absolute") == doctest::Approx(2.5));
        CHECK(number(*out, "rounded") == doctest::Approx(-3.0));
        CHECK(out->at("expression") == Value{"x / y"});
    }

    TEST_CASE_FIXTURE(NodeFixture, "Calculator reports what it cannot compute") {
        CalculatorNode calculator;
        auto unsupported = run(calculator, inputs({{"expression", Value{"x ** y"}}, {"x", Value{1.0}}}));
        REQUIRE_FALSE(unsupported.has_value());
        CHECK(unsupported.error().code == Error::Code::Custom);

        auto zero = run(calculator, inputs({{"expression", Value{"x / y"}}, {"x", Value{1.0}}, {"y", Value{0.0}}}));
        REQUIRE_FALSE(zero.has_value());
        CHECK(zero.error().code == Error::Code::Custom);

        auto missing = run(calculator, inputs({{"expression", Value{"x + y"}}, {"x", Value{1.0}}}));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::MissingInput);

        auto unary = run(calculator, inputs({{"expression", Value{"sqrt(x)"}}, {"x", Value{16.0}}}));
        REQUIRE(unary.has_value());
        CHECK(number(*unary, "result") == doctest::Approx(4.0));
    }
}
