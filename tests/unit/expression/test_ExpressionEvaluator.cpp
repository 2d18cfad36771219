#include "expression/ExpressionEvaluator.hpp"
#include "persistence/JarStore.hpp"

#include <doctest/doctest.h>

using namespace DJ;

namespace {
auto numberOf(Evaluation const& evaluation) -> double {
    REQUIRE_FALSE(evaluation.failed());
    REQUIRE(evaluation.isNumber());
    return std::get<double>(evaluation.result);
}

auto textOf(Evaluation const& evaluation) -> std::string {
    REQUIRE_FALSE(evaluation.failed());
    REQUIRE_FALSE(evaluation.isNumber());
    return std::get<std::string>(evaluation.result);
}
} // namespace

TEST_SUITE("expression.evaluator") {
    TEST_CASE("Arithmetic over references") {
        auto const jar = defaultJar();
        CHECK(numberOf(evaluateExpression("{{price}} * (1 + {{tax_rate}})", jar)) == doctest::Approx(120));
        CHECK(numberOf(evaluateExpression("{{config.fontSize}} * 2", jar)) == 28);
        CHECK(numberOf(evaluateExpression("{{price}}", jar)) == 100);
        CHECK(evaluateExpression("{{price}} / 8", jar).toString() == "12.5");
    }

    TEST_CASE("Text interpolation") {
        Nodes const jar{Node{"name", Text{"World"}}, Node{"user", Dictionary{Nodes{Node{"first", Text{"Ada"}}}}}};
        CHECK(textOf(evaluateExpression("Hello {{name}}", jar)) == "Hello World");
        CHECK(textOf(evaluateExpression("{{user.first}} and {{name}}", jar)) == "Ada and World");
    }

    TEST_CASE("Formulas without references are returned as written") {
        Nodes const jar;
        CHECK(textOf(evaluateExpression("1 + 2", jar)) == "1 + 2");
        CHECK(textOf(evaluateExpression("just text", jar)) == "just text");
        CHECK(textOf(evaluateExpression("", jar)).empty());
        CHECK(textOf(evaluateExpression("{{ not a token }}", jar)) == "{{ not a token }}");
    }

    TEST_CASE("Missing reference") {
        auto const jar        = defaultJar();
        auto const evaluation = evaluateExpression("{{missing}} + 1", jar);
        REQUIRE(evaluation.failed());
        CHECK(evaluation.toString() == "ERR");
        CHECK(evaluation.error->code == Error::Code::ReferenceNotFound);
        REQUIRE(evaluation.error->message.has_value());
        CHECK(evaluation.error->message->find("missing") != std::string::npos);
    }

    TEST_CASE("Arithmetic failure after substitution") {
        Nodes const jar{Node{"a", Number{1}}};
        auto const evaluation = evaluateExpression("{{a}} +", jar);
        REQUIRE(evaluation.failed());
        CHECK(evaluation.toString() == "ERR");
        CHECK(evaluation.error->code == Error::Code::ArithmeticError);
    }

    TEST_CASE("Deeply nested formulas fail instead of recursing without bound") {
        Nodes const jar{Node{"a", Number{1}}};
        auto const  formula    = std::string(200000, '(') + "{{a}}" + std::string(200000, ')');
        auto const  evaluation = evaluateExpression(formula, jar);
        REQUIRE(evaluation.failed());
        CHECK(evaluation.toString() == "ERR");
        CHECK(evaluation.error->code == Error::Code::ArithmeticError);
    }

    TEST_CASE("Text with operators is not computed") {
        Nodes const jar{Node{"name", Text{"Ann-Marie"}}, Node{"n", Number{5}}};
        CHECK(textOf(evaluateExpression("{{name}} (guest)", jar)) == "Ann-Marie (guest)");
        // '%' passes the operator check but not the charset, so it stays text.
        CHECK(textOf(evaluateExpression("{{n}} % 2", jar)) == "5 % 2");
    }

    TEST_CASE("Referenced expressions contribute their formula") {
        Nodes const jar{Node{"a", Number{2}}, Node{"double_a", Expression{"{{a}} * 2"}}, Node{"sum", Expression{"1 + 1"}}};
        // The inner formula is spliced in but never evaluated, so its braces remain.
        CHECK(textOf(evaluateExpression("{{double_a}}", jar)) == "{{a}} * 2");
        CHECK(numberOf(evaluateExpression("{{sum}} * 3", jar)) == 4);
    }

    TEST_CASE("Containers substitute as JSON") {
        Nodes const jar{Node{"tags", List{Nodes{Node{"0", Text{"x"}}, Node{"1", Number{2}}}}}};
        CHECK(textOf(evaluateExpression("tags: {{tags}}", jar)) == "tags: [\"x\",2]");
        CHECK(substitutionText(jar[0]) == "[\"x\",2]");
    }

    TEST_CASE("Containers holding invalid UTF-8 still substitute") {
        Nodes const jar{Node{"raw", Dictionary{Nodes{Node{"bytes", Text{"a\xFF"}}}}}};
        CHECK(substitutionText(jar[0]) == "{\"bytes\":\"a\xEF\xBF\xBD\"}");
        CHECK(textOf(evaluateExpression("{{raw}}", jar)) == "{\"bytes\":\"a\xEF\xBF\xBD\"}");
    }

    TEST_CASE("Display values") {
        auto const jar = defaultJar();
        CHECK(displayValue(*findChild(jar, "greeting"), jar) == "Hello World");
        CHECK(displayValue(*findChild(jar, "config"), jar) == "2 items");
        CHECK(displayValue(*findChild(jar, "tax_rate"), jar) == "0.2");
        CHECK(displayValue(*findChild(jar, "total_cost"), jar) == "= 120");

        Nodes const broken{Node{"bad", Expression{"{{nope}}"}}, Node{"flag", Boolean{true}}};
        CHECK(displayValue(broken[0], broken) == "= ERR (Key not found: nope)");
        CHECK(displayValue(broken[1], broken) == "true");
    }
}
