#include "expression/Arithmetic.hpp"

#include <doctest/doctest.h>

#include <cmath>
#include <string>

using namespace DJ;

namespace {
auto value(std::string_view text) -> double {
    auto result = Arithmetic::evaluate(text);
    REQUIRE(result.has_value());
    return *result;
}

auto failsWith(std::string_view text) -> std::string {
    auto result = Arithmetic::evaluate(text);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::ArithmeticError);
    return result.error().message.value_or("");
}
} // namespace

TEST_SUITE("expression.arithmetic") {
    TEST_CASE("Tokenizer") {
        auto tokens = Arithmetic::tokenize(" 12.5 *(3)");
        REQUIRE(tokens.has_value());
        REQUIRE(tokens->size() == 6);
        CHECK((*tokens)[0].type == Arithmetic::Token::Type::Number);
        CHECK((*tokens)[0].value == doctest::Approx(12.5));
        CHECK((*tokens)[1].type == Arithmetic::Token::Type::Star);
        CHECK((*tokens)[2].type == Arithmetic::Token::Type::LeftParen);
        CHECK((*tokens)[4].type == Arithmetic::Token::Type::RightParen);
        CHECK(tokens->back().type == Arithmetic::Token::Type::End);

        CHECK_FALSE(Arithmetic::tokenize("1 & 2").has_value());
        CHECK_FALSE(Arithmetic::tokenize("1.2.3").has_value());
    }

    TEST_CASE("Precedence and associativity") {
        CHECK(value("1 + 2 * 3") == 7);
        CHECK(value("(1 + 2) * 3") == 9);
        CHECK(value("10 - 4 - 3") == 3);
        CHECK(value("24 / 4 / 3") == 2);
        CHECK(value("7 % 4") == 3);
        CHECK(value("2 * 7 % 4") == 2);
        CHECK(value("100 * (1 + 0.2)") == doctest::Approx(120));
    }

    TEST_CASE("Unary signs") {
        CHECK(value("-3") == -3);
        CHECK(value("--3") == 3);
        CHECK(value("+3") == 3);
        CHECK(value("2 * -3") == -6);
        CHECK(value("-(1 + 1)") == -2);
        CHECK(value("100 + -100") == 0);
    }

    TEST_CASE("IEEE division") {
        CHECK(std::isinf(value("1 / 0")));
        CHECK(value("-1 / 0") < 0);
        CHECK(std::isnan(value("5 % 0")));
    }

    TEST_CASE("Malformed input") {
        CHECK(failsWith("").find("Empty") != std::string::npos);
        CHECK(failsWith("   ").find("Empty") != std::string::npos);
        CHECK(failsWith("1 +").find("end") != std::string::npos);
        CHECK(failsWith("(1 + 2").find("Unbalanced") != std::string::npos);
        CHECK(failsWith("1 + 2)").find("Unbalanced") != std::string::npos);
        failsWith("1 2");
        failsWith("* 3");
        failsWith("abc");
    }

    TEST_CASE("Nesting depth is bounded") {
        auto nested = [](std::size_t depth) {
            return std::string(depth, '(') + "1" + std::string(depth, ')');
        };
        CHECK(value(nested(200)) == 1);
        CHECK(failsWith(nested(200000)).find("nested too deeply") != std::string::npos);
        CHECK(failsWith(std::string(200000, '-') + "1").find("nested too deeply") != std::string::npos);
        CHECK(value(std::string(Arithmetic::MaxNestingDepth - 1, '-') + "1") == -1);
    }
}
