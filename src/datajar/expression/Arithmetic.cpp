#include "Arithmetic.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <utility>

namespace DJ::Arithmetic {

namespace {

auto makeError(std::string message) -> Error {
    return Error{Error::Code::ArithmeticError, std::move(message)};
}

auto isDigit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto isSpace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

class Parser {
public:
    explicit Parser(std::vector<Token> const& tokens)
        : tokens(tokens) {}

    auto parse() -> Expected<double> {
        if (this->peek().type == Token::Type::End)
            return std::unexpected(makeError("Empty expression"));

        auto value = this->expression();
        if (!value)
            return value;

        auto const& trailing = this->peek();
        if (trailing.type == Token::Type::RightParen)
            return std::unexpected(makeError("Unbalanced parentheses: unexpected ')' at position " + std::to_string(trailing.position)));
        if (trailing.type != Token::Type::End)
            return std::unexpected(makeError("Unexpected token at position " + std::to_string(trailing.position)));
        return value;
    }

private:
    auto peek() const -> Token const& {
        return this->tokens[this->index];
    }

    auto advance() -> Token const& {
        auto const& token = this->tokens[this->index];
        if (token.type != Token::Type::End)
            ++this->index;
        return token;
    }

    auto expression() -> Expected<double> {
        auto lhs = this->term();
        if (!lhs)
            return lhs;

        auto result = *lhs;
        while (this->peek().type == Token::Type::Plus || this->peek().type == Token::Type::Minus) {
            auto const op  = this->advance().type;
            auto       rhs = this->term();
            if (!rhs)
                return rhs;
            result = op == Token::Type::Plus ? result + *rhs : result - *rhs;
        }
        return result;
    }

    auto term() -> Expected<double> {
        auto lhs = this->unary();
        if (!lhs)
            return lhs;

        auto result = *lhs;
        while (this->peek().type == Token::Type::Star || this->peek().type == Token::Type::Slash
               || this->peek().type == Token::Type::Percent) {
            auto const op  = this->advance().type;
            auto       rhs = this->unary();
            if (!rhs)
                return rhs;
            if (op == Token::Type::Star)
                result = result * *rhs;
            else if (op == Token::Type::Slash)
                result = result / *rhs;
            else
                result = std::fmod(result, *rhs);
        }
        return result;
    }

    auto unary() -> Expected<double> {
        if (this->depth >= MaxNestingDepth)
            return std::unexpected(makeError("Expression nested too deeply at position " + std::to_string(this->peek().position)));
        ++this->depth;
        auto result = this->signedPrimary();
        --this->depth;
        return result;
    }

    auto signedPrimary() -> Expected<double> {
        auto const type = this->peek().type;
        if (type == Token::Type::Minus || type == Token::Type::Plus) {
            this->advance();
            auto operand = this->unary();
            if (!operand)
                return operand;
            return type == Token::Type::Minus ? -*operand : *operand;
        }
        return this->primary();
    }

    auto primary() -> Expected<double> {
        auto const& token = this->advance();
        switch (token.type) {
        case Token::Type::Number:
            return token.value;
        case Token::Type::LeftParen: {
            auto inner = this->expression();
            if (!inner)
                return inner;
            if (this->peek().type != Token::Type::RightParen)
                return std::unexpected(makeError("Unbalanced parentheses: missing ')' for '(' at position " + std::to_string(token.position)));
            this->advance();
            return inner;
        }
        case Token::Type::End:
            return std::unexpected(makeError("Unexpected end of expression"));
        case Token::Type::RightParen:
            return std::unexpected(makeError("Unbalanced parentheses: unexpected ')' at position " + std::to_string(token.position)));
        default:
            return std::unexpected(makeError("Expected a number at position " + std::to_string(token.position)));
        }
    }

    std::vector<Token> const& tokens;
    std::size_t               index = 0;
    std::size_t               depth = 0;
};

} // namespace

auto tokenize(std::string_view text) -> Expected<std::vector<Token>> {
    std::vector<Token> tokens;
    std::size_t        i = 0;
    while (i < text.size()) {
        char const c = text[i];
        if (isSpace(c)) {
            ++i;
            continue;
        }

        if (isDigit(c) || c == '.') {
            auto const start = i;
            while (i < text.size() && (isDigit(text[i]) || text[i] == '.'))
                ++i;
            auto const lexeme = text.substr(start, i - start);

            double value = 0.0;
            auto const [ptr, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), value, std::chars_format::fixed);
            if (ec != std::errc{} || ptr != lexeme.data() + lexeme.size())
                return std::unexpected(makeError("Malformed number '" + std::string(lexeme) + "' at position " + std::to_string(start)));
            tokens.push_back(Token{Token::Type::Number, value, start});
            continue;
        }

        Token::Type type;
        switch (c) {
        case '+':
            type = Token::Type::Plus;
            break;
        case '-':
            type = Token::Type::Minus;
            break;
        case '*':
            type = Token::Type::Star;
            break;
        case '/':
            type = Token::Type::Slash;
            break;
        case '%':
            type = Token::Type::Percent;
            break;
        case '(':
            type = Token::Type::LeftParen;
            break;
        case ')':
            type = Token::Type::RightParen;
            break;
        default:
            return std::unexpected(makeError(std::string{"Unexpected character '"} + c + "' at position " + std::to_string(i)));
        }
        tokens.push_back(Token{type, 0.0, i});
        ++i;
    }
    tokens.push_back(Token{Token::Type::End, 0.0, text.size()});
    return tokens;
}

auto evaluate(std::string_view text) -> Expected<double> {
    auto tokens = tokenize(text);
    if (!tokens)
        return std::unexpected(tokens.error());
    Parser parser{*tokens};
    return parser.parse();
}

} // namespace DJ::Arithmetic
