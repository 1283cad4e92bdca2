#include "safecalc/tokenizer.hpp"

#include "safecalc/errors.hpp"
#include "safecalc/literal.hpp"

#include <cctype>
#include <string>

namespace safecalc {

Tokenizer::Tokenizer(std::string_view sourceText) : source(sourceText) {}

Token Tokenizer::next() {
    skipWhitespace();
    if (isAtEnd()) {
        return {TokenType::End, 0.0, Operator::Add, "", index};
    }

    char ch = peek();
    if (ch == '(') {
        expectOperand = true;
        return makeSymbol(TokenType::LeftParen);
    }
    if (ch == ')') {
        expectOperand = false;
        return makeSymbol(TokenType::RightParen);
    }
    if (isOperatorSymbol(ch)) {
        // Знак числа, а не бинарный оператор
        if (expectOperand && (ch == '+' || ch == '-')) {
            std::size_t length = literalLength(source, index);
            if (length > 0) {
                return makeNumber(length);
            }
        }
        expectOperand = true;
        Token token = makeSymbol(TokenType::Operator);
        token.op = fromSymbol(token.text, token.position);
        return token;
    }

    std::size_t length = literalLength(source, index);
    if (length > 0) {
        return makeNumber(length);
    }
    throw LexError("Недопустимый символ '" + std::string(1, ch) + "' в позиции " +
                       std::to_string(index),
                   index);
}

std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::End) {
            return tokens;
        }
    }
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        ++index;
    }
}

Token Tokenizer::makeNumber(std::size_t length) {
    std::size_t start = index;
    std::string_view text = source.substr(start, length);
    index += length;
    expectOperand = false;
    return {TokenType::Number, parseLiteral(text, start), Operator::Add, std::string(text), start};
}

Token Tokenizer::makeSymbol(TokenType type) {
    std::size_t start = index++;
    return {type, 0.0, Operator::Add, std::string(1, source[start]), start};
}

} // namespace safecalc
