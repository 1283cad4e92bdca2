#include "safecalc/errors.hpp"
#include "safecalc/tokenizer.hpp"
#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#undef NDEBUG
#include <cassert>

using namespace safecalc;

namespace {

std::vector<TokenType> types(std::string_view text)
{
    std::vector<TokenType> result;
    for (const Token& token : Tokenizer(text).tokenize()) {
        result.push_back(token.type);
    }
    return result;
}

}

void test_basic_tokens()
{
    auto tokens = Tokenizer("3 + 4 * (2 - 1)").tokenize();
    assert(tokens.size() == 10);

    assert(tokens[0].type == TokenType::Number && tokens[0].numericValue == 3.0);
    assert(tokens[1].type == TokenType::Operator && tokens[1].op == Operator::Add);
    assert(tokens[2].type == TokenType::Number && tokens[2].numericValue == 4.0);
    assert(tokens[3].type == TokenType::Operator && tokens[3].op == Operator::Multiply);
    assert(tokens[4].type == TokenType::LeftParen);
    assert(tokens[5].type == TokenType::Number && tokens[5].numericValue == 2.0);
    assert(tokens[6].type == TokenType::Operator && tokens[6].op == Operator::Subtract);
    assert(tokens[7].type == TokenType::Number && tokens[7].numericValue == 1.0);
    assert(tokens[8].type == TokenType::RightParen);
    assert(tokens[9].type == TokenType::End);

    assert(tokens[0].position == 0);
    assert(tokens[3].position == 6);
    assert(tokens[4].position == 8);
    assert(tokens[8].position == 14);
    assert(tokens[9].position == 15);
}

void test_whitespace()
{
    auto tokens = Tokenizer("  \t12\n*\r\n3  ").tokenize();
    assert(tokens.size() == 4);
    assert(tokens[0].text == "12" && tokens[0].position == 3);
    assert(tokens[1].op == Operator::Multiply);
    assert(tokens[2].numericValue == 3.0);

    assert(types("") == std::vector<TokenType>{TokenType::End});
    assert(types("   ") == std::vector<TokenType>{TokenType::End});
}

void test_number_formats()
{
    auto value = [](std::string_view text) {
        Token token = Tokenizer(text).next();
        assert(token.type == TokenType::Number);
        return token.numericValue;
    };

    assert(value("42") == 42.0);
    assert(value("3.25") == 3.25);
    assert(value(".5") == 0.5);
    assert(value("5.") == 5.0);
    assert(value("1.5e3") == 1500.0);
    assert(value("2E-2") == 0.02);
    assert(value("1e+2") == 100.0);
    assert(value("-7") == -7.0);
    assert(value("+7") == 7.0);
    assert(value("-.25") == -0.25);

    // Потеря значимости дает ноль с сохранением знака
    assert(value("1e-400") == 0.0 && !std::signbit(value("1e-400")));
    assert(value("-1e-400") == 0.0 && std::signbit(value("-1e-400")));
    assert(value("0.00001e-399") == 0.0);
    assert(value("4.9e-324") > 0.0);
}

void test_operator_symbols()
{
    auto tokens = Tokenizer("8 / 2 * 3 - 1 + 4").tokenize();
    assert(tokens[1].op == Operator::Divide && tokens[1].text == "/");
    assert(tokens[3].op == Operator::Multiply);
    assert(tokens[5].op == Operator::Subtract);
    assert(tokens[7].op == Operator::Add);

    for (char ch : {'+', '-', '*', '/'}) {
        std::string text = std::string("1 ") + ch + " 2";
        Token token = Tokenizer(text).tokenize()[1];
        assert(token.type == TokenType::Operator);
        assert(isOperatorSymbol(token.text[0]));
    }
}

void test_sign_folding()
{
    using T = TokenType;

    // Знак в позиции операнда становится частью числа
    assert((types("-3 + 4") == std::vector<T>{T::Number, T::Operator, T::Number, T::End}));
    assert((types("1 - -3") == std::vector<T>{T::Number, T::Operator, T::Number, T::End}));
    assert((types("(-2)") == std::vector<T>{T::LeftParen, T::Number, T::RightParen, T::End}));
    assert((types("1 + +2") == std::vector<T>{T::Number, T::Operator, T::Number, T::End}));

    // После операнда знак остается бинарным оператором
    assert((types("2-3") == std::vector<T>{T::Number, T::Operator, T::Number, T::End}));
    assert((types("2 -3") == std::vector<T>{T::Number, T::Operator, T::Number, T::End}));
    assert((types("(1)-2") ==
            std::vector<T>{T::LeftParen, T::Number, T::RightParen, T::Operator, T::Number, T::End}));

    // Знак, отделенный пробелом, не сворачивается
    assert((types("1 + + 2") ==
            std::vector<T>{T::Number, T::Operator, T::Operator, T::Number, T::End}));
    assert((types("-(1)") ==
            std::vector<T>{T::Operator, T::LeftParen, T::Number, T::RightParen, T::End}));

    auto tokens = Tokenizer("1--3").tokenize();
    assert(tokens[1].op == Operator::Subtract);
    assert(tokens[2].numericValue == -3.0);
    assert(tokens[2].text == "-3");
}

void test_lazy_next()
{
    Tokenizer tokenizer("1 $");
    Token first = tokenizer.next();
    assert(first.type == TokenType::Number);

    // Ошибка возникает только при запросе следующего токена
    assert(throws<LexError>([&] { tokenizer.next(); }));

    Tokenizer finished("7");
    assert(finished.next().type == TokenType::Number);
    assert(finished.next().type == TokenType::End);
    assert(finished.next().type == TokenType::End);
}

void test_lex_errors()
{
    try {
        Tokenizer("2 $ 3").tokenize();
        assert(false);
    } catch (const LexError& e) {
        assert(e.position() == 2);
    }

    assert(throws<LexError>([] { Tokenizer("x").tokenize(); }));
    assert(throws<LexError>([] { Tokenizer("2 ^ 3").tokenize(); }));
    assert(throws<LexError>([] { Tokenizer("1 % 2").tokenize(); }));
    assert(throws<LexError>([] { Tokenizer("__import__('os')").tokenize(); }));
    assert(throws<LexError>([] { Tokenizer("e5").tokenize(); }));
}

void test_invalid_literals()
{
    assert(throws<InvalidOperandError>([] { Tokenizer("2e").tokenize(); }));
    assert(throws<InvalidOperandError>([] { Tokenizer("2e+").tokenize(); }));
    assert(throws<InvalidOperandError>([] { Tokenizer("1e999").tokenize(); }));
    assert(throws<InvalidOperandError>([] { Tokenizer("-1e999").tokenize(); }));
    assert(throws<InvalidOperandError>([] { Tokenizer("0.001e312").tokenize(); }));

    try {
        Tokenizer("1 + 3E").tokenize();
        assert(false);
    } catch (const InvalidOperandError& e) {
        assert(e.position() == 4);
    }
}

int main()
{
    try {
        test_basic_tokens();
        test_whitespace();
        test_number_formats();
        test_operator_symbols();
        test_sign_folding();
        test_lazy_next();
        test_lex_errors();
        test_invalid_literals();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return -1;
    }
}
