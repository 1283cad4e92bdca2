#pragma once

#include <cstddef>
#include <string>

#include "safecalc/operator.hpp"

namespace safecalc {

enum class TokenType {
    Number,     // Числовой литерал (знак уже учтён)
    Operator,   // + - * /
    LeftParen,  // (
    RightParen, // )
    End         // Конец входной строки
};

struct Token {
    TokenType type;
    double numericValue = 0.0;       // Значение литерала (для Number)
    Operator op = Operator::Add;     // Оператор (для Operator)
    std::string text;                // Исходный текст токена
    std::size_t position = 0;        // Смещение от начала строки
};

} // namespace safecalc
