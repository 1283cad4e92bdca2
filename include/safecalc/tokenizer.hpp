#pragma once

#include <string_view>
#include <vector>

#include "safecalc/token.hpp"

namespace safecalc {

// Лексический анализатор.
// Выдаёт токены по одному (next), пропуская пробельные символы.
// Знак '+' или '-' в позиции, где ожидается операнд (начало строки, после '('
// или после оператора), и за которым сразу следует цифра или точка,
// входит в числовой литерал: "-3 + 4", "1 + +2", "1--3".
class Tokenizer {
public:
    // Строка должна жить дольше токенизатора
    explicit Tokenizer(std::string_view sourceText);

    // Следующий токен; после конца строки всегда возвращает End.
    // Выбрасывает LexError при недопустимом символе
    // и InvalidOperandError при некорректном числе.
    Token next();

    // Все токены сразу, последним идёт End
    std::vector<Token> tokenize();

private:
    std::string_view source;
    std::size_t index = 0;
    bool expectOperand = true; // Следующим ожидается операнд

    bool isAtEnd() const;
    char peek() const;
    void skipWhitespace();

    // Считывает литерал, начиная с текущей позиции
    Token makeNumber(std::size_t length);
    Token makeSymbol(TokenType type);
};

} // namespace safecalc
