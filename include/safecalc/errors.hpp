#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace safecalc {

// Базовый класс всех ошибок разбора и вычисления выражений.
// Все ошибки восстановимы: вызывающий код может, например, переспросить ввод.
class Error : public std::runtime_error {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    Error(const std::string& message, std::size_t position = npos)
        : std::runtime_error(message), pos(position) {}

    // Позиция во входной строке (npos, если неизвестна)
    std::size_t position() const noexcept { return pos; }

    // Стабильное имя вида ошибки (используется в CSV-отчете)
    virtual const char* kind() const noexcept = 0;

private:
    std::size_t pos;
};

// Недопустимый символ во входной строке
class LexError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "LexError"; }
};

// Символ не соответствует ни одному поддерживаемому оператору
class UnknownOperatorError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "UnknownOperatorError"; }
};

// Литерал не является корректным числом
class InvalidOperandError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "InvalidOperandError"; }
};

class UnmatchedParenthesisError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "UnmatchedParenthesisError"; }
};

// Пустой ввод
class EmptyExpressionError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "EmptyExpressionError"; }
};

// Нарушен порядок операндов и операторов (два оператора или два операнда подряд)
class MalformedExpressionError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "MalformedExpressionError"; }
};

class DivisionByZeroError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "DivisionByZeroError"; }
};

// Превышена допустимая глубина вложенности скобок или высота дерева
class NestingTooDeepError final : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "NestingTooDeepError"; }
};

} // namespace safecalc
