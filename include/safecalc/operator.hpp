#pragma once

#include <cstddef>
#include <string_view>

namespace safecalc {

// Замкнутый набор поддерживаемых арифметических операторов.
// Новые операторы не могут появиться во время выполнения: каждое место
// вычисления перебирает все варианты через switch.
enum class Operator {
    Add,
    Subtract,
    Multiply,
    Divide
};

// Разрешает символ оператора ("+", "-", "*", "/").
// Выбрасывает UnknownOperatorError для любого другого текста.
Operator fromSymbol(std::string_view symbol, std::size_t position = static_cast<std::size_t>(-1));

// Проверка без исключения
bool isOperatorSymbol(char ch) noexcept;

// Приоритет: 2 для * и /, 1 для + и - (больший связывает сильнее)
int precedence(Operator op) noexcept;

// Отображаемый символ оператора
char symbol(Operator op) noexcept;

// Применяет оператор к двум числам.
// Для деления выбрасывает DivisionByZeroError, если делитель равен нулю.
double apply(Operator op, double left, double right);

} // namespace safecalc
