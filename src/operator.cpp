#include "safecalc/operator.hpp"

#include "safecalc/errors.hpp"

#include <string>

namespace safecalc {

Operator fromSymbol(std::string_view symbol, std::size_t position) {
    if (symbol.size() == 1) {
        switch (symbol.front()) {
        case '+':
            return Operator::Add;
        case '-':
            return Operator::Subtract;
        case '*':
            return Operator::Multiply;
        case '/':
            return Operator::Divide;
        default:
            break;
        }
    }
    throw UnknownOperatorError("Неизвестный оператор '" + std::string(symbol) +
                                   "', допустимы только '+', '-', '*', '/'",
                               position);
}

bool isOperatorSymbol(char ch) noexcept {
    return ch == '+' || ch == '-' || ch == '*' || ch == '/';
}

int precedence(Operator op) noexcept {
    switch (op) {
    case Operator::Multiply:
    case Operator::Divide:
        return 2;
    case Operator::Add:
    case Operator::Subtract:
        return 1;
    }
    return 0;
}

char symbol(Operator op) noexcept {
    switch (op) {
    case Operator::Add:
        return '+';
    case Operator::Subtract:
        return '-';
    case Operator::Multiply:
        return '*';
    case Operator::Divide:
        return '/';
    }
    return '?';
}

double apply(Operator op, double left, double right) {
    switch (op) {
    case Operator::Add:
        return left + right;
    case Operator::Subtract:
        return left - right;
    case Operator::Multiply:
        return left * right;
    case Operator::Divide:
        // Сравнение точное: делитель 1e-300 допустим, 0.0 и -0.0 нет
        if (right == 0.0) {
            throw DivisionByZeroError("Деление на ноль");
        }
        return left / right;
    }
    throw UnknownOperatorError("Неизвестная бинарная операция");
}

} // namespace safecalc
