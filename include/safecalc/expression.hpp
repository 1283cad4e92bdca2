#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "safecalc/operator.hpp"

namespace safecalc {

class Expression;
class ExpressionBuilder;

// Ограничения на размер дерева, защищающие от переполнения стека
// при рекурсивном вычислении.
struct BuildOptions {
    std::size_t maxDepth = 256;         // Максимальная вложенность скобок
    std::size_t maxTreeHeight = 10000;  // Максимальная высота итогового дерева
};

// Операнд выражения: числовой литерал или вложенное выражение,
// которым операнд владеет единолично.
class Operand {
public:
    // Только конечные значения: inf и nan выбрасывают InvalidOperandError
    Operand(double value);
    // Текст литерала; выбрасывает InvalidOperandError, если это не число
    Operand(std::string_view literal);
    Operand(const char* literal);
    Operand(Expression expression);

    Operand(Operand&&) noexcept;
    Operand& operator=(Operand&&) noexcept;
    ~Operand();

    bool isLiteral() const noexcept;

    // Значение литерала (только для isLiteral())
    double literal() const;

    // Вложенное выражение (только для !isLiteral())
    const Expression& expression() const;

    // Значение операнда: литерал или результат вычисления поддерева
    double resolve() const;

private:
    friend class ExpressionBuilder;

    // Забирает поддерево у операнда (только для !isLiteral())
    Expression takeExpression();

    std::variant<double, std::unique_ptr<Expression>> storage;
};

// Неизменяемый узел дерева выражения: левый операнд, оператор, правый операнд.
// Строится снизу вверх и после создания не меняется, поэтому одно дерево
// можно вычислять из нескольких потоков одновременно.
class Expression {
public:
    // Узел из трёх уже выделенных частей. Приоритеты не учитываются:
    // группировку должен разрешить вызывающий код.
    static Expression parse(Operand left, Operator op, Operand right);

    // Вариант со строковым оператором; выбрасывает UnknownOperatorError
    static Expression parse(Operand left, std::string_view op, Operand right);

    // Строит дерево из произвольной строки с учётом приоритетов и скобок.
    // Выбрасывает ошибки разбора из errors.hpp; частично построенное
    // дерево наружу не попадает.
    static Expression build(std::string_view text, const BuildOptions& options = {});

    // Вырожденное выражение из одного числа (например, ввод "42").
    // Выбрасывает InvalidOperandError для inf и nan.
    static Expression literal(double value);

    // Перемещённое выражение можно только уничтожить.
    // Присваивания нет: существующий узел не перезаписывается.
    Expression(Expression&&) noexcept = default;
    Expression& operator=(Expression&&) = delete;

    // Рекурсивно вычисляет дерево (левое поддерево, правое, затем оператор).
    // Чистая функция: повторный вызов даёт тот же результат.
    // Выбрасывает DivisionByZeroError из любого поддерева.
    double calculate() const;

    bool isLiteral() const noexcept { return !oper.has_value(); }

    const Operand& left() const noexcept { return lhs; }
    const Operand& right() const noexcept { return rhs; }

    // Оператор узла; пусто для вырожденного литерала
    std::optional<Operator> op() const noexcept { return oper; }

    // Канонический инфиксный вид: "2 + 3 * 4", "(2 + 3) * 4".
    // Скобки ставятся только там, где без них изменилась бы форма дерева.
    std::string toString() const;

    // Сравнение по значению; вычисляет обе стороны
    bool operator==(const Expression& other) const;
    bool operator==(double value) const;

private:
    Expression(Operand left, std::optional<Operator> op, Operand right);

    Operand lhs;
    std::optional<Operator> oper;
    Operand rhs;
};

} // namespace safecalc
