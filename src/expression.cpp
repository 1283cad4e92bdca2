#include "safecalc/expression.hpp"

#include "safecalc/errors.hpp"
#include "safecalc/expression_builder.hpp"
#include "safecalc/literal.hpp"

#include <cmath>
#include <utility>

namespace safecalc {

Operand::Operand(double value) : storage(value) {
    // Текстовая форма inf и nan не читается обратно
    if (!std::isfinite(value)) {
        throw InvalidOperandError("Операнд должен быть конечным числом, получено '" +
                                  formatNumber(value) + "'");
    }
}

Operand::Operand(std::string_view literal) : storage(parseLiteral(literal)) {}

Operand::Operand(const char* literal) : Operand(std::string_view(literal)) {}

Operand::Operand(Expression expression)
    : storage(std::make_unique<Expression>(std::move(expression))) {}

Operand::Operand(Operand&&) noexcept = default;
Operand& Operand::operator=(Operand&&) noexcept = default;
Operand::~Operand() = default;

bool Operand::isLiteral() const noexcept {
    return std::holds_alternative<double>(storage);
}

double Operand::literal() const {
    return std::get<double>(storage);
}

const Expression& Operand::expression() const {
    return *std::get<std::unique_ptr<Expression>>(storage);
}

Expression Operand::takeExpression() {
    return std::move(*std::get<std::unique_ptr<Expression>>(storage));
}

double Operand::resolve() const {
    if (isLiteral()) {
        return literal();
    }
    return expression().calculate();
}

namespace {

// Вывод операнда с учётом приоритета родительского оператора
std::string render(const Operand& operand, Operator parent, bool isRight) {
    if (operand.isLiteral()) {
        return formatNumber(operand.literal());
    }

    const Expression& child = operand.expression();
    std::string text = child.toString();
    if (child.isLiteral()) {
        return text;
    }

    // Правый операнд равного приоритета тоже в скобках: a - (b - c)
    int childPrecedence = precedence(*child.op());
    int parentPrecedence = precedence(parent);
    if (childPrecedence < parentPrecedence || (isRight && childPrecedence == parentPrecedence)) {
        return "(" + text + ")";
    }
    return text;
}

} // namespace

Expression::Expression(Operand left, std::optional<Operator> op, Operand right)
    : lhs(std::move(left)), oper(op), rhs(std::move(right)) {}

Expression Expression::parse(Operand left, Operator op, Operand right) {
    return Expression(std::move(left), op, std::move(right));
}

Expression Expression::parse(Operand left, std::string_view op, Operand right) {
    return Expression(std::move(left), fromSymbol(op), std::move(right));
}

Expression Expression::build(std::string_view text, const BuildOptions& options) {
    ExpressionBuilder builder(text, options);
    return builder.build();
}

Expression Expression::literal(double value) {
    return Expression(Operand(value), std::nullopt, Operand(0.0));
}

double Expression::calculate() const {
    if (!oper) {
        return lhs.resolve();
    }
    double leftValue = lhs.resolve();
    double rightValue = rhs.resolve();
    return apply(*oper, leftValue, rightValue);
}

std::string Expression::toString() const {
    if (!oper) {
        return render(lhs, Operator::Add, false);
    }
    return render(lhs, *oper, false) + ' ' + symbol(*oper) + ' ' + render(rhs, *oper, true);
}

bool Expression::operator==(const Expression& other) const {
    return calculate() == other.calculate();
}

bool Expression::operator==(double value) const {
    return calculate() == value;
}

} // namespace safecalc
