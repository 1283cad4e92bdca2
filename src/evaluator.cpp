#include "safecalc/evaluator.hpp"

namespace safecalc {

// 1. Токенизация и построение дерева (Expression::build)
// 2. Рекурсивное вычисление дерева
double ExpressionEvaluator::evaluate(std::string_view expression) const {
    Expression tree = Expression::build(expression, options);
    return tree.calculate();
}

} // namespace safecalc
