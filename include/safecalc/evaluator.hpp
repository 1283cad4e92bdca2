#pragma once

#include <string_view>

#include "safecalc/expression.hpp"

namespace safecalc {

// Фасад для вычисления выражений, заданных строкой.
// Объединяет токенизацию, построение дерева и вычисление.
// Не хранит состояния между вызовами, поэтому один экземпляр можно
// использовать из нескольких потоков.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;
    explicit ExpressionEvaluator(const BuildOptions& options) : options(options) {}

    // Пример: "2 + 2 * 2" -> 6.0
    // Выбрасывает исключения из errors.hpp при ошибках разбора или вычисления.
    double evaluate(std::string_view expression) const;

    const BuildOptions& buildOptions() const noexcept { return options; }

private:
    BuildOptions options;
};

} // namespace safecalc
