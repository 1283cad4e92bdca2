// Поиск выражения для головоломки "пять пятёрок":
// из заданных чисел (по умолчанию 5 5 5 5 5), арифметических операторов и скобок
// нужно составить выражение с заданным значением.
// Выражения генерируются случайно и вычисляются безопасным калькулятором.
//

#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "safecalc/evaluator.hpp"

namespace safecalc {

// Генератор случайных выражений над фиксированным набором чисел.
// Числа используются по порядку, каждое ровно один раз.
class PuzzleGenerator {
public:
    PuzzleGenerator();
    explicit PuzzleGenerator(unsigned seed);

    // Пример для {5, 5, 5}: "(5*5)-5", "5/(5+5)"
    std::string generate(const std::vector<std::string>& numbers);

private:
    std::mt19937 gen;
    std::bernoulli_distribution openGroup{0.3};  // Число начинает новую скобку
    std::bernoulli_distribution closeGroup{0.5}; // Скобка закрывается после числа
    std::uniform_int_distribution<> op_dist{0, 3};
};

struct PuzzleResult {
    std::optional<std::string> expression; // Найденное выражение
    std::size_t attempts = 0;              // Сколько выражений проверено
    std::size_t divisionByZero = 0;        // Сколько попыток отброшено из-за деления на ноль
};

// Проверяет не больше maxAttempts случайных выражений.
// Значение считается совпавшим с целью с точностью до 1e-9.
PuzzleResult solvePuzzle(const std::vector<std::string>& numbers, double goal,
                         std::size_t maxAttempts, PuzzleGenerator& generator,
                         const ExpressionEvaluator& evaluator);

} // namespace safecalc
