#include "safecalc/puzzle.hpp"

#include "safecalc/errors.hpp"

#include <cmath>
#include <stdexcept>

namespace safecalc {

namespace {

constexpr double kTolerance = 1e-9;
constexpr char kOperators[] = {'+', '-', '*', '/'};

} // namespace

PuzzleGenerator::PuzzleGenerator() : gen(std::random_device{}()) {}

PuzzleGenerator::PuzzleGenerator(unsigned seed) : gen(seed) {}

std::string PuzzleGenerator::generate(const std::vector<std::string>& numbers) {
    std::string result;
    std::size_t openGroups = 0;

    for (std::size_t i = 0; i < numbers.size(); ++i) {
        bool opened = openGroup(gen);
        if (opened) {
            result.push_back('(');
            ++openGroups;
        }
        result.append(numbers[i]);

        // Скобка вокруг одного числа бессмысленна
        if (openGroups > 0 && !opened && closeGroup(gen)) {
            result.push_back(')');
            --openGroups;
        }
        if (i + 1 < numbers.size()) {
            result.push_back(kOperators[op_dist(gen)]);
        }
    }

    result.append(openGroups, ')');
    return result;
}

PuzzleResult solvePuzzle(const std::vector<std::string>& numbers, double goal,
                         std::size_t maxAttempts, PuzzleGenerator& generator,
                         const ExpressionEvaluator& evaluator) {
    if (numbers.empty()) {
        throw std::invalid_argument("Список чисел для головоломки пуст");
    }

    PuzzleResult result;
    while (result.attempts < maxAttempts) {
        std::string candidate = generator.generate(numbers);
        ++result.attempts;

        double value = 0.0;
        try {
            value = evaluator.evaluate(candidate);
        }
        catch (const DivisionByZeroError&) {
            ++result.divisionByZero;
            continue;
        }

        if (std::abs(value - goal) < kTolerance) {
            result.expression = std::move(candidate);
            return result;
        }
    }
    return result;
}

} // namespace safecalc
