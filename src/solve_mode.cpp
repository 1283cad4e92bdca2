#include "safecalc/modes.hpp"

#include "safecalc/console.hpp"
#include "safecalc/literal.hpp"
#include "safecalc/puzzle.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace safecalc {

int runSolveMode(const CliOptions& options) {
    printHeader();
    std::cout << Color::BOLD << Color::CYAN << "Режим поиска выражения\n" << Color::RESET << "\n";

    double goal = parseLiteral(options.arguments.front());
    std::vector<std::string> numbers(options.arguments.begin() + 1, options.arguments.end());
    if (numbers.empty()) {
        numbers.assign(5, "5");
    }

    std::string numbersText;
    for (const auto& number : numbers) {
        numbersText += number + " ";
    }

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Цель:          " << Color::CYAN << formatNumber(goal) << Color::RESET << "\n";
    std::cout << "  Числа:         " << Color::YELLOW << numbersText << Color::RESET << "\n";
    std::cout << "  Попыток:       " << Color::CYAN << options.attempts << Color::RESET << "\n\n";

    PuzzleGenerator generator = options.seed ? PuzzleGenerator(*options.seed) : PuzzleGenerator();
    ExpressionEvaluator evaluator(options.build);

    auto start = std::chrono::high_resolution_clock::now();
    PuzzleResult result = solvePuzzle(numbers, goal, options.attempts, generator, evaluator);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start);

    std::cout << "  Проверено выражений: " << result.attempts
        << " (деление на ноль: " << result.divisionByZero << "), "
        << duration.count() << " мс\n\n";

    if (!result.expression) {
        std::cout << Color::YELLOW << "Выражение не найдено." << Color::RESET << "\n\n";
        return 1;
    }

    std::cout << Color::GREEN << Color::BOLD << "✓ " << *result.expression << " = "
        << formatNumber(goal) << Color::RESET << "\n\n";
    return 0;
}

} // namespace safecalc
