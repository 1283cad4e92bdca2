#include "safecalc/modes.hpp"

#include "safecalc/console.hpp"
#include "safecalc/errors.hpp"
#include "safecalc/expression.hpp"
#include "safecalc/user_input.hpp"

#include <iostream>

namespace safecalc {

namespace {

// Строит и вычисляет выражение; ошибки выражения выводятся, а не выбрасываются
bool evaluateAndPrint(const std::string& text, const BuildOptions& options) {
    try {
        Expression tree = Expression::build(text, options);
        printResult(tree.toString(), tree.calculate());
        return true;
    }
    catch (const Error& ex) {
        printExpressionError(text, ex);
        return false;
    }
}

} // namespace

int runReplMode(const CliOptions& options) {
    printHeader();
    std::cout << "Допустимы числа, операторы " << Color::CYAN << "+ - * /" << Color::RESET
        << " и скобки. Пустая строка или " << Color::CYAN << "exit" << Color::RESET
        << ": выход.\n\n";

    std::string line;
    while (promptLine("> ", line)) {
        if (isExitCommand(line)) {
            break;
        }
        evaluateAndPrint(line, options.build);
    }
    std::cout << "\n";
    return 0;
}

int runEvalMode(const CliOptions& options) {
    // Аргументы, разбитые оболочкой, собираются обратно: safecalc eval 2 + 3
    std::string text;
    for (const auto& argument : options.arguments) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text.append(argument);
    }
    return evaluateAndPrint(text, options.build) ? 0 : 1;
}

} // namespace safecalc
