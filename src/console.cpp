#include "safecalc/console.hpp"

#include "safecalc/literal.hpp"

#include <iostream>
#include <string>

namespace safecalc {

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Безопасный калькулятор арифметических выражений        ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::exception& ex) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << ex.what() << Color::RESET << "\n";
}

void printExpressionError(std::string_view source, const Error& error) {
    std::cerr << "  " << Color::RED << Color::BOLD << "✗ " << error.kind() << ": "
        << Color::RESET << Color::RED << error.what() << Color::RESET << "\n";

    // Указатель на место ошибки (позиция может совпадать с концом строки)
    if (error.position() != Error::npos && error.position() <= source.size()) {
        std::cerr << "    " << Color::GRAY << source << Color::RESET << "\n";
        std::cerr << "    " << std::string(error.position(), ' ')
            << Color::YELLOW << "^" << Color::RESET << "\n";
    }
}

void printResult(std::string_view expression, double value) {
    std::cout << "  " << Color::GRAY << expression << Color::RESET << " = "
        << Color::BOLD << Color::GREEN << formatNumber(value) << Color::RESET << "\n";
}

} // namespace safecalc
