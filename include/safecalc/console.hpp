#pragma once

#include <exception>
#include <string_view>

#include "safecalc/errors.hpp"

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

namespace safecalc {

// Вывод приветственного заголовка программы
void printHeader();

// Сообщение об ошибке в stderr
void printError(const std::exception& ex);

// Ошибка разбора или вычисления: вид ошибки, сообщение и,
// если позиция известна, исходная строка с указателем '^' под ней
void printExpressionError(std::string_view source, const Error& error);

// Результат вычисления: "  2 + 3 * 4 = 14"
void printResult(std::string_view expression, double value);

} // namespace safecalc
