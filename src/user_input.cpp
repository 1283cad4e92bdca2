#include "safecalc/user_input.hpp"
#include "safecalc/console.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace safecalc {

std::string trim(const std::string& value) {
    std::size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    std::size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::size_t parseCount(const std::string& value) {
    std::string text = trim(value);
    bool allDigits = !text.empty() && std::all_of(text.begin(), text.end(), [](char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    });
    if (!allDigits) {
        throw std::runtime_error("Некорректное числовое значение '" + value + "'");
    }

    std::size_t result = 0;
    try {
        result = std::stoul(text);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Слишком большое числовое значение '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

bool promptLine(const std::string& prompt, std::string& line) {
    std::cout << Color::BOLD << prompt << Color::RESET << std::flush;
    if (!std::getline(std::cin, line)) {
        return false;
    }
    return true;
}

bool isExitCommand(const std::string& line) {
    std::string command = trim(line);
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return command.empty() || command == "exit" || command == "quit" || command == "выход";
}

} // namespace safecalc
