#pragma once

#include <cstddef>
#include <string>

namespace safecalc {

// Удаляет пробелы и табуляции по краям строки
std::string trim(const std::string& value);

// Безопасный парсинг положительного целого числа из строки.
// Выбрасывает std::runtime_error для нуля и некорректного текста.
std::size_t parseCount(const std::string& value);

// Выводит приглашение и читает строку из std::cin.
// Возвращает false, если ввод закончился (EOF).
bool promptLine(const std::string& prompt, std::string& line);

// Признак выхода из интерактивного режима: пустая строка, "exit", "quit", "выход"
bool isExitCommand(const std::string& line);

} // namespace safecalc
