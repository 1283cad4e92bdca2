#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "safecalc/expression.hpp"

namespace safecalc {

// Ошибка в аргументах командной строки
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Mode {
    Repl,   // Интерактивный ввод выражений
    Eval,   // Одно выражение из аргументов
    Batch,  // Файл с выражениями -> CSV
    Solve,  // Головоломка "пять пятёрок"
    Help
};

// Конфигурация запуска
struct CliOptions {
    Mode mode = Mode::Repl;
    std::vector<std::string> arguments;     // Позиционные аргументы после режима
    std::size_t threads = 0;                // 0: по числу ядер
    std::size_t attempts = 1000;
    std::optional<unsigned> seed;
    BuildOptions build;
};

// Разбор argv. Выбрасывает UsageError при некорректных аргументах.
CliOptions parseCliOptions(int argc, const char* const* argv);

// Текст справки по запуску
std::string usage();

// Количество потоков для пакетного режима (по числу ядер, если не задано)
std::size_t resolveThreadCount(const CliOptions& options);

} // namespace safecalc
