#pragma once

#include "safecalc/cli_options.hpp"

namespace safecalc {

// Каждый режим возвращает код завершения процесса.
// Ошибки выражений обрабатываются внутри режима, прочие (ввод-вывод)
// выбрасываются наружу как std::exception.

// Интерактивный цикл: выражение -> результат, пока не введена пустая строка или exit
int runReplMode(const CliOptions& options);

// Одно выражение из аргументов; 1, если выражение некорректно
int runEvalMode(const CliOptions& options);

// Потоковая обработка файла с выражениями в пуле потоков, результат в CSV
int runBatchMode(const CliOptions& options);

// Поиск выражения для головоломки "пять пятёрок"; 1, если не найдено
int runSolveMode(const CliOptions& options);

} // namespace safecalc
