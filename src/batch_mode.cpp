#include "safecalc/modes.hpp"

#include "safecalc/batch.hpp"
#include "safecalc/console.hpp"
#include "safecalc/file_utils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace safecalc {

namespace {

// Прогресс-бар; работает в отдельном потоке, пока не обработаны все строки
// или не выставлен флаг finished
void displayProgress(const EvaluationPool& pool, std::size_t total,
                     const std::atomic<bool>& finished) {
    const int barWidth = 50;
    while (!finished && pool.completed() < total) {
        std::size_t current = pool.completed();
        double progress = static_cast<double>(current) / total;
        int filled = static_cast<int>(barWidth * progress);

        std::cout << "\r  " << Color::CYAN << "[" << std::string(filled, '#')
            << std::string(barWidth - filled, '.') << "] " << Color::BOLD
            << std::setw(3) << static_cast<int>(progress * 100.0) << "%" << Color::RESET
            << " (" << current << "/" << total << ")" << std::flush;

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::cout << "\r  " << Color::GREEN << "[" << std::string(barWidth, '#') << "] "
        << Color::BOLD << "100%" << Color::RESET << " (" << total << "/" << total << ")\n";
}

} // namespace

int runBatchMode(const CliOptions& options) {
    printHeader();

    std::filesystem::path inputPath = options.arguments.front();
    if (!std::filesystem::is_regular_file(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    std::filesystem::path outputPath = options.arguments.size() > 1
        ? std::filesystem::path(options.arguments[1])
        : defaultResultsPath(inputPath);
    if (outputPath.extension() != ".csv") {
        outputPath.replace_extension(".csv");
    }
    std::size_t threadCount = resolveThreadCount(options);

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    auto startCount = std::chrono::high_resolution_clock::now();
    std::size_t totalLines = countLinesInFile(inputPath);
    auto countDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - startCount);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " ("
        << totalLines << " строк, " << countDuration.count() << " мс)\n\n";

    std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
    auto startProcess = std::chrono::high_resolution_clock::now();

    ExpressionEvaluator evaluator(options.build);
    CsvWriter writer(outputPath);
    EvaluationPool pool(threadCount, evaluator);

    std::atomic<bool> finished{false};
    std::thread progressThread(displayProgress, std::cref(pool), totalLines, std::cref(finished));

    BatchSummary summary;
    try {
        summary = processExpressionsStreaming(inputPath, pool, writer);
    }
    catch (const std::exception&) {
        finished = true;
        progressThread.join();
        throw;
    }
    finished = true;
    progressThread.join();

    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - startProcess);

    std::cout << "\n" << Color::BOLD << "Итого:\n" << Color::RESET;
    std::cout << "  Успешно:  " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
    std::cout << "  С ошибкой: " << Color::RED << summary.failed << Color::RESET << "\n";
    std::cout << "  Время:    " << processDuration.count() << " мс\n\n";
    std::cout << Color::GREEN << "Результаты сохранены: " << writer.path() << Color::RESET << "\n\n";
    return 0;
}

} // namespace safecalc
