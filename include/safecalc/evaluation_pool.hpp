#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "safecalc/csv_writer.hpp"
#include "safecalc/evaluator.hpp"

namespace safecalc {

// Строка входного файла с её номером
struct ExpressionLine {
    std::size_t number;
    std::string text;
};

// Пул потоков для параллельного вычисления строк.
// Деревья выражений не разделяются между задачами, поэтому
// синхронизация нужна только для очереди.
class EvaluationPool {
public:
    // evaluator должен жить дольше пула
    EvaluationPool(std::size_t threadCount, const ExpressionEvaluator& evaluator);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    // Ставит строку в очередь. Ошибки выражения не выбрасываются,
    // а попадают в EvaluationRecord со статусом "error".
    std::future<EvaluationRecord> submit(ExpressionLine line);

    // Количество уже вычисленных строк (для прогресс-бара)
    std::size_t completed() const noexcept { return done.load(); }

    std::size_t threadCount() const noexcept { return workers.size(); }

    // Вычисление одной строки без очереди
    static EvaluationRecord evaluateLine(const ExpressionEvaluator& evaluator,
                                         const ExpressionLine& line);

private:
    struct Job {
        ExpressionLine line;
        std::promise<EvaluationRecord> promise;
    };

    const ExpressionEvaluator& evaluator;
    std::vector<std::thread> workers;
    std::queue<Job> jobs;

    std::mutex mutex;
    std::condition_variable condition;
    bool stop = false;
    std::atomic<std::size_t> done{0};

    void workerLoop();
};

} // namespace safecalc
