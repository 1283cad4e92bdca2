#include "safecalc/evaluation_pool.hpp"

#include "safecalc/errors.hpp"

#include <stdexcept>
#include <utility>

namespace safecalc {

EvaluationPool::EvaluationPool(std::size_t threadCount, const ExpressionEvaluator& evaluator)
    : evaluator(evaluator) {
    if (threadCount == 0) {
        threadCount = 1;
    }
    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

// Оставшиеся в очереди задачи выполняются до остановки потоков
EvaluationPool::~EvaluationPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<EvaluationRecord> EvaluationPool::submit(ExpressionLine line) {
    Job job{std::move(line), std::promise<EvaluationRecord>()};
    std::future<EvaluationRecord> result = job.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        jobs.push(std::move(job));
    }
    condition.notify_one();
    return result;
}

EvaluationRecord EvaluationPool::evaluateLine(const ExpressionEvaluator& evaluator,
                                              const ExpressionLine& line) {
    EvaluationRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;
    try {
        record.value = evaluator.evaluate(line.text);
        record.status = "success";
    }
    catch (const Error& ex) {
        record.status = "error";
        record.errorKind = ex.kind();
        record.message = ex.what();
    }
    return record;
}

void EvaluationPool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            condition.wait(lock, [this]() { return stop || !jobs.empty(); });
            if (stop && jobs.empty()) {
                return;
            }
            job = std::move(jobs.front());
            jobs.pop();
        }

        // Прочие исключения (например, std::bad_alloc) передаются через future
        try {
            job.promise.set_value(evaluateLine(evaluator, job.line));
        }
        catch (...) {
            job.promise.set_exception(std::current_exception());
        }
        done.fetch_add(1);
    }
}

} // namespace safecalc
