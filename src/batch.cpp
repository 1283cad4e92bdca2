#include "safecalc/batch.hpp"

#include <fstream>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace safecalc {

BatchSummary processExpressionsStreaming(const std::filesystem::path& path,
                                         EvaluationPool& pool, CsvWriter& writer,
                                         std::size_t batchSize) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }
    if (batchSize == 0) {
        batchSize = 1;
    }

    BatchSummary summary;
    std::vector<std::future<EvaluationRecord>> futures;
    futures.reserve(batchSize);

    auto flushBatch = [&]() {
        std::vector<EvaluationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
            if (batch.back().status == "success") {
                ++summary.succeeded;
            } else {
                ++summary.failed;
            }
        }
        writer.write(batch);
        futures.clear();
    };

    std::string line;
    std::size_t lineNumber = 1;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        futures.push_back(pool.submit({lineNumber++, std::move(line)}));
        if (futures.size() >= batchSize) {
            flushBatch();
        }
    }
    if (input.bad()) {
        throw std::runtime_error("Ошибка чтения входного файла: " + path.string());
    }
    flushBatch();
    return summary;
}

} // namespace safecalc
