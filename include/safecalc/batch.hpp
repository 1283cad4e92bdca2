#pragma once

#include <cstddef>
#include <filesystem>

#include "safecalc/csv_writer.hpp"
#include "safecalc/evaluation_pool.hpp"

namespace safecalc {

// Итоги обработки файла
struct BatchSummary {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Потоковое чтение файла: строки отправляются в пул по мере чтения,
// результаты собираются пачками по batchSize и сразу пишутся в CSV,
// так что файл любого размера не загружается в память целиком.
// Порядок строк в отчёте совпадает с порядком во входном файле.
// Завершающий '\r' (окончания строк Windows) отбрасывается.
BatchSummary processExpressionsStreaming(const std::filesystem::path& path,
                                         EvaluationPool& pool, CsvWriter& writer,
                                         std::size_t batchSize = 1000);

} // namespace safecalc
