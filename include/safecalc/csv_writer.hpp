#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace safecalc {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber = 0;   // Номер строки в исходном файле
    std::string expression;       // Исходный текст выражения
    std::optional<double> value;  // Результат (если вычисление успешно)
    std::string status;           // "success" или "error"
    std::string errorKind;        // Вид ошибки (LexError, DivisionByZeroError, ...)
    std::string message;          // Сообщение об ошибке
};

// Потоковая запись результатов в формате CSV.
// Формат: line,expression,status,result,error,message
class CsvWriter {
public:
    // Открывает файл (перезаписывая его) и записывает заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов и сбрасывает буфер
    void write(const std::vector<EvaluationRecord>& records);

    void writeRecord(const EvaluationRecord& record);

    const std::filesystem::path& path() const noexcept { return target; }

    // Экранирование поля по RFC 4180: кавычки удваиваются, поле в кавычках
    static std::string quote(const std::string& field);

private:
    std::filesystem::path target;
    std::ofstream stream;

    void checkStream() const;
};

} // namespace safecalc
