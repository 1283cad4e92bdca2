#include "safecalc/csv_writer.hpp"

#include "safecalc/literal.hpp"

#include <stdexcept>

namespace safecalc {

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : target(std::move(targetPath)), stream(target, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + target.string());
    }
    stream << "line,expression,status,result,error,message\n";
    checkStream();
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << record.lineNumber << ','
        << quote(record.expression) << ','
        << record.status << ',';

    // Числа в кратчайшем точном виде, без зависимости от локали потока
    if (record.value.has_value()) {
        stream << formatNumber(*record.value);
    }
    stream << ',' << record.errorKind << ',' << quote(record.message) << '\n';
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
    stream.flush();
    checkStream();
}

std::string CsvWriter::quote(const std::string& field) {
    std::string result;
    result.reserve(field.size() + 2);
    result.push_back('"');
    for (char ch : field) {
        if (ch == '"') {
            result.push_back('"');
        }
        result.push_back(ch);
    }
    result.push_back('"');
    return result;
}

void CsvWriter::checkStream() const {
    if (!stream.good()) {
        throw std::runtime_error("Ошибка записи в файл CSV: " + target.string());
    }
}

} // namespace safecalc
