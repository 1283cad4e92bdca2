#include "safecalc/batch.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#undef NDEBUG
#include <cassert>

using namespace safecalc;

namespace {

std::filesystem::path writeInput(const std::string& name, const std::string& content)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
    return path;
}

std::vector<std::string> readLines(const std::filesystem::path& path)
{
    std::ifstream input(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool startsWith(const std::string& text, const std::string& prefix)
{
    return text.compare(0, prefix.size(), prefix) == 0;
}

}

void test_rows_and_summary()
{
    auto input = writeInput("safecalc_batch_rows.txt",
                            "2 + 3 * 4\n"
                            "\n"
                            "5 / 0\r\n"
                            "(1 + 2\n"
                            "4/2");
    auto output = std::filesystem::temp_directory_path() / "safecalc_batch_rows.csv";

    BatchSummary summary;
    {
        ExpressionEvaluator evaluator;
        EvaluationPool pool(3, evaluator);
        CsvWriter writer(output);
        summary = processExpressionsStreaming(input, pool, writer);
    }
    assert(summary.succeeded == 2);
    assert(summary.failed == 3);

    auto lines = readLines(output);
    assert(lines.size() == 6);
    assert(lines[0] == "line,expression,status,result,error,message");
    assert(lines[1] == "1,\"2 + 3 * 4\",success,14,,\"\"");
    assert(startsWith(lines[2], "2,\"\",error,,EmptyExpressionError,"));
    // '\r' не попадает ни в выражение, ни в отчёт
    assert(startsWith(lines[3], "3,\"5 / 0\",error,,DivisionByZeroError,"));
    assert(startsWith(lines[4], "4,\"(1 + 2\",error,,UnmatchedParenthesisError,"));
    assert(lines[5] == "5,\"4/2\",success,2,,\"\"");

    std::filesystem::remove(input);
    std::filesystem::remove(output);
}

void test_order_across_batches()
{
    std::ostringstream content;
    const std::size_t count = 23;
    for (std::size_t i = 1; i <= count; ++i) {
        if (i % 7 == 0) {
            content << i << " / 0\n";
        } else {
            content << i << " * 2\n";
        }
    }
    auto input = writeInput("safecalc_batch_order.txt", content.str());
    auto output = std::filesystem::temp_directory_path() / "safecalc_batch_order.csv";

    BatchSummary summary;
    {
        ExpressionEvaluator evaluator;
        EvaluationPool pool(4, evaluator);
        CsvWriter writer(output);
        summary = processExpressionsStreaming(input, pool, writer, 5);
    }
    assert(summary.succeeded == count - 3);
    assert(summary.failed == 3);

    auto lines = readLines(output);
    assert(lines.size() == count + 1);
    for (std::size_t i = 1; i <= count; ++i) {
        std::string prefix = std::to_string(i) + ",\"" + std::to_string(i);
        assert(startsWith(lines[i], prefix));
        if (i % 7 == 0) {
            assert(lines[i].find("DivisionByZeroError") != std::string::npos);
        } else {
            assert(lines[i].find(",success," + std::to_string(i * 2) + ",") != std::string::npos);
        }
    }

    std::filesystem::remove(input);
    std::filesystem::remove(output);
}

void test_empty_file()
{
    auto input = writeInput("safecalc_batch_empty.txt", "");
    auto output = std::filesystem::temp_directory_path() / "safecalc_batch_empty.csv";

    BatchSummary summary;
    {
        ExpressionEvaluator evaluator;
        EvaluationPool pool(2, evaluator);
        CsvWriter writer(output);
        summary = processExpressionsStreaming(input, pool, writer);
    }
    assert(summary.succeeded == 0 && summary.failed == 0);
    assert(readLines(output).size() == 1);

    std::filesystem::remove(input);
    std::filesystem::remove(output);
}

void test_missing_input()
{
    auto missing = std::filesystem::temp_directory_path() / "safecalc_batch_missing" / "in.txt";
    auto output = std::filesystem::temp_directory_path() / "safecalc_batch_missing.csv";

    ExpressionEvaluator evaluator;
    EvaluationPool pool(1, evaluator);
    CsvWriter writer(output);
    bool thrown = false;
    try {
        processExpressionsStreaming(missing, pool, writer);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::filesystem::remove(output);
}

int main()
{
    try {
        test_rows_and_summary();
        test_order_across_batches();
        test_empty_file();
        test_missing_input();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return -1;
    }
}
