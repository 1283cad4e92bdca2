#include "safecalc/file_utils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace safecalc {

std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;
    std::vector<char> buffer(bufferSize);

    std::size_t lineCount = 0;
    char lastChar = '\n';
    while (input.read(buffer.data(), bufferSize) || input.gcount() > 0) {
        std::size_t bytesRead = static_cast<std::size_t>(input.gcount());
        for (std::size_t i = 0; i < bytesRead; ++i) {
            if (buffer[i] == '\n') {
                ++lineCount;
            }
        }
        lastChar = buffer[bytesRead - 1];
    }

    // Последняя строка без \n
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::filesystem::path defaultResultsPath(const std::filesystem::path& inputPath) {
    std::string stem = inputPath.stem().string();
    return inputPath.parent_path() / (stem + "_results_" + getCurrentTimeString() + ".csv");
}

} // namespace safecalc
