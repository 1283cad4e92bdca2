#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace safecalc {

// Быстрый подсчет количества строк в файле
// Читает файл блоками и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path);

// Текущее время в формате для имени файла (20240131_235959)
std::string getCurrentTimeString();

// Путь отчёта по умолчанию: рядом с входным файлом, <имя>_results_<время>.csv
std::filesystem::path defaultResultsPath(const std::filesystem::path& inputPath);

} // namespace safecalc
