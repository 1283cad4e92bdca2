#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace safecalc {

// Длина числового литерала, начинающегося с позиции start (0, если литерала нет).
// Форма: [знак] цифры [. цифры] [e|E [знак] цифры]. Маркер экспоненты
// захватывается даже без цифр, чтобы parseLiteral сообщил о некорректном числе.
std::size_t literalLength(std::string_view text, std::size_t start = 0) noexcept;

// Преобразует текст литерала в число. Вся строка должна быть литералом.
// Выбрасывает InvalidOperandError, если текст не является числом
// или превышает диапазон double. Исчезающе малые значения дают ноль со знаком.
double parseLiteral(std::string_view text, std::size_t position = static_cast<std::size_t>(-1));

// Кратчайшее представление числа, которое читается обратно без потерь ("2", "0.1", "1e+20")
std::string formatNumber(double value);

} // namespace safecalc
