#include "safecalc/literal.hpp"

#include "safecalc/errors.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

namespace safecalc {

namespace {

bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::size_t skipDigits(std::string_view text, std::size_t index) {
    while (index < text.size() && isDigit(text[index])) {
        ++index;
    }
    return index;
}

InvalidOperandError invalidLiteral(std::string_view text, std::size_t position) {
    return InvalidOperandError("Некорректный числовой литерал '" + std::string(text) + "'", position);
}

// Десятичный порядок первой значащей цифры литерала без знака ("123" -> 2, "0.05" -> -2).
// Порядок экспоненты насыщается, чтобы длинные показатели не переполняли long.
long decimalOrder(std::string_view digits) {
    std::size_t exponentPos = digits.find_first_of("eE");
    std::string_view mantissa = digits.substr(0, exponentPos);

    long exponent = 0;
    if (exponentPos != std::string_view::npos) {
        std::size_t index = exponentPos + 1;
        bool negative = false;
        if (digits[index] == '+' || digits[index] == '-') {
            negative = digits[index] == '-';
            ++index;
        }
        for (; index < digits.size(); ++index) {
            if (exponent < 1000000) {
                exponent = exponent * 10 + (digits[index] - '0');
            }
        }
        if (negative) {
            exponent = -exponent;
        }
    }

    std::size_t point = mantissa.find('.');
    std::string_view intPart = mantissa.substr(0, point);
    std::size_t firstSignificant = intPart.find_first_not_of('0');
    if (firstSignificant != std::string_view::npos) {
        return exponent + static_cast<long>(intPart.size() - firstSignificant) - 1;
    }
    std::string_view fracPart = point == std::string_view::npos ? std::string_view() : mantissa.substr(point + 1);
    std::size_t leadingZeros = fracPart.find_first_not_of('0');
    return exponent - static_cast<long>(leadingZeros) - 1;
}

} // namespace

std::size_t literalLength(std::string_view text, std::size_t start) noexcept {
    std::size_t index = start;
    if (index < text.size() && (text[index] == '+' || text[index] == '-')) {
        ++index;
    }

    // Мантисса: хотя бы одна цифра до или после точки
    std::size_t intEnd = skipDigits(text, index);
    std::size_t digits = intEnd - index;
    index = intEnd;
    if (index < text.size() && text[index] == '.') {
        std::size_t fracEnd = skipDigits(text, index + 1);
        digits += fracEnd - (index + 1);
        index = fracEnd;
    }
    if (digits == 0) {
        return 0;
    }

    if (index < text.size() && (text[index] == 'e' || text[index] == 'E')) {
        ++index;
        if (index < text.size() && (text[index] == '+' || text[index] == '-')) {
            ++index;
        }
        index = skipDigits(text, index);
    }
    return index - start;
}

double parseLiteral(std::string_view text, std::size_t position) {
    if (text.empty() || literalLength(text) != text.size()) {
        throw invalidLiteral(text, position);
    }

    // Экспонента обязана содержать цифры
    std::size_t exponent = text.find_first_of("eE");
    if (exponent != std::string_view::npos) {
        std::size_t index = exponent + 1;
        if (index < text.size() && (text[index] == '+' || text[index] == '-')) {
            ++index;
        }
        if (index >= text.size()) {
            throw invalidLiteral(text, position);
        }
    }

    // from_chars не принимает ведущий '+'
    std::string_view digits = text;
    if (digits.front() == '+') {
        digits.remove_prefix(1);
    }

    double value = 0.0;
    auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (error == std::errc::result_out_of_range && end == digits.data() + digits.size()) {
        // Слишком малое по модулю число округляется до нуля со знаком, слишком большое отвергается
        bool negative = digits.front() == '-';
        if (negative) {
            digits.remove_prefix(1);
        }
        if (decimalOrder(digits) < 0) {
            return std::copysign(0.0, negative ? -1.0 : 1.0);
        }
        throw invalidLiteral(text, position);
    }
    if (error != std::errc() || end != digits.data() + digits.size()) {
        throw invalidLiteral(text, position);
    }
    return value;
}

std::string formatNumber(double value) {
    char buffer[32];
    auto [end, error] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (error != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, end);
}

} // namespace safecalc
