#include "safecalc/cli_options.hpp"

#include "safecalc/errors.hpp"
#include "safecalc/literal.hpp"
#include "safecalc/user_input.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <thread>

namespace safecalc {

namespace {

Mode parseMode(const std::string& name) {
    if (name == "repl") {
        return Mode::Repl;
    }
    if (name == "eval") {
        return Mode::Eval;
    }
    if (name == "batch") {
        return Mode::Batch;
    }
    if (name == "solve") {
        return Mode::Solve;
    }
    if (name == "help" || name == "--help" || name == "-h") {
        return Mode::Help;
    }
    throw UsageError("Неизвестный режим '" + name + "'");
}

std::size_t parseOptionCount(const std::string& option, const std::string& value) {
    try {
        return parseCount(value);
    }
    catch (const std::runtime_error& ex) {
        throw UsageError(option + ": " + ex.what());
    }
}

// Зерно генератора: любое целое от 0 до максимума unsigned
unsigned parseSeed(const std::string& option, const std::string& value) {
    std::string text = trim(value);
    bool allDigits = !text.empty() && std::all_of(text.begin(), text.end(), [](char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    });
    if (!allDigits) {
        throw UsageError(option + ": некорректное значение '" + value + "'");
    }

    unsigned long long seed = 0;
    try {
        seed = std::stoull(text);
    }
    catch (const std::out_of_range&) {
        seed = std::numeric_limits<unsigned long long>::max();
    }
    if (seed > std::numeric_limits<unsigned>::max()) {
        throw UsageError(option + ": значение больше " +
                         std::to_string(std::numeric_limits<unsigned>::max()));
    }
    return static_cast<unsigned>(seed);
}

bool isOptionName(const std::string& argument) {
    return argument == "--threads" || argument == "--attempts" ||
           argument == "--seed" || argument == "--max-depth";
}

// Проверка числовых аргументов режима solve
void checkLiteral(const std::string& value) {
    try {
        parseLiteral(value);
    }
    catch (const InvalidOperandError& ex) {
        throw UsageError(std::string("solve: ") + ex.what());
    }
}

void validate(const CliOptions& options) {
    const auto count = options.arguments.size();
    switch (options.mode) {
    case Mode::Repl:
    case Mode::Help:
        if (count != 0) {
            throw UsageError("Лишний аргумент '" + options.arguments.front() + "'");
        }
        break;
    case Mode::Eval:
        if (count == 0) {
            throw UsageError("eval: не задано выражение");
        }
        break;
    case Mode::Batch:
        if (count == 0 || count > 2) {
            throw UsageError("batch: ожидается входной файл и, необязательно, выходной");
        }
        break;
    case Mode::Solve:
        if (count == 0) {
            throw UsageError("solve: не задано целевое число");
        }
        for (const auto& argument : options.arguments) {
            checkLiteral(argument);
        }
        break;
    }
}

} // namespace

CliOptions parseCliOptions(int argc, const char* const* argv) {
    CliOptions options;
    bool modeSeen = false;

    for (int i = 1; i < argc; ++i) {
        std::string argument = argv[i];

        // Опции вида --name value; прочие аргументы (например, "--2" в eval) позиционные
        if (isOptionName(argument)) {
            if (i + 1 >= argc) {
                throw UsageError(argument + ": не задано значение");
            }
            std::string value = argv[++i];
            if (argument == "--threads") {
                options.threads = parseOptionCount(argument, value);
            } else if (argument == "--attempts") {
                options.attempts = parseOptionCount(argument, value);
            } else if (argument == "--seed") {
                options.seed = parseSeed(argument, value);
            } else {
                options.build.maxDepth = parseOptionCount(argument, value);
            }
            continue;
        }

        if (!modeSeen) {
            options.mode = parseMode(argument);
            modeSeen = true;
        } else {
            options.arguments.push_back(std::move(argument));
        }
    }

    validate(options);
    return options;
}

std::string usage() {
    return "Использование: safecalc [режим] [аргументы] [опции]\n"
           "\n"
           "Режимы:\n"
           "  repl                      интерактивный ввод выражений (по умолчанию)\n"
           "  eval <выражение>          вычислить одно выражение\n"
           "  batch <вход> [выход.csv]  вычислить каждую строку файла, результат в CSV\n"
           "  solve <цель> [числа...]   найти выражение из чисел (по умолчанию 5 5 5 5 5)\n"
           "  help                      эта справка\n"
           "\n"
           "Опции:\n"
           "  --threads N     число потоков для batch\n"
           "  --attempts N    число попыток для solve (по умолчанию 1000)\n"
           "  --seed N        зерно генератора для solve\n"
           "  --max-depth N   максимальная вложенность скобок (по умолчанию 256)\n";
}

std::size_t resolveThreadCount(const CliOptions& options) {
    if (options.threads != 0) {
        return options.threads;
    }
    std::size_t hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 2 : hardware;
}

} // namespace safecalc
