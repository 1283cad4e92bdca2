#include "safecalc/cli_options.hpp"
#include "safecalc/console.hpp"
#include "safecalc/modes.hpp"

#include <iostream>

// Точка входа в программу
int main(int argc, char** argv) {
    safecalc::CliOptions options;
    try {
        options = safecalc::parseCliOptions(argc, argv);
    }
    catch (const safecalc::UsageError& ex) {
        safecalc::printError(ex);
        std::cerr << "\n" << safecalc::usage();
        return 2;
    }

    try {
        switch (options.mode) {
        case safecalc::Mode::Repl:
            return safecalc::runReplMode(options);
        case safecalc::Mode::Eval:
            return safecalc::runEvalMode(options);
        case safecalc::Mode::Batch:
            return safecalc::runBatchMode(options);
        case safecalc::Mode::Solve:
            return safecalc::runSolveMode(options);
        case safecalc::Mode::Help:
            std::cout << safecalc::usage();
            return 0;
        }
    }
    catch (const std::exception& ex) {
        safecalc::printError(ex);
        return 1;
    }
    return 0;
}
