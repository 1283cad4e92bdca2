#include "safecalc/errors.hpp"
#include "safecalc/operator.hpp"
#include "test_support.hpp"

#include <initializer_list>
#include <iostream>

#undef NDEBUG
#include <cassert>

using namespace safecalc;

void test_from_symbol()
{
    assert(fromSymbol("+") == Operator::Add);
    assert(fromSymbol("-") == Operator::Subtract);
    assert(fromSymbol("*") == Operator::Multiply);
    assert(fromSymbol("/") == Operator::Divide);

    assert(throws<UnknownOperatorError>([] { fromSymbol("^"); }));
    assert(throws<UnknownOperatorError>([] { fromSymbol("%"); }));
    assert(throws<UnknownOperatorError>([] { fromSymbol("**"); }));
    assert(throws<UnknownOperatorError>([] { fromSymbol(""); }));
}

void test_unknown_operator_position()
{
    try {
        fromSymbol("^", 7);
        assert(false);
    } catch (const UnknownOperatorError& e) {
        assert(e.position() == 7);
        assert(std::string(e.kind()) == "UnknownOperatorError");
    }
}

void test_precedence()
{
    assert(precedence(Operator::Multiply) == 2);
    assert(precedence(Operator::Divide) == 2);
    assert(precedence(Operator::Add) == 1);
    assert(precedence(Operator::Subtract) == 1);
    assert(precedence(Operator::Multiply) > precedence(Operator::Subtract));
}

void test_symbol()
{
    for (char ch : {'+', '-', '*', '/'}) {
        assert(symbol(fromSymbol(std::string(1, ch))) == ch);
        assert(isOperatorSymbol(ch));
    }
    assert(!isOperatorSymbol('^'));
    assert(!isOperatorSymbol('('));
}

void test_apply()
{
    assert(apply(Operator::Add, 2.0, 3.0) == 5.0);
    assert(apply(Operator::Subtract, 2.0, 3.0) == -1.0);
    assert(apply(Operator::Multiply, 2.5, 4.0) == 10.0);
    assert(apply(Operator::Divide, 1.0, 4.0) == 0.25);
    assert(apply(Operator::Divide, 0.0, 4.0) == 0.0);
}

void test_division_by_zero()
{
    assert(throws<DivisionByZeroError>([] { apply(Operator::Divide, 5.0, 0.0); }));
    assert(throws<DivisionByZeroError>([] { apply(Operator::Divide, 5.0, -0.0); }));
    assert(throws<DivisionByZeroError>([] { apply(Operator::Divide, 0.0, 0.0); }));

    // Только точный ноль
    assert(apply(Operator::Divide, 1e-300, 1e-300) == 1.0);
    assert(!throws<DivisionByZeroError>([] { apply(Operator::Multiply, 5.0, 0.0); }));
}

int main()
{
    try {
        test_from_symbol();
        test_unknown_operator_position();
        test_precedence();
        test_symbol();
        test_apply();
        test_division_by_zero();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return -1;
    }
}
