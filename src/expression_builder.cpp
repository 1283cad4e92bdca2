#include "safecalc/expression_builder.hpp"

#include "safecalc/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace safecalc {

namespace {

std::string at(std::size_t position) {
    return " в позиции " + std::to_string(position);
}

} // namespace

ExpressionBuilder::ExpressionBuilder(std::string_view text, const BuildOptions& options)
    : tokenizer(text), options(options) {}

// Основной цикл: токены запрашиваются по одному
Expression ExpressionBuilder::build() {
    while (true) {
        Token token = tokenizer.next();
        switch (token.type) {
        case TokenType::Number:
            pushNumber(token);
            break;
        case TokenType::Operator:
            pushOperator(token);
            break;
        case TokenType::LeftParen:
            openGroup(token);
            break;
        case TokenType::RightParen:
            closeGroup(token);
            break;
        case TokenType::End:
            return finish(token);
        }
        previous = token.type;
        ++tokenCount;
    }
}

void ExpressionBuilder::pushNumber(const Token& token) {
    if (!expectOperand) {
        throw MalformedExpressionError("Пропущен оператор перед числом '" + token.text + "'" +
                                           at(token.position),
                                       token.position);
    }
    operands.push_back({Operand(token.numericValue), 0});
    expectOperand = false;
}

void ExpressionBuilder::pushOperator(const Token& token) {
    if (expectOperand) {
        throw MalformedExpressionError("Пропущен операнд перед оператором '" + token.text + "'" +
                                           at(token.position),
                                       token.position);
    }

    // >= даёт левую ассоциативность: 10 - 3 - 2 == (10 - 3) - 2
    while (!operators.empty() && !operators.back().isGroup &&
           precedence(operators.back().op) >= precedence(token.op)) {
        reduce();
    }
    operators.push_back({false, token.op, token.position});
    expectOperand = true;
}

void ExpressionBuilder::openGroup(const Token& token) {
    if (!expectOperand) {
        throw MalformedExpressionError("Пропущен оператор перед '('" + at(token.position),
                                       token.position);
    }
    if (++depth > options.maxDepth) {
        throw NestingTooDeepError("Вложенность скобок превышает " +
                                      std::to_string(options.maxDepth) + at(token.position),
                                  token.position);
    }
    operators.push_back({true, Operator::Add, token.position});
}

void ExpressionBuilder::closeGroup(const Token& token) {
    if (expectOperand && previous == TokenType::LeftParen) {
        throw MalformedExpressionError("Пустые скобки" + at(token.position), token.position);
    }
    if (expectOperand && previous == TokenType::Operator) {
        throw MalformedExpressionError("Пропущен операнд перед ')'" + at(token.position),
                                       token.position);
    }

    while (!operators.empty() && !operators.back().isGroup) {
        reduce();
    }
    if (operators.empty()) {
        throw UnmatchedParenthesisError("Лишняя закрывающая скобка" + at(token.position),
                                        token.position);
    }
    operators.pop_back();
    --depth;
    expectOperand = false;
}

Expression ExpressionBuilder::finish(const Token& end) {
    if (tokenCount == 0) {
        throw EmptyExpressionError("Пустое выражение");
    }

    auto group = std::find_if(operators.begin(), operators.end(),
                              [](const PendingOperator& pending) { return pending.isGroup; });
    if (group != operators.end()) {
        throw UnmatchedParenthesisError("Незакрытая скобка" + at(group->position),
                                        group->position);
    }
    if (expectOperand) {
        throw MalformedExpressionError("Выражение обрывается на операторе" + at(end.position),
                                       end.position);
    }

    while (!operators.empty()) {
        reduce();
    }

    if (operands.empty()) {
        throw EmptyExpressionError("Выражение не содержит операндов");
    }
    if (operands.size() != 1) {
        throw MalformedExpressionError("Лишние операнды в выражении");
    }

    PendingOperand result = std::move(operands.back());
    operands.pop_back();
    if (result.operand.isLiteral()) {
        return Expression::literal(result.operand.literal());
    }
    return result.operand.takeExpression();
}

void ExpressionBuilder::reduce() {
    PendingOperator top = operators.back();
    operators.pop_back();
    if (operands.size() < 2) {
        throw MalformedExpressionError("Оператору '" + std::string(1, symbol(top.op)) +
                                           "' не хватает операндов" + at(top.position),
                                       top.position);
    }

    // Первым снимается правый операнд
    PendingOperand right = std::move(operands.back());
    operands.pop_back();
    PendingOperand left = std::move(operands.back());
    operands.pop_back();

    std::size_t height = std::max(left.height, right.height) + 1;
    if (height > options.maxTreeHeight) {
        throw NestingTooDeepError("Высота дерева выражения превышает " +
                                      std::to_string(options.maxTreeHeight) + at(top.position),
                                  top.position);
    }

    operands.push_back(
        {Operand(Expression::parse(std::move(left.operand), top.op, std::move(right.operand))),
         height});
}

} // namespace safecalc
