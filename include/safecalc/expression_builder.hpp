#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "safecalc/expression.hpp"
#include "safecalc/tokenizer.hpp"

namespace safecalc {

// Строит дерево Expression из строки алгоритмом сортировочной станции
// (два стека: операнды и операторы со скобками-маркерами).
// Равные приоритеты сворачиваются слева направо.
// Экземпляр живёт только в пределах одного вызова Expression::build
// и не создаётся напрямую.
class ExpressionBuilder {
public:
    ExpressionBuilder(const ExpressionBuilder&) = delete;
    ExpressionBuilder& operator=(const ExpressionBuilder&) = delete;

private:
    friend class Expression;

    // Операнд на стеке вместе с высотой его поддерева
    struct PendingOperand {
        Operand operand;
        std::size_t height;
    };

    // Оператор или маркер открывающей скобки
    struct PendingOperator {
        bool isGroup;
        Operator op;
        std::size_t position;
    };

    ExpressionBuilder(std::string_view text, const BuildOptions& options);

    Expression build();

    void pushNumber(const Token& token);
    void pushOperator(const Token& token);
    void openGroup(const Token& token);
    void closeGroup(const Token& token);
    Expression finish(const Token& end);

    // Свёртка: снимает верхний оператор и два операнда, кладёт новый узел
    void reduce();

    Tokenizer tokenizer;
    const BuildOptions options;
    std::vector<PendingOperand> operands;
    std::vector<PendingOperator> operators;
    std::size_t depth = 0;           // Текущая вложенность скобок
    std::size_t tokenCount = 0;
    bool expectOperand = true;
    TokenType previous = TokenType::End;
};

} // namespace safecalc
