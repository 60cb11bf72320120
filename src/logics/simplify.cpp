#include "logics/logic.hpp"

#include "ast/util.hpp"
#include "util/shortcuts.hpp"

using namespace hpl;


inline const LogicValue* AsValue(const std::unique_ptr<Expression>& expression) {
    return dynamic_cast<const LogicValue*>(expression.get());
}

inline bool Is(const std::unique_ptr<Expression>& expression, Truth value) {
    auto constant = AsValue(expression);
    return constant && constant->value == value;
}

inline std::unique_ptr<Expression> MakeValue(Truth value) {
    return std::make_unique<LogicValue>(value);
}


//
// Simplification
//

struct Simplifier final : public MutableDefaultAstVisitor {
    std::unique_ptr<Expression> result;

    template<typename T>
    void HandleJunction(T& object, Truth neutral, Truth dominant) {
        // simplify and flatten
        std::deque<std::unique_ptr<Expression>> operands;
        for (auto& operand : object.operands) {
            auto simplified = hpl::Simplify(std::move(operand));
            if (auto nested = dynamic_cast<T*>(simplified.get())) MoveInto(std::move(nested->operands), operands);
            else operands.push_back(std::move(simplified));
        }

        // short-circuit, drop neutral elements and duplicates
        if (ContainsIf(operands, [dominant](const auto& elem) { return Is(elem, dominant); })) {
            result = MakeValue(dominant);
            return;
        }
        RemoveIf(operands, [neutral](const auto& elem) { return Is(elem, neutral); });
        std::deque<std::unique_ptr<Expression>> unique;
        for (auto& operand : operands) {
            auto isDuplicate = [&operand](const auto& elem) { return hpl::SyntacticalEqual(*elem, *operand); };
            if (ContainsIf(unique, isDuplicate)) continue;
            unique.push_back(std::move(operand));
        }

        if (unique.empty()) result = MakeValue(neutral);
        else if (unique.size() == 1) result = std::move(unique.front());
        else object.operands = std::move(unique);
    }

    void Visit(Conjunction& object) override { HandleJunction(object, Truth::TRUE, Truth::FALSE); }
    void Visit(Disjunction& object) override { HandleJunction(object, Truth::FALSE, Truth::TRUE); }

    void Visit(Negation& object) override {
        object.operand = hpl::Simplify(std::move(object.operand));
        if (auto value = AsValue(object.operand)) result = MakeValue(Not(value->value));
        else if (auto negation = dynamic_cast<Negation*>(object.operand.get())) result = std::move(negation->operand);
    }

    void Visit(Implication& object) override {
        object.premise = hpl::Simplify(std::move(object.premise));
        object.conclusion = hpl::Simplify(std::move(object.conclusion));
        if (Is(object.premise, Truth::TRUE)) result = std::move(object.conclusion);
        else if (Is(object.premise, Truth::FALSE) || Is(object.conclusion, Truth::TRUE)) result = MakeValue(Truth::TRUE);
        else if (Is(object.conclusion, Truth::FALSE)) result = hpl::Simplify(Negate(std::move(object.premise)));
    }

    void Visit(Equivalence& object) override {
        object.lhs = hpl::Simplify(std::move(object.lhs));
        object.rhs = hpl::Simplify(std::move(object.rhs));
        if (Is(object.lhs, Truth::UNKNOWN) || Is(object.rhs, Truth::UNKNOWN)) result = MakeValue(Truth::UNKNOWN);
        else if (Is(object.lhs, Truth::TRUE)) result = std::move(object.rhs);
        else if (Is(object.rhs, Truth::TRUE)) result = std::move(object.lhs);
        else if (Is(object.lhs, Truth::FALSE)) result = hpl::Simplify(Negate(std::move(object.rhs)));
        else if (Is(object.rhs, Truth::FALSE)) result = hpl::Simplify(Negate(std::move(object.lhs)));
    }
};

std::unique_ptr<Expression> hpl::Simplify(std::unique_ptr<Expression> expression) {
    if (!expression) return expression;
    Simplifier simplifier;
    expression->Accept(simplifier);
    if (simplifier.result) return std::move(simplifier.result);
    return expression;
}

void hpl::Simplify(Predicate& predicate) {
    predicate.condition = hpl::Simplify(std::move(predicate.condition));
}
