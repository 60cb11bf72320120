#include "logics/logic.hpp"

#include "ast/util.hpp"

using namespace hpl;


//
// Connectives
//

std::unique_ptr<Expression> hpl::Negate(std::unique_ptr<Expression> expression) {
    if (auto negation = dynamic_cast<Negation*>(expression.get())) {
        return std::move(negation->operand);
    }
    if (auto value = dynamic_cast<LogicValue*>(expression.get())) {
        return std::make_unique<LogicValue>(Not(value->value));
    }
    return std::make_unique<Negation>(std::move(expression));
}

template<typename T>
inline std::unique_ptr<Expression> MakeConnective(std::deque<std::unique_ptr<Expression>> operands, bool neutral) {
    RemoveIf(operands, [](const auto& elem) { return elem == nullptr; });
    if (operands.empty()) return std::make_unique<LogicValue>(neutral);
    if (operands.size() == 1) return std::move(operands.front());
    return std::make_unique<T>(std::move(operands));
}

template<typename T>
inline std::deque<std::unique_ptr<T>> MakePair(std::unique_ptr<T> lhs, std::unique_ptr<T> rhs) {
    std::deque<std::unique_ptr<T>> result;
    result.push_back(std::move(lhs));
    result.push_back(std::move(rhs));
    return result;
}

std::unique_ptr<Expression> hpl::Conjoin(std::deque<std::unique_ptr<Expression>> operands) {
    return MakeConnective<Conjunction>(std::move(operands), true);
}

std::unique_ptr<Expression> hpl::Conjoin(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs) {
    return Conjoin(MakePair(std::move(lhs), std::move(rhs)));
}

std::unique_ptr<Expression> hpl::Disjoin(std::deque<std::unique_ptr<Expression>> operands) {
    return MakeConnective<Disjunction>(std::move(operands), false);
}

std::unique_ptr<Expression> hpl::Disjoin(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs) {
    return Disjoin(MakePair(std::move(lhs), std::move(rhs)));
}

std::unique_ptr<Expression> hpl::Implies(std::unique_ptr<Expression> premise, std::unique_ptr<Expression> conclusion) {
    return std::make_unique<Implication>(std::move(premise), std::move(conclusion));
}

struct ConnectiveDetector : public DefaultAstVisitor {
    bool result = false;
    void Visit(const LogicValue& /*object*/) override { result = true; }
    void Visit(const Negation& /*object*/) override { result = true; }
    void Visit(const Conjunction& /*object*/) override { result = true; }
    void Visit(const Disjunction& /*object*/) override { result = true; }
    void Visit(const Implication& /*object*/) override { result = true; }
    void Visit(const Equivalence& /*object*/) override { result = true; }
};

bool hpl::IsConnective(const Expression& expression) {
    ConnectiveDetector detector;
    expression.Accept(detector);
    return detector.result;
}


//
// Predicates
//

std::unique_ptr<Predicate> hpl::Negate(const Predicate& predicate) {
    return std::make_unique<Predicate>(Negate(hpl::Copy(*predicate.condition)));
}

std::unique_ptr<Predicate> hpl::Join(const Predicate& predicate, const Predicate& other) {
    if (predicate.IsVacuous() || other.IsUnsatisfiable()) return hpl::Copy(other);
    if (other.IsVacuous() || predicate.IsUnsatisfiable()) return hpl::Copy(predicate);
    return std::make_unique<Predicate>(Conjoin(hpl::Copy(*predicate.condition), hpl::Copy(*other.condition)));
}
