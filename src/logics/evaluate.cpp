#include "logics/logic.hpp"

#include <stdexcept>

using namespace hpl;


Truth hpl::Not(Truth value) {
    switch (value) {
        case Truth::TRUE: return Truth::FALSE;
        case Truth::FALSE: return Truth::TRUE;
        case Truth::UNKNOWN: return Truth::UNKNOWN;
    }
    return Truth::UNKNOWN;
}

Truth hpl::And(Truth value, Truth other) {
    if (value == Truth::FALSE || other == Truth::FALSE) return Truth::FALSE;
    if (value == Truth::TRUE && other == Truth::TRUE) return Truth::TRUE;
    return Truth::UNKNOWN;
}

Truth hpl::Or(Truth value, Truth other) {
    if (value == Truth::TRUE || other == Truth::TRUE) return Truth::TRUE;
    if (value == Truth::FALSE && other == Truth::FALSE) return Truth::FALSE;
    return Truth::UNKNOWN;
}


struct Evaluator : public AstVisitor {
    const AtomValuation& valuation;
    Truth result = Truth::UNKNOWN;

    explicit Evaluator(const AtomValuation& valuation) : valuation(valuation) {}

    Truth Eval(const Expression& expression) {
        expression.Accept(*this);
        return result;
    }

    void Atom(const Expression& expression) { result = valuation(expression); }

    void Visit(const LogicValue& object) override { result = object.value; }
    void Visit(const Negation& object) override { result = Not(Eval(*object.operand)); }
    void Visit(const Conjunction& object) override {
        auto value = Truth::TRUE;
        for (const auto& elem : object.operands) value = And(value, Eval(*elem));
        result = value;
    }
    void Visit(const Disjunction& object) override {
        auto value = Truth::FALSE;
        for (const auto& elem : object.operands) value = Or(value, Eval(*elem));
        result = value;
    }
    void Visit(const Implication& object) override {
        auto premise = Eval(*object.premise);
        result = Or(Not(premise), Eval(*object.conclusion));
    }
    void Visit(const Equivalence& object) override {
        auto lhs = Eval(*object.lhs);
        auto rhs = Eval(*object.rhs);
        if (lhs == Truth::UNKNOWN || rhs == Truth::UNKNOWN) result = Truth::UNKNOWN;
        else result = lhs == rhs ? Truth::TRUE : Truth::FALSE;
    }

    void Visit(const Literal& object) override { Atom(object); }
    void Visit(const ThisMessage& object) override { Atom(object); }
    void Visit(const VariableReference& object) override { Atom(object); }
    void Visit(const FieldAccess& object) override { Atom(object); }
    void Visit(const ArrayAccess& object) override { Atom(object); }
    void Visit(const SetValue& object) override { Atom(object); }
    void Visit(const RangeValue& object) override { Atom(object); }
    void Visit(const NumericNegation& object) override { Atom(object); }
    void Visit(const Arithmetic& object) override { Atom(object); }
    void Visit(const Comparison& object) override { Atom(object); }
    void Visit(const FunctionCall& object) override { Atom(object); }
    void Visit(const Quantifier& object) override { Atom(object); }

    void Visit(const Predicate& object) override { Eval(*object.condition); }
    void Visit(const AtomicEvent& /*object*/) override { throw std::logic_error("Cannot evaluate an event."); }
    void Visit(const EventDisjunction& /*object*/) override { throw std::logic_error("Cannot evaluate an event."); }
    void Visit(const Scope& /*object*/) override { throw std::logic_error("Cannot evaluate a scope."); }
    void Visit(const Pattern& /*object*/) override { throw std::logic_error("Cannot evaluate a pattern."); }
    void Visit(const Property& /*object*/) override { throw std::logic_error("Cannot evaluate a property."); }
};

Truth hpl::Evaluate(const Expression& expression, const AtomValuation& valuation) {
    Evaluator evaluator(valuation);
    return evaluator.Eval(expression);
}
