#include "ast/util.hpp"

using namespace hpl;


template<typename T>
inline bool AreEqual(const std::unique_ptr<T>& object, const std::unique_ptr<T>& other) {
    if (!object || !other) return !object && !other;
    return hpl::SyntacticalEqual(*object, *other);
}

template<typename T>
inline bool AreEqual(const std::deque<std::unique_ptr<T>>& object, const std::deque<std::unique_ptr<T>>& other) {
    if (object.size() != other.size()) return false;
    for (std::size_t index = 0; index < object.size(); ++index) {
        if (!AreEqual(object.at(index), other.at(index))) return false;
    }
    return true;
}

inline bool IsEqual(const LogicValue& object, const LogicValue& other) {
    return object.value == other.value;
}
inline bool IsEqual(const Negation& object, const Negation& other) {
    return AreEqual(object.operand, other.operand);
}
inline bool IsEqual(const Conjunction& object, const Conjunction& other) {
    return AreEqual(object.operands, other.operands);
}
inline bool IsEqual(const Disjunction& object, const Disjunction& other) {
    return AreEqual(object.operands, other.operands);
}
inline bool IsEqual(const Implication& object, const Implication& other) {
    return AreEqual(object.premise, other.premise) && AreEqual(object.conclusion, other.conclusion);
}
inline bool IsEqual(const Equivalence& object, const Equivalence& other) {
    return AreEqual(object.lhs, other.lhs) && AreEqual(object.rhs, other.rhs);
}
inline bool IsEqual(const Literal& object, const Literal& other) {
    return object.value == other.value;
}
inline bool IsEqual(const ThisMessage& /*object*/, const ThisMessage& /*other*/) { return true; }
inline bool IsEqual(const VariableReference& object, const VariableReference& other) {
    return object.name == other.name;
}
inline bool IsEqual(const FieldAccess& object, const FieldAccess& other) {
    return object.field == other.field && AreEqual(object.message, other.message);
}
inline bool IsEqual(const ArrayAccess& object, const ArrayAccess& other) {
    return AreEqual(object.array, other.array) && AreEqual(object.index, other.index);
}
inline bool IsEqual(const SetValue& object, const SetValue& other) {
    return AreEqual(object.values, other.values);
}
inline bool IsEqual(const RangeValue& object, const RangeValue& other) {
    return object.excludeLow == other.excludeLow && object.excludeHigh == other.excludeHigh
           && AreEqual(object.low, other.low) && AreEqual(object.high, other.high);
}
inline bool IsEqual(const NumericNegation& object, const NumericNegation& other) {
    return AreEqual(object.operand, other.operand);
}
inline bool IsEqual(const Arithmetic& object, const Arithmetic& other) {
    return object.op == other.op && AreEqual(object.lhs, other.lhs) && AreEqual(object.rhs, other.rhs);
}
inline bool IsEqual(const Comparison& object, const Comparison& other) {
    return object.op == other.op && AreEqual(object.lhs, other.lhs) && AreEqual(object.rhs, other.rhs);
}
inline bool IsEqual(const FunctionCall& object, const FunctionCall& other) {
    return object.name == other.name && AreEqual(object.arguments, other.arguments);
}
inline bool IsEqual(const Quantifier& object, const Quantifier& other) {
    return object.kind == other.kind && object.variable == other.variable
           && AreEqual(object.domain, other.domain) && AreEqual(object.condition, other.condition);
}
inline bool IsEqual(const Predicate& object, const Predicate& other) {
    return AreEqual(object.condition, other.condition);
}
inline bool IsEqual(const AtomicEvent& object, const AtomicEvent& other) {
    return object.channel == other.channel && object.alias == other.alias && object.messageType == other.messageType
           && AreEqual(object.predicate, other.predicate);
}
inline bool IsEqual(const EventDisjunction& object, const EventDisjunction& other) {
    return AreEqual(object.disjuncts, other.disjuncts);
}
inline bool IsEqual(const Scope& object, const Scope& other) {
    return object.kind == other.kind && AreEqual(object.activator, other.activator)
           && AreEqual(object.terminator, other.terminator);
}
inline bool IsEqual(const Pattern& object, const Pattern& other) {
    return object.kind == other.kind && object.minTime == other.minTime && object.maxTime == other.maxTime
           && AreEqual(object.behaviour, other.behaviour) && AreEqual(object.trigger, other.trigger);
}
inline bool IsEqual(const Property& object, const Property& other) {
    return object.metadata == other.metadata && AreEqual(object.scope, other.scope) && AreEqual(object.pattern, other.pattern);
}

struct AstComparator : public AstVisitor {
    bool result = false;
    const AstObject& compare;

    explicit AstComparator(const AstObject& compare) : compare(compare) {}

    template<typename T>
    inline void Compare(const T& object) {
        if (auto other = dynamic_cast<const T*>(&compare)) {
            result = IsEqual(object, *other);
        }
    }

    void Visit(const LogicValue& object) override { Compare(object); }
    void Visit(const Negation& object) override { Compare(object); }
    void Visit(const Conjunction& object) override { Compare(object); }
    void Visit(const Disjunction& object) override { Compare(object); }
    void Visit(const Implication& object) override { Compare(object); }
    void Visit(const Equivalence& object) override { Compare(object); }
    void Visit(const Literal& object) override { Compare(object); }
    void Visit(const ThisMessage& object) override { Compare(object); }
    void Visit(const VariableReference& object) override { Compare(object); }
    void Visit(const FieldAccess& object) override { Compare(object); }
    void Visit(const ArrayAccess& object) override { Compare(object); }
    void Visit(const SetValue& object) override { Compare(object); }
    void Visit(const RangeValue& object) override { Compare(object); }
    void Visit(const NumericNegation& object) override { Compare(object); }
    void Visit(const Arithmetic& object) override { Compare(object); }
    void Visit(const Comparison& object) override { Compare(object); }
    void Visit(const FunctionCall& object) override { Compare(object); }
    void Visit(const Quantifier& object) override { Compare(object); }
    void Visit(const Predicate& object) override { Compare(object); }
    void Visit(const AtomicEvent& object) override { Compare(object); }
    void Visit(const EventDisjunction& object) override { Compare(object); }
    void Visit(const Scope& object) override { Compare(object); }
    void Visit(const Pattern& object) override { Compare(object); }
    void Visit(const Property& object) override { Compare(object); }
};

bool hpl::SyntacticalEqual(const AstObject& object, const AstObject& other) {
    AstComparator comparator(other);
    object.Accept(comparator);
    return comparator.result;
}
