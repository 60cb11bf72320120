#include "ast/util.hpp"

#include <stdexcept>
#include <type_traits>

using namespace hpl;


//
// Copying objects
//

template<typename T>
inline std::deque<std::unique_ptr<T>> CopyAll(const std::deque<std::unique_ptr<T>>& elements) {
    std::deque<std::unique_ptr<T>> result;
    for (const auto& elem : elements) result.push_back(hpl::Copy(*elem));
    return result;
}

template<typename T>
inline std::unique_ptr<T> CopyOptional(const std::unique_ptr<T>& element) {
    if (!element) return nullptr;
    return hpl::Copy(*element);
}

std::unique_ptr<LogicValue> CopyNode(const LogicValue& object) {
    return std::make_unique<LogicValue>(object.value);
}

std::unique_ptr<Negation> CopyNode(const Negation& object) {
    return std::make_unique<Negation>(hpl::Copy(*object.operand));
}

std::unique_ptr<Conjunction> CopyNode(const Conjunction& object) {
    return std::make_unique<Conjunction>(CopyAll(object.operands));
}

std::unique_ptr<Disjunction> CopyNode(const Disjunction& object) {
    return std::make_unique<Disjunction>(CopyAll(object.operands));
}

std::unique_ptr<Implication> CopyNode(const Implication& object) {
    return std::make_unique<Implication>(hpl::Copy(*object.premise), hpl::Copy(*object.conclusion));
}

std::unique_ptr<Equivalence> CopyNode(const Equivalence& object) {
    return std::make_unique<Equivalence>(hpl::Copy(*object.lhs), hpl::Copy(*object.rhs));
}

std::unique_ptr<Literal> CopyNode(const Literal& object) {
    return std::make_unique<Literal>(object.token, object.value);
}

std::unique_ptr<ThisMessage> CopyNode(const ThisMessage& /*object*/) {
    return std::make_unique<ThisMessage>();
}

std::unique_ptr<VariableReference> CopyNode(const VariableReference& object) {
    return std::make_unique<VariableReference>(object.name);
}

std::unique_ptr<FieldAccess> CopyNode(const FieldAccess& object) {
    return std::make_unique<FieldAccess>(hpl::Copy(*object.message), object.field);
}

std::unique_ptr<ArrayAccess> CopyNode(const ArrayAccess& object) {
    return std::make_unique<ArrayAccess>(hpl::Copy(*object.array), hpl::Copy(*object.index));
}

std::unique_ptr<SetValue> CopyNode(const SetValue& object) {
    return std::make_unique<SetValue>(CopyAll(object.values));
}

std::unique_ptr<RangeValue> CopyNode(const RangeValue& object) {
    return std::make_unique<RangeValue>(hpl::Copy(*object.low), hpl::Copy(*object.high), object.excludeLow, object.excludeHigh);
}

std::unique_ptr<NumericNegation> CopyNode(const NumericNegation& object) {
    return std::make_unique<NumericNegation>(hpl::Copy(*object.operand));
}

std::unique_ptr<Arithmetic> CopyNode(const Arithmetic& object) {
    return std::make_unique<Arithmetic>(object.op, hpl::Copy(*object.lhs), hpl::Copy(*object.rhs));
}

std::unique_ptr<Comparison> CopyNode(const Comparison& object) {
    return std::make_unique<Comparison>(object.op, hpl::Copy(*object.lhs), hpl::Copy(*object.rhs));
}

std::unique_ptr<FunctionCall> CopyNode(const FunctionCall& object) {
    return std::make_unique<FunctionCall>(object.name, CopyAll(object.arguments));
}

std::unique_ptr<Quantifier> CopyNode(const Quantifier& object) {
    return std::make_unique<Quantifier>(object.kind, object.variable, hpl::Copy(*object.domain), hpl::Copy(*object.condition));
}

std::unique_ptr<Predicate> CopyNode(const Predicate& object) {
    return std::make_unique<Predicate>(hpl::Copy(*object.condition));
}

std::unique_ptr<AtomicEvent> CopyNode(const AtomicEvent& object) {
    return std::make_unique<AtomicEvent>(object.channel, CopyOptional(object.predicate), object.alias, object.messageType);
}

std::unique_ptr<EventDisjunction> CopyNode(const EventDisjunction& object) {
    return std::make_unique<EventDisjunction>(CopyAll(object.disjuncts));
}

std::unique_ptr<Scope> CopyNode(const Scope& object) {
    return std::make_unique<Scope>(object.kind, CopyOptional(object.activator), CopyOptional(object.terminator));
}

std::unique_ptr<Pattern> CopyNode(const Pattern& object) {
    return std::make_unique<Pattern>(object.kind, CopyOptional(object.behaviour), CopyOptional(object.trigger),
                                     object.minTime, object.maxTime);
}

std::unique_ptr<Property> CopyNode(const Property& object) {
    return std::make_unique<Property>(CopyOptional(object.scope), CopyOptional(object.pattern), object.metadata);
}


//
// Dispatch
//

template<typename T>
struct CopyVisitor : public AstVisitor {
    std::unique_ptr<T> result;

    static std::unique_ptr<T> Copy(const T& object) {
        CopyVisitor<T> visitor;
        object.Accept(visitor);
        if (!visitor.result) throw std::logic_error("Internal error: 'Copy' failed.");
        return std::move(visitor.result);
    }

    template<typename U>
    void Handle(const U& object) {
        if constexpr (std::is_base_of_v<T, U>) result = CopyNode(object);
        else throw std::logic_error("Internal error: 'Copy' failed due to unexpected node kind.");
    }

    void Visit(const LogicValue& object) override { Handle(object); }
    void Visit(const Negation& object) override { Handle(object); }
    void Visit(const Conjunction& object) override { Handle(object); }
    void Visit(const Disjunction& object) override { Handle(object); }
    void Visit(const Implication& object) override { Handle(object); }
    void Visit(const Equivalence& object) override { Handle(object); }
    void Visit(const Literal& object) override { Handle(object); }
    void Visit(const ThisMessage& object) override { Handle(object); }
    void Visit(const VariableReference& object) override { Handle(object); }
    void Visit(const FieldAccess& object) override { Handle(object); }
    void Visit(const ArrayAccess& object) override { Handle(object); }
    void Visit(const SetValue& object) override { Handle(object); }
    void Visit(const RangeValue& object) override { Handle(object); }
    void Visit(const NumericNegation& object) override { Handle(object); }
    void Visit(const Arithmetic& object) override { Handle(object); }
    void Visit(const Comparison& object) override { Handle(object); }
    void Visit(const FunctionCall& object) override { Handle(object); }
    void Visit(const Quantifier& object) override { Handle(object); }
    void Visit(const Predicate& object) override { Handle(object); }
    void Visit(const AtomicEvent& object) override { Handle(object); }
    void Visit(const EventDisjunction& object) override { Handle(object); }
    void Visit(const Scope& object) override { Handle(object); }
    void Visit(const Pattern& object) override { Handle(object); }
    void Visit(const Property& object) override { Handle(object); }
};

template<typename T>
std::unique_ptr<T> hpl::Copy(const T& object) {
    return CopyVisitor<T>::Copy(object);
}

#define INSTANCE(X) \
    template std::unique_ptr<X> hpl::Copy<X>(const X& object);

INSTANCE(AstObject)
INSTANCE(Expression)
INSTANCE(Event)
INSTANCE(LogicValue)
INSTANCE(Negation)
INSTANCE(Conjunction)
INSTANCE(Disjunction)
INSTANCE(Implication)
INSTANCE(Equivalence)
INSTANCE(Literal)
INSTANCE(ThisMessage)
INSTANCE(VariableReference)
INSTANCE(FieldAccess)
INSTANCE(ArrayAccess)
INSTANCE(SetValue)
INSTANCE(RangeValue)
INSTANCE(NumericNegation)
INSTANCE(Arithmetic)
INSTANCE(Comparison)
INSTANCE(FunctionCall)
INSTANCE(Quantifier)
INSTANCE(Predicate)
INSTANCE(AtomicEvent)
INSTANCE(EventDisjunction)
INSTANCE(Scope)
INSTANCE(Pattern)
INSTANCE(Property)
