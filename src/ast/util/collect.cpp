#include "ast/util.hpp"

#include <type_traits>

using namespace hpl;


template<typename T>
struct Collector : public AstListener {
    std::deque<T*> result;
    const std::function<bool(const T&)>& pickPredicate;

    explicit Collector(const std::function<bool(const T&)>& filter) : pickPredicate(filter) {}

    void CollectObject(const T* object) {
        if constexpr (std::is_const_v<T>) result.push_back(object);
        else result.push_back(const_cast<T*>(object));
    }

    template<typename U>
    void Handle(const U& object) {
        if constexpr (std::is_base_of_v<T,U>) {
            if (!pickPredicate(object)) return;
            CollectObject(&object);
        }
    }

    void Enter(const LogicValue& object) override { Handle(object); }
    void Enter(const Negation& object) override { Handle(object); }
    void Enter(const Conjunction& object) override { Handle(object); }
    void Enter(const Disjunction& object) override { Handle(object); }
    void Enter(const Implication& object) override { Handle(object); }
    void Enter(const Equivalence& object) override { Handle(object); }
    void Enter(const Literal& object) override { Handle(object); }
    void Enter(const ThisMessage& object) override { Handle(object); }
    void Enter(const VariableReference& object) override { Handle(object); }
    void Enter(const FieldAccess& object) override { Handle(object); }
    void Enter(const ArrayAccess& object) override { Handle(object); }
    void Enter(const SetValue& object) override { Handle(object); }
    void Enter(const RangeValue& object) override { Handle(object); }
    void Enter(const NumericNegation& object) override { Handle(object); }
    void Enter(const Arithmetic& object) override { Handle(object); }
    void Enter(const Comparison& object) override { Handle(object); }
    void Enter(const FunctionCall& object) override { Handle(object); }
    void Enter(const Quantifier& object) override { Handle(object); }
    void Enter(const Predicate& object) override { Handle(object); }
    void Enter(const AtomicEvent& object) override { Handle(object); }
    void Enter(const EventDisjunction& object) override { Handle(object); }
    void Enter(const Scope& object) override { Handle(object); }
    void Enter(const Pattern& object) override { Handle(object); }
    void Enter(const Property& object) override { Handle(object); }
};

template<typename T>
std::deque<const T*> hpl::Collect(const AstObject& object, const std::function<bool(const T&)>& filter) {
    Collector<const T> collector(filter);
    object.Accept(collector);
    return std::move(collector.result);
}

template<typename T>
std::deque<T*> hpl::CollectMutable(AstObject& object, const std::function<bool(const T&)>& filter) {
    Collector<T> collector(filter);
    object.Accept(collector);
    return std::move(collector.result);
}


#define CONST_INSTANCE(X) \
    template \
    std::deque<const X*> hpl::Collect<X>(const AstObject& object, const std::function<bool(const X&)>& filter);

CONST_INSTANCE(AstObject)
CONST_INSTANCE(Expression)
CONST_INSTANCE(Event)
CONST_INSTANCE(LogicValue)
CONST_INSTANCE(Negation)
CONST_INSTANCE(Conjunction)
CONST_INSTANCE(Disjunction)
CONST_INSTANCE(Implication)
CONST_INSTANCE(Equivalence)
CONST_INSTANCE(Literal)
CONST_INSTANCE(ThisMessage)
CONST_INSTANCE(VariableReference)
CONST_INSTANCE(FieldAccess)
CONST_INSTANCE(ArrayAccess)
CONST_INSTANCE(SetValue)
CONST_INSTANCE(RangeValue)
CONST_INSTANCE(NumericNegation)
CONST_INSTANCE(Arithmetic)
CONST_INSTANCE(Comparison)
CONST_INSTANCE(FunctionCall)
CONST_INSTANCE(Quantifier)
CONST_INSTANCE(Predicate)
CONST_INSTANCE(AtomicEvent)
CONST_INSTANCE(EventDisjunction)
CONST_INSTANCE(Scope)
CONST_INSTANCE(Pattern)
CONST_INSTANCE(Property)


#define MUTABLE_INSTANCE(X) \
    template \
    std::deque<X*> hpl::CollectMutable<X>(AstObject& object, const std::function<bool(const X&)>& filter);

MUTABLE_INSTANCE(Expression)
MUTABLE_INSTANCE(Event)
MUTABLE_INSTANCE(FieldAccess)
MUTABLE_INSTANCE(VariableReference)
MUTABLE_INSTANCE(FunctionCall)
MUTABLE_INSTANCE(Quantifier)
MUTABLE_INSTANCE(Predicate)
MUTABLE_INSTANCE(AtomicEvent)
MUTABLE_INSTANCE(EventDisjunction)
