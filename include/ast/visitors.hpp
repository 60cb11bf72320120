#pragma once
#ifndef HPL_AST_VISITORS_HPP
#define HPL_AST_VISITORS_HPP

namespace hpl {

    // forward declarations
    struct LogicValue;
    struct Negation;
    struct Conjunction;
    struct Disjunction;
    struct Implication;
    struct Equivalence;
    struct Literal;
    struct ThisMessage;
    struct VariableReference;
    struct FieldAccess;
    struct ArrayAccess;
    struct SetValue;
    struct RangeValue;
    struct NumericNegation;
    struct Arithmetic;
    struct Comparison;
    struct FunctionCall;
    struct Quantifier;
    struct Predicate;
    struct AtomicEvent;
    struct EventDisjunction;
    struct Scope;
    struct Pattern;
    struct Property;

    //
    // Const visitors
    //

    struct AstVisitor {
        virtual ~AstVisitor() = default;

        virtual void Visit(const LogicValue& object) = 0;
        virtual void Visit(const Negation& object) = 0;
        virtual void Visit(const Conjunction& object) = 0;
        virtual void Visit(const Disjunction& object) = 0;
        virtual void Visit(const Implication& object) = 0;
        virtual void Visit(const Equivalence& object) = 0;
        virtual void Visit(const Literal& object) = 0;
        virtual void Visit(const ThisMessage& object) = 0;
        virtual void Visit(const VariableReference& object) = 0;
        virtual void Visit(const FieldAccess& object) = 0;
        virtual void Visit(const ArrayAccess& object) = 0;
        virtual void Visit(const SetValue& object) = 0;
        virtual void Visit(const RangeValue& object) = 0;
        virtual void Visit(const NumericNegation& object) = 0;
        virtual void Visit(const Arithmetic& object) = 0;
        virtual void Visit(const Comparison& object) = 0;
        virtual void Visit(const FunctionCall& object) = 0;
        virtual void Visit(const Quantifier& object) = 0;
        virtual void Visit(const Predicate& object) = 0;
        virtual void Visit(const AtomicEvent& object) = 0;
        virtual void Visit(const EventDisjunction& object) = 0;
        virtual void Visit(const Scope& object) = 0;
        virtual void Visit(const Pattern& object) = 0;
        virtual void Visit(const Property& object) = 0;

        void Walk(const LogicValue& object);
        void Walk(const Negation& object);
        void Walk(const Conjunction& object);
        void Walk(const Disjunction& object);
        void Walk(const Implication& object);
        void Walk(const Equivalence& object);
        void Walk(const Literal& object);
        void Walk(const ThisMessage& object);
        void Walk(const VariableReference& object);
        void Walk(const FieldAccess& object);
        void Walk(const ArrayAccess& object);
        void Walk(const SetValue& object);
        void Walk(const RangeValue& object);
        void Walk(const NumericNegation& object);
        void Walk(const Arithmetic& object);
        void Walk(const Comparison& object);
        void Walk(const FunctionCall& object);
        void Walk(const Quantifier& object);
        void Walk(const Predicate& object);
        void Walk(const AtomicEvent& object);
        void Walk(const EventDisjunction& object);
        void Walk(const Scope& object);
        void Walk(const Pattern& object);
        void Walk(const Property& object);
    };

    /**
     * AstVisitor that throws an exception in every function, unless overridden.
     */
    struct BaseAstVisitor : public AstVisitor {
        void Visit(const LogicValue& object) override;
        void Visit(const Negation& object) override;
        void Visit(const Conjunction& object) override;
        void Visit(const Disjunction& object) override;
        void Visit(const Implication& object) override;
        void Visit(const Equivalence& object) override;
        void Visit(const Literal& object) override;
        void Visit(const ThisMessage& object) override;
        void Visit(const VariableReference& object) override;
        void Visit(const FieldAccess& object) override;
        void Visit(const ArrayAccess& object) override;
        void Visit(const SetValue& object) override;
        void Visit(const RangeValue& object) override;
        void Visit(const NumericNegation& object) override;
        void Visit(const Arithmetic& object) override;
        void Visit(const Comparison& object) override;
        void Visit(const FunctionCall& object) override;
        void Visit(const Quantifier& object) override;
        void Visit(const Predicate& object) override;
        void Visit(const AtomicEvent& object) override;
        void Visit(const EventDisjunction& object) override;
        void Visit(const Scope& object) override;
        void Visit(const Pattern& object) override;
        void Visit(const Property& object) override;
    };

    /**
     * AstVisitor that does nothing, unless overridden.
     */
    struct DefaultAstVisitor : public AstVisitor {
        void Visit(const LogicValue& object) override;
        void Visit(const Negation& object) override;
        void Visit(const Conjunction& object) override;
        void Visit(const Disjunction& object) override;
        void Visit(const Implication& object) override;
        void Visit(const Equivalence& object) override;
        void Visit(const Literal& object) override;
        void Visit(const ThisMessage& object) override;
        void Visit(const VariableReference& object) override;
        void Visit(const FieldAccess& object) override;
        void Visit(const ArrayAccess& object) override;
        void Visit(const SetValue& object) override;
        void Visit(const RangeValue& object) override;
        void Visit(const NumericNegation& object) override;
        void Visit(const Arithmetic& object) override;
        void Visit(const Comparison& object) override;
        void Visit(const FunctionCall& object) override;
        void Visit(const Quantifier& object) override;
        void Visit(const Predicate& object) override;
        void Visit(const AtomicEvent& object) override;
        void Visit(const EventDisjunction& object) override;
        void Visit(const Scope& object) override;
        void Visit(const Pattern& object) override;
        void Visit(const Property& object) override;
    };

    /**
     * AstVisitor that walks the AST.
     */
    struct AstListener : public AstVisitor {
        void Visit(const LogicValue& object) override;
        void Visit(const Negation& object) override;
        void Visit(const Conjunction& object) override;
        void Visit(const Disjunction& object) override;
        void Visit(const Implication& object) override;
        void Visit(const Equivalence& object) override;
        void Visit(const Literal& object) override;
        void Visit(const ThisMessage& object) override;
        void Visit(const VariableReference& object) override;
        void Visit(const FieldAccess& object) override;
        void Visit(const ArrayAccess& object) override;
        void Visit(const SetValue& object) override;
        void Visit(const RangeValue& object) override;
        void Visit(const NumericNegation& object) override;
        void Visit(const Arithmetic& object) override;
        void Visit(const Comparison& object) override;
        void Visit(const FunctionCall& object) override;
        void Visit(const Quantifier& object) override;
        void Visit(const Predicate& object) override;
        void Visit(const AtomicEvent& object) override;
        void Visit(const EventDisjunction& object) override;
        void Visit(const Scope& object) override;
        void Visit(const Pattern& object) override;
        void Visit(const Property& object) override;

        virtual void Enter(const LogicValue& object);
        virtual void Enter(const Negation& object);
        virtual void Enter(const Conjunction& object);
        virtual void Enter(const Disjunction& object);
        virtual void Enter(const Implication& object);
        virtual void Enter(const Equivalence& object);
        virtual void Enter(const Literal& object);
        virtual void Enter(const ThisMessage& object);
        virtual void Enter(const VariableReference& object);
        virtual void Enter(const FieldAccess& object);
        virtual void Enter(const ArrayAccess& object);
        virtual void Enter(const SetValue& object);
        virtual void Enter(const RangeValue& object);
        virtual void Enter(const NumericNegation& object);
        virtual void Enter(const Arithmetic& object);
        virtual void Enter(const Comparison& object);
        virtual void Enter(const FunctionCall& object);
        virtual void Enter(const Quantifier& object);
        virtual void Enter(const Predicate& object);
        virtual void Enter(const AtomicEvent& object);
        virtual void Enter(const EventDisjunction& object);
        virtual void Enter(const Scope& object);
        virtual void Enter(const Pattern& object);
        virtual void Enter(const Property& object);
    };

    //
    // Non-const visitors
    //

    struct MutableAstVisitor {
        virtual ~MutableAstVisitor() = default;

        virtual void Visit(LogicValue& object) = 0;
        virtual void Visit(Negation& object) = 0;
        virtual void Visit(Conjunction& object) = 0;
        virtual void Visit(Disjunction& object) = 0;
        virtual void Visit(Implication& object) = 0;
        virtual void Visit(Equivalence& object) = 0;
        virtual void Visit(Literal& object) = 0;
        virtual void Visit(ThisMessage& object) = 0;
        virtual void Visit(VariableReference& object) = 0;
        virtual void Visit(FieldAccess& object) = 0;
        virtual void Visit(ArrayAccess& object) = 0;
        virtual void Visit(SetValue& object) = 0;
        virtual void Visit(RangeValue& object) = 0;
        virtual void Visit(NumericNegation& object) = 0;
        virtual void Visit(Arithmetic& object) = 0;
        virtual void Visit(Comparison& object) = 0;
        virtual void Visit(FunctionCall& object) = 0;
        virtual void Visit(Quantifier& object) = 0;
        virtual void Visit(Predicate& object) = 0;
        virtual void Visit(AtomicEvent& object) = 0;
        virtual void Visit(EventDisjunction& object) = 0;
        virtual void Visit(Scope& object) = 0;
        virtual void Visit(Pattern& object) = 0;
        virtual void Visit(Property& object) = 0;

        void Walk(LogicValue& object);
        void Walk(Negation& object);
        void Walk(Conjunction& object);
        void Walk(Disjunction& object);
        void Walk(Implication& object);
        void Walk(Equivalence& object);
        void Walk(Literal& object);
        void Walk(ThisMessage& object);
        void Walk(VariableReference& object);
        void Walk(FieldAccess& object);
        void Walk(ArrayAccess& object);
        void Walk(SetValue& object);
        void Walk(RangeValue& object);
        void Walk(NumericNegation& object);
        void Walk(Arithmetic& object);
        void Walk(Comparison& object);
        void Walk(FunctionCall& object);
        void Walk(Quantifier& object);
        void Walk(Predicate& object);
        void Walk(AtomicEvent& object);
        void Walk(EventDisjunction& object);
        void Walk(Scope& object);
        void Walk(Pattern& object);
        void Walk(Property& object);
    };

    /**
     * MutableAstVisitor that does nothing, unless overridden.
     */
    struct MutableDefaultAstVisitor : public MutableAstVisitor {
        void Visit(LogicValue& object) override;
        void Visit(Negation& object) override;
        void Visit(Conjunction& object) override;
        void Visit(Disjunction& object) override;
        void Visit(Implication& object) override;
        void Visit(Equivalence& object) override;
        void Visit(Literal& object) override;
        void Visit(ThisMessage& object) override;
        void Visit(VariableReference& object) override;
        void Visit(FieldAccess& object) override;
        void Visit(ArrayAccess& object) override;
        void Visit(SetValue& object) override;
        void Visit(RangeValue& object) override;
        void Visit(NumericNegation& object) override;
        void Visit(Arithmetic& object) override;
        void Visit(Comparison& object) override;
        void Visit(FunctionCall& object) override;
        void Visit(Quantifier& object) override;
        void Visit(Predicate& object) override;
        void Visit(AtomicEvent& object) override;
        void Visit(EventDisjunction& object) override;
        void Visit(Scope& object) override;
        void Visit(Pattern& object) override;
        void Visit(Property& object) override;
    };

} // namespace hpl

#endif //HPL_AST_VISITORS_HPP
