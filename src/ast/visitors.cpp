#include "ast/visitors.hpp"

#include "ast/ast.hpp"
#include "util/shortcuts.hpp"

using namespace hpl;


//
// Walking the AST
//

void AstVisitor::Walk(const LogicValue& /*object*/) { /* do nothing */ }
void AstVisitor::Walk(const Negation& object) {
    object.operand->Accept(*this);
}
void AstVisitor::Walk(const Conjunction& object) {
    for (const auto& elem : object.operands) elem->Accept(*this);
}
void AstVisitor::Walk(const Disjunction& object) {
    for (const auto& elem : object.operands) elem->Accept(*this);
}
void AstVisitor::Walk(const Implication& object) {
    object.premise->Accept(*this);
    object.conclusion->Accept(*this);
}
void AstVisitor::Walk(const Equivalence& object) {
    object.lhs->Accept(*this);
    object.rhs->Accept(*this);
}
void AstVisitor::Walk(const Literal& /*object*/) { /* do nothing */ }
void AstVisitor::Walk(const ThisMessage& /*object*/) { /* do nothing */ }
void AstVisitor::Walk(const VariableReference& /*object*/) { /* do nothing */ }
void AstVisitor::Walk(const FieldAccess& object) {
    object.message->Accept(*this);
}
void AstVisitor::Walk(const ArrayAccess& object) {
    object.array->Accept(*this);
    object.index->Accept(*this);
}
void AstVisitor::Walk(const SetValue& object) {
    for (const auto& elem : object.values) elem->Accept(*this);
}
void AstVisitor::Walk(const RangeValue& object) {
    object.low->Accept(*this);
    object.high->Accept(*this);
}
void AstVisitor::Walk(const NumericNegation& object) {
    object.operand->Accept(*this);
}
void AstVisitor::Walk(const Arithmetic& object) {
    object.lhs->Accept(*this);
    object.rhs->Accept(*this);
}
void AstVisitor::Walk(const Comparison& object) {
    object.lhs->Accept(*this);
    object.rhs->Accept(*this);
}
void AstVisitor::Walk(const FunctionCall& object) {
    for (const auto& elem : object.arguments) elem->Accept(*this);
}
void AstVisitor::Walk(const Quantifier& object) {
    object.domain->Accept(*this);
    object.condition->Accept(*this);
}
void AstVisitor::Walk(const Predicate& object) {
    object.condition->Accept(*this);
}
void AstVisitor::Walk(const AtomicEvent& object) {
    if (object.predicate) object.predicate->Accept(*this);
}
void AstVisitor::Walk(const EventDisjunction& object) {
    for (const auto& elem : object.disjuncts) elem->Accept(*this);
}
void AstVisitor::Walk(const Scope& object) {
    if (object.activator) object.activator->Accept(*this);
    if (object.terminator) object.terminator->Accept(*this);
}
void AstVisitor::Walk(const Pattern& object) {
    if (object.behaviour) object.behaviour->Accept(*this);
    if (object.trigger) object.trigger->Accept(*this);
}
void AstVisitor::Walk(const Property& object) {
    if (object.scope) object.scope->Accept(*this);
    if (object.pattern) object.pattern->Accept(*this);
}

void MutableAstVisitor::Walk(LogicValue& /*object*/) { /* do nothing */ }
void MutableAstVisitor::Walk(Negation& object) {
    object.operand->Accept(*this);
}
void MutableAstVisitor::Walk(Conjunction& object) {
    for (auto& elem : object.operands) elem->Accept(*this);
}
void MutableAstVisitor::Walk(Disjunction& object) {
    for (auto& elem : object.operands) elem->Accept(*this);
}
void MutableAstVisitor::Walk(Implication& object) {
    object.premise->Accept(*this);
    object.conclusion->Accept(*this);
}
void MutableAstVisitor::Walk(Equivalence& object) {
    object.lhs->Accept(*this);
    object.rhs->Accept(*this);
}
void MutableAstVisitor::Walk(Literal& /*object*/) { /* do nothing */ }
void MutableAstVisitor::Walk(ThisMessage& /*object*/) { /* do nothing */ }
void MutableAstVisitor::Walk(VariableReference& /*object*/) { /* do nothing */ }
void MutableAstVisitor::Walk(FieldAccess& object) {
    object.message->Accept(*this);
}
void MutableAstVisitor::Walk(ArrayAccess& object) {
    object.array->Accept(*this);
    object.index->Accept(*this);
}
void MutableAstVisitor::Walk(SetValue& object) {
    for (auto& elem : object.values) elem->Accept(*this);
}
void MutableAstVisitor::Walk(RangeValue& object) {
    object.low->Accept(*this);
    object.high->Accept(*this);
}
void MutableAstVisitor::Walk(NumericNegation& object) {
    object.operand->Accept(*this);
}
void MutableAstVisitor::Walk(Arithmetic& object) {
    object.lhs->Accept(*this);
    object.rhs->Accept(*this);
}
void MutableAstVisitor::Walk(Comparison& object) {
    object.lhs->Accept(*this);
    object.rhs->Accept(*this);
}
void MutableAstVisitor::Walk(FunctionCall& object) {
    for (auto& elem : object.arguments) elem->Accept(*this);
}
void MutableAstVisitor::Walk(Quantifier& object) {
    object.domain->Accept(*this);
    object.condition->Accept(*this);
}
void MutableAstVisitor::Walk(Predicate& object) {
    object.condition->Accept(*this);
}
void MutableAstVisitor::Walk(AtomicEvent& object) {
    if (object.predicate) object.predicate->Accept(*this);
}
void MutableAstVisitor::Walk(EventDisjunction& object) {
    for (auto& elem : object.disjuncts) elem->Accept(*this);
}
void MutableAstVisitor::Walk(Scope& object) {
    if (object.activator) object.activator->Accept(*this);
    if (object.terminator) object.terminator->Accept(*this);
}
void MutableAstVisitor::Walk(Pattern& object) {
    if (object.behaviour) object.behaviour->Accept(*this);
    if (object.trigger) object.trigger->Accept(*this);
}
void MutableAstVisitor::Walk(Property& object) {
    if (object.scope) object.scope->Accept(*this);
    if (object.pattern) object.pattern->Accept(*this);
}


//
// Visitors
//

struct AstVisitorNotImplementedException : public ExceptionWithMessage {
    explicit AstVisitorNotImplementedException(std::string base, std::string arg) : ExceptionWithMessage(
            "Call to unimplemented visitor member function with argument type '" + std::move(arg) +
            "' of base class '" + std::move(base) + "'.") {}
};

#define COMPLAIN(B,T) throw AstVisitorNotImplementedException(#B,#T)

void BaseAstVisitor::Visit(const LogicValue& /*object*/) { COMPLAIN(BaseAstVisitor, const LogicValue&); }
void BaseAstVisitor::Visit(const Negation& /*object*/) { COMPLAIN(BaseAstVisitor, const Negation&); }
void BaseAstVisitor::Visit(const Conjunction& /*object*/) { COMPLAIN(BaseAstVisitor, const Conjunction&); }
void BaseAstVisitor::Visit(const Disjunction& /*object*/) { COMPLAIN(BaseAstVisitor, const Disjunction&); }
void BaseAstVisitor::Visit(const Implication& /*object*/) { COMPLAIN(BaseAstVisitor, const Implication&); }
void BaseAstVisitor::Visit(const Equivalence& /*object*/) { COMPLAIN(BaseAstVisitor, const Equivalence&); }
void BaseAstVisitor::Visit(const Literal& /*object*/) { COMPLAIN(BaseAstVisitor, const Literal&); }
void BaseAstVisitor::Visit(const ThisMessage& /*object*/) { COMPLAIN(BaseAstVisitor, const ThisMessage&); }
void BaseAstVisitor::Visit(const VariableReference& /*object*/) { COMPLAIN(BaseAstVisitor, const VariableReference&); }
void BaseAstVisitor::Visit(const FieldAccess& /*object*/) { COMPLAIN(BaseAstVisitor, const FieldAccess&); }
void BaseAstVisitor::Visit(const ArrayAccess& /*object*/) { COMPLAIN(BaseAstVisitor, const ArrayAccess&); }
void BaseAstVisitor::Visit(const SetValue& /*object*/) { COMPLAIN(BaseAstVisitor, const SetValue&); }
void BaseAstVisitor::Visit(const RangeValue& /*object*/) { COMPLAIN(BaseAstVisitor, const RangeValue&); }
void BaseAstVisitor::Visit(const NumericNegation& /*object*/) { COMPLAIN(BaseAstVisitor, const NumericNegation&); }
void BaseAstVisitor::Visit(const Arithmetic& /*object*/) { COMPLAIN(BaseAstVisitor, const Arithmetic&); }
void BaseAstVisitor::Visit(const Comparison& /*object*/) { COMPLAIN(BaseAstVisitor, const Comparison&); }
void BaseAstVisitor::Visit(const FunctionCall& /*object*/) { COMPLAIN(BaseAstVisitor, const FunctionCall&); }
void BaseAstVisitor::Visit(const Quantifier& /*object*/) { COMPLAIN(BaseAstVisitor, const Quantifier&); }
void BaseAstVisitor::Visit(const Predicate& /*object*/) { COMPLAIN(BaseAstVisitor, const Predicate&); }
void BaseAstVisitor::Visit(const AtomicEvent& /*object*/) { COMPLAIN(BaseAstVisitor, const AtomicEvent&); }
void BaseAstVisitor::Visit(const EventDisjunction& /*object*/) { COMPLAIN(BaseAstVisitor, const EventDisjunction&); }
void BaseAstVisitor::Visit(const Scope& /*object*/) { COMPLAIN(BaseAstVisitor, const Scope&); }
void BaseAstVisitor::Visit(const Pattern& /*object*/) { COMPLAIN(BaseAstVisitor, const Pattern&); }
void BaseAstVisitor::Visit(const Property& /*object*/) { COMPLAIN(BaseAstVisitor, const Property&); }

void DefaultAstVisitor::Visit(const LogicValue& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Negation& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Conjunction& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Disjunction& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Implication& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Equivalence& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Literal& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const ThisMessage& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const VariableReference& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const FieldAccess& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const ArrayAccess& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const SetValue& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const RangeValue& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const NumericNegation& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Arithmetic& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Comparison& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const FunctionCall& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Quantifier& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Predicate& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const AtomicEvent& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const EventDisjunction& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Scope& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Pattern& /*object*/) { /* do nothing */ }
void DefaultAstVisitor::Visit(const Property& /*object*/) { /* do nothing */ }

void MutableDefaultAstVisitor::Visit(LogicValue& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Negation& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Conjunction& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Disjunction& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Implication& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Equivalence& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Literal& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(ThisMessage& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(VariableReference& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(FieldAccess& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(ArrayAccess& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(SetValue& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(RangeValue& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(NumericNegation& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Arithmetic& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Comparison& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(FunctionCall& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Quantifier& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Predicate& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(AtomicEvent& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(EventDisjunction& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Scope& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Pattern& /*object*/) { /* do nothing */ }
void MutableDefaultAstVisitor::Visit(Property& /*object*/) { /* do nothing */ }


//
// Listeners
//

void AstListener::Enter(const LogicValue& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Negation& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Conjunction& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Disjunction& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Implication& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Equivalence& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Literal& /*object*/) { /* do nothing */ }
void AstListener::Enter(const ThisMessage& /*object*/) { /* do nothing */ }
void AstListener::Enter(const VariableReference& /*object*/) { /* do nothing */ }
void AstListener::Enter(const FieldAccess& /*object*/) { /* do nothing */ }
void AstListener::Enter(const ArrayAccess& /*object*/) { /* do nothing */ }
void AstListener::Enter(const SetValue& /*object*/) { /* do nothing */ }
void AstListener::Enter(const RangeValue& /*object*/) { /* do nothing */ }
void AstListener::Enter(const NumericNegation& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Arithmetic& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Comparison& /*object*/) { /* do nothing */ }
void AstListener::Enter(const FunctionCall& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Quantifier& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Predicate& /*object*/) { /* do nothing */ }
void AstListener::Enter(const AtomicEvent& /*object*/) { /* do nothing */ }
void AstListener::Enter(const EventDisjunction& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Scope& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Pattern& /*object*/) { /* do nothing */ }
void AstListener::Enter(const Property& /*object*/) { /* do nothing */ }

void AstListener::Visit(const LogicValue& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Negation& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Conjunction& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Disjunction& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Implication& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Equivalence& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Literal& object) { Enter(object); Walk(object); }
void AstListener::Visit(const ThisMessage& object) { Enter(object); Walk(object); }
void AstListener::Visit(const VariableReference& object) { Enter(object); Walk(object); }
void AstListener::Visit(const FieldAccess& object) { Enter(object); Walk(object); }
void AstListener::Visit(const ArrayAccess& object) { Enter(object); Walk(object); }
void AstListener::Visit(const SetValue& object) { Enter(object); Walk(object); }
void AstListener::Visit(const RangeValue& object) { Enter(object); Walk(object); }
void AstListener::Visit(const NumericNegation& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Arithmetic& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Comparison& object) { Enter(object); Walk(object); }
void AstListener::Visit(const FunctionCall& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Quantifier& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Predicate& object) { Enter(object); Walk(object); }
void AstListener::Visit(const AtomicEvent& object) { Enter(object); Walk(object); }
void AstListener::Visit(const EventDisjunction& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Scope& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Pattern& object) { Enter(object); Walk(object); }
void AstListener::Visit(const Property& object) { Enter(object); Walk(object); }
