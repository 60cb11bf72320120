#include "ast/ast.hpp"

#include <set>
#include <atomic>
#include <sstream>
#include <stdexcept>
#include "ast/error.hpp"
#include "util/shortcuts.hpp"

using namespace hpl;


//
// Identity
//

inline NodeId MakeNodeId() {
    static std::atomic<NodeId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

AstObject::AstObject() : id(MakeNodeId()) {}


//
// Helpers
//

template<typename T>
inline std::unique_ptr<T> CheckPresent(std::unique_ptr<T> object, const std::string& name) {
    if (!object) throw ConstructionError(ConstructionErrorKind::EMPTY_OPERANDS, name, "missing operand");
    return object;
}

template<typename T>
inline std::deque<std::unique_ptr<T>> CheckOperands(std::deque<std::unique_ptr<T>> operands, const std::string& name) {
    if (operands.empty()) throw ConstructionError(ConstructionErrorKind::EMPTY_OPERANDS, name, "at least one operand required");
    for (const auto& elem : operands) {
        if (!elem) throw ConstructionError(ConstructionErrorKind::EMPTY_OPERANDS, name, "missing operand");
    }
    return operands;
}

template<typename T>
inline std::deque<std::unique_ptr<T>> MakeDeque(std::unique_ptr<T> lhs, std::unique_ptr<T> rhs) {
    std::deque<std::unique_ptr<T>> result;
    result.push_back(std::move(lhs));
    result.push_back(std::move(rhs));
    return result;
}

inline std::string CheckName(std::string name, const std::string& what) {
    if (name.empty()) throw ConstructionError(ConstructionErrorKind::EMPTY_NAME, what, "name must not be empty");
    return name;
}

inline std::string MakeToken(double value) {
    std::stringstream stream;
    stream << value;
    return stream.str();
}


//
// Expressions
//

LogicValue::LogicValue(Truth value) : value(value) {}

LogicValue::LogicValue(bool value) : value(value ? Truth::TRUE : Truth::FALSE) {}

TypeSet LogicValue::GetType() const { return TypeSet::Bool(); }

Negation::Negation(std::unique_ptr<Expression> operand_) : operand(CheckPresent(std::move(operand_), "not")) {}

TypeSet Negation::GetType() const { return TypeSet::Bool(); }

Conjunction::Conjunction(std::deque<std::unique_ptr<Expression>> operands_)
        : operands(CheckOperands(std::move(operands_), "and")) {}

Conjunction::Conjunction(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs)
        : Conjunction(MakeDeque(std::move(lhs), std::move(rhs))) {}

TypeSet Conjunction::GetType() const { return TypeSet::Bool(); }

Disjunction::Disjunction(std::deque<std::unique_ptr<Expression>> operands_)
        : operands(CheckOperands(std::move(operands_), "or")) {}

Disjunction::Disjunction(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs)
        : Disjunction(MakeDeque(std::move(lhs), std::move(rhs))) {}

TypeSet Disjunction::GetType() const { return TypeSet::Bool(); }

Implication::Implication(std::unique_ptr<Expression> premise_, std::unique_ptr<Expression> conclusion_)
        : premise(CheckPresent(std::move(premise_), "implies")), conclusion(CheckPresent(std::move(conclusion_), "implies")) {}

TypeSet Implication::GetType() const { return TypeSet::Bool(); }

Equivalence::Equivalence(std::unique_ptr<Expression> lhs_, std::unique_ptr<Expression> rhs_)
        : lhs(CheckPresent(std::move(lhs_), "iff")), rhs(CheckPresent(std::move(rhs_), "iff")) {}

TypeSet Equivalence::GetType() const { return TypeSet::Bool(); }

Literal::Literal(bool value) : token(value ? "True" : "False"), value(value) {}

Literal::Literal(int value) : Literal(static_cast<double>(value)) {}

Literal::Literal(double value) : token(MakeToken(value)), value(value) {}

Literal::Literal(const char* value) : Literal(std::string(value)) {}

Literal::Literal(std::string value_) : token("\"" + value_ + "\""), value(std::move(value_)) {}

Literal::Literal(std::string token, Value value) : token(std::move(token)), value(std::move(value)) {}

TypeSet Literal::GetType() const {
    if (std::holds_alternative<bool>(value)) return TypeSet::Bool();
    if (std::holds_alternative<double>(value)) return TypeSet::Number();
    return TypeSet::String();
}

ThisMessage::ThisMessage() = default;

TypeSet ThisMessage::GetType() const { return TypeSet::Message(); }

VariableReference::VariableReference(std::string name_) : name(CheckName(std::move(name_), "variable")) {}

TypeSet VariableReference::GetType() const { return TypeSet::Item(); }

FieldAccess::FieldAccess(std::unique_ptr<Expression> message_, std::string field_)
        : message(CheckPresent(std::move(message_), "field access")), field(CheckName(std::move(field_), "field")) {}

TypeSet FieldAccess::GetType() const { return TypeSet::Field(); }

const Expression& FieldAccess::Root() const {
    const Expression* current = message.get();
    while (true) {
        if (auto access = dynamic_cast<const FieldAccess*>(current)) current = access->message.get();
        else if (auto array = dynamic_cast<const ArrayAccess*>(current)) current = array->array.get();
        else return *current;
    }
}

std::string FieldAccess::Path() const {
    std::string prefix;
    if (auto access = dynamic_cast<const FieldAccess*>(message.get())) prefix = access->Path() + ".";
    else if (auto array = dynamic_cast<const ArrayAccess*>(message.get())) {
        if (auto inner = dynamic_cast<const FieldAccess*>(array->array.get())) prefix = inner->Path() + "[].";
    }
    return prefix + field;
}

std::optional<std::string> FieldAccess::RootAlias() const {
    if (auto variable = dynamic_cast<const VariableReference*>(&Root())) return variable->name;
    return std::nullopt;
}

bool FieldAccess::IsSelfReference() const {
    return dynamic_cast<const ThisMessage*>(&Root()) != nullptr;
}

ArrayAccess::ArrayAccess(std::unique_ptr<Expression> array_, std::unique_ptr<Expression> index_)
        : array(CheckPresent(std::move(array_), "array access")), index(CheckPresent(std::move(index_), "array access")) {}

TypeSet ArrayAccess::GetType() const { return TypeSet::Item(); }

SetValue::SetValue(std::deque<std::unique_ptr<Expression>> values_) : values(std::move(values_)) {
    for (const auto& elem : values) {
        if (!elem) throw ConstructionError(ConstructionErrorKind::EMPTY_OPERANDS, "set", "missing element");
    }
}

TypeSet SetValue::GetType() const { return TypeSet::Set(); }

RangeValue::RangeValue(std::unique_ptr<Expression> low_, std::unique_ptr<Expression> high_, bool excludeLow, bool excludeHigh)
        : low(CheckPresent(std::move(low_), "range")), high(CheckPresent(std::move(high_), "range")),
          excludeLow(excludeLow), excludeHigh(excludeHigh) {}

TypeSet RangeValue::GetType() const { return TypeSet::Range(); }

NumericNegation::NumericNegation(std::unique_ptr<Expression> operand_) : operand(CheckPresent(std::move(operand_), "-")) {}

TypeSet NumericNegation::GetType() const { return TypeSet::Number(); }

Arithmetic::Arithmetic(ArithmeticOperator op, std::unique_ptr<Expression> lhs_, std::unique_ptr<Expression> rhs_)
        : op(op), lhs(CheckPresent(std::move(lhs_), "arithmetic")), rhs(CheckPresent(std::move(rhs_), "arithmetic")) {}

TypeSet Arithmetic::GetType() const { return TypeSet::Number(); }

Comparison::Comparison(ComparisonOperator op, std::unique_ptr<Expression> lhs_, std::unique_ptr<Expression> rhs_)
        : op(op), lhs(CheckPresent(std::move(lhs_), "comparison")), rhs(CheckPresent(std::move(rhs_), "comparison")) {}

TypeSet Comparison::GetType() const { return TypeSet::Bool(); }

FunctionCall::FunctionCall(std::string name_, std::deque<std::unique_ptr<Expression>> arguments_)
        : name(CheckName(std::move(name_), "function")), arguments(std::move(arguments_)) {
    for (const auto& elem : arguments) {
        if (!elem) throw ConstructionError(ConstructionErrorKind::EMPTY_OPERANDS, name, "missing argument");
    }
}

TypeSet FunctionCall::GetType() const { return TypeSet::Any(); }

Quantifier::Quantifier(QuantifierKind kind, std::string variable_, std::unique_ptr<Expression> domain_,
                       std::unique_ptr<Expression> condition_)
        : kind(kind), variable(CheckName(std::move(variable_), "quantified variable")),
          domain(CheckPresent(std::move(domain_), "quantifier")), condition(CheckPresent(std::move(condition_), "quantifier")) {
    if (!condition->CanBe(TypeSet::Bool())) {
        throw ConstructionError(ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION, variable, "quantified condition must be boolean");
    }
}

TypeSet Quantifier::GetType() const { return TypeSet::Bool(); }


//
// Predicates
//

Predicate::Predicate(std::unique_ptr<Expression> condition_) : condition(CheckPresent(std::move(condition_), "predicate")) {
    if (!condition->CanBe(TypeSet::Bool())) {
        throw ConstructionError(ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION, "predicate", "condition must be boolean");
    }
}

bool Predicate::IsVacuous() const {
    auto value = dynamic_cast<const LogicValue*>(condition.get());
    return value && value->value == Truth::TRUE;
}

bool Predicate::IsUnsatisfiable() const {
    auto value = dynamic_cast<const LogicValue*>(condition.get());
    return value && value->value == Truth::FALSE;
}

std::unique_ptr<Predicate> Predicate::Vacuous() {
    return std::make_unique<Predicate>(std::make_unique<LogicValue>(true));
}


//
// Events
//

std::vector<std::string> Event::Channels() const {
    std::vector<std::string> result;
    for (const auto* event : SimpleEvents()) result.push_back(event->channel);
    return result;
}

std::vector<std::string> Event::Aliases() const {
    std::vector<std::string> result;
    for (const auto* event : SimpleEvents()) {
        if (!event->alias || Membership(result, event->alias.value())) continue;
        result.push_back(event->alias.value());
    }
    return result;
}

AtomicEvent::AtomicEvent(std::string channel_, std::unique_ptr<Predicate> predicate_, std::optional<std::string> alias_,
                         std::optional<std::string> messageType_)
        : channel(CheckName(std::move(channel_), "channel")), predicate(std::move(predicate_)), alias(std::move(alias_)),
          messageType(std::move(messageType_)) {
    if (!predicate) predicate = Predicate::Vacuous();
    if (alias && alias->empty()) throw ConstructionError(ConstructionErrorKind::EMPTY_NAME, channel, "alias must not be empty");
    if (messageType && messageType->empty()) {
        throw ConstructionError(ConstructionErrorKind::EMPTY_NAME, channel, "message type must not be empty");
    }
}

std::deque<const AtomicEvent*> AtomicEvent::SimpleEvents() const {
    return { this };
}

EventDisjunction::EventDisjunction(std::deque<std::unique_ptr<Event>> disjuncts_) : disjuncts(std::move(disjuncts_)) {
    if (disjuncts.size() < 2) {
        throw ConstructionError(ConstructionErrorKind::INVALID_DISJUNCTION_ARITY, std::to_string(disjuncts.size()),
                                "event disjunctions require at least two events");
    }
    for (const auto& elem : disjuncts) {
        if (!elem) throw ConstructionError(ConstructionErrorKind::INVALID_DISJUNCTION_ARITY, "null", "missing event");
    }
    std::set<std::string> seen;
    for (const auto& channel : Channels()) {
        if (seen.insert(channel).second) continue;
        throw ConstructionError(ConstructionErrorKind::NON_UNIQUE_DISJUNCT_CHANNEL, channel,
                                "channel appears multiple times in an event disjunction");
    }
}

EventDisjunction::EventDisjunction(std::unique_ptr<Event> lhs, std::unique_ptr<Event> rhs)
        : EventDisjunction(MakeDeque(std::move(lhs), std::move(rhs))) {}

std::deque<const AtomicEvent*> EventDisjunction::SimpleEvents() const {
    std::deque<const AtomicEvent*> result;
    for (const auto& elem : disjuncts) {
        if (elem) MoveInto(elem->SimpleEvents(), result);
    }
    return result;
}


//
// Scopes
//

inline const char* ScopeName(ScopeKind kind) {
    switch (kind) {
        case ScopeKind::GLOBAL: return "globally";
        case ScopeKind::AFTER: return "after";
        case ScopeKind::UNTIL: return "until";
        case ScopeKind::AFTER_UNTIL: return "after-until";
    }
    return "?";
}

Scope::Scope(ScopeKind kind, std::unique_ptr<Event> activator_, std::unique_ptr<Event> terminator_)
        : kind(kind), activator(std::move(activator_)), terminator(std::move(terminator_)) {
    auto needsActivator = kind == ScopeKind::AFTER || kind == ScopeKind::AFTER_UNTIL;
    auto needsTerminator = kind == ScopeKind::UNTIL || kind == ScopeKind::AFTER_UNTIL;
    if (needsActivator != (activator != nullptr)) {
        throw ConstructionError(ConstructionErrorKind::INVALID_SCOPE, ScopeName(kind),
                                needsActivator ? "activator required" : "unexpected activator");
    }
    if (needsTerminator != (terminator != nullptr)) {
        throw ConstructionError(ConstructionErrorKind::INVALID_SCOPE, ScopeName(kind),
                                needsTerminator ? "terminator required" : "unexpected terminator");
    }
}

bool Scope::HasActivator() const { return activator != nullptr; }

bool Scope::HasTerminator() const { return terminator != nullptr; }

std::unique_ptr<Scope> Scope::Global() {
    return std::make_unique<Scope>(ScopeKind::GLOBAL);
}

std::unique_ptr<Scope> Scope::After(std::unique_ptr<Event> activator) {
    return std::make_unique<Scope>(ScopeKind::AFTER, std::move(activator));
}

std::unique_ptr<Scope> Scope::Until(std::unique_ptr<Event> terminator) {
    return std::make_unique<Scope>(ScopeKind::UNTIL, nullptr, std::move(terminator));
}

std::unique_ptr<Scope> Scope::AfterUntil(std::unique_ptr<Event> activator, std::unique_ptr<Event> terminator) {
    return std::make_unique<Scope>(ScopeKind::AFTER_UNTIL, std::move(activator), std::move(terminator));
}


//
// Patterns
//

bool hpl::RequiresTrigger(PatternKind kind) {
    switch (kind) {
        case PatternKind::EXISTENCE:
        case PatternKind::ABSENCE:
            return false;
        case PatternKind::RESPONSE:
        case PatternKind::REQUIREMENT:
        case PatternKind::PREVENTION:
            return true;
    }
    throw std::logic_error("Internal error: unknown pattern kind.");
}

Pattern::Pattern(PatternKind kind, std::unique_ptr<Event> behaviour_, std::unique_ptr<Event> trigger_, double minTime,
                 double maxTime)
        : kind(kind), behaviour(std::move(behaviour_)), trigger(std::move(trigger_)), minTime(minTime), maxTime(maxTime) {
    if (!behaviour) throw ConstructionError(ConstructionErrorKind::INVALID_PATTERN, "behaviour", "behaviour event required");
    if (RequiresTrigger(kind) != (trigger != nullptr)) {
        throw ConstructionError(ConstructionErrorKind::INVALID_PATTERN, "trigger",
                                trigger ? "pattern does not accept a trigger" : "trigger event required");
    }
    if (!(minTime >= 0) || !(maxTime >= minTime)) {
        throw ConstructionError(ConstructionErrorKind::INVALID_TIME_BOUNDS,
                                "[" + MakeToken(minTime) + ", " + MakeToken(maxTime) + "]", "expected 0 <= min <= max");
    }
}

bool Pattern::HasTimeBounds() const {
    return minTime > 0 || maxTime < INFINITE_TIME;
}

bool Pattern::IsSafety() const {
    return kind == PatternKind::ABSENCE || kind == PatternKind::REQUIREMENT || kind == PatternKind::PREVENTION;
}

bool Pattern::IsLiveness() const {
    return kind == PatternKind::EXISTENCE || kind == PatternKind::RESPONSE;
}

std::unique_ptr<Pattern> Pattern::Existence(std::unique_ptr<Event> behaviour, double minTime, double maxTime) {
    return std::make_unique<Pattern>(PatternKind::EXISTENCE, std::move(behaviour), nullptr, minTime, maxTime);
}

std::unique_ptr<Pattern> Pattern::Absence(std::unique_ptr<Event> behaviour, double minTime, double maxTime) {
    return std::make_unique<Pattern>(PatternKind::ABSENCE, std::move(behaviour), nullptr, minTime, maxTime);
}

std::unique_ptr<Pattern> Pattern::Response(std::unique_ptr<Event> trigger, std::unique_ptr<Event> behaviour,
                                           double minTime, double maxTime) {
    return std::make_unique<Pattern>(PatternKind::RESPONSE, std::move(behaviour), std::move(trigger), minTime, maxTime);
}

std::unique_ptr<Pattern> Pattern::Requirement(std::unique_ptr<Event> behaviour, std::unique_ptr<Event> required,
                                              double minTime, double maxTime) {
    return std::make_unique<Pattern>(PatternKind::REQUIREMENT, std::move(behaviour), std::move(required), minTime, maxTime);
}

std::unique_ptr<Pattern> Pattern::Prevention(std::unique_ptr<Event> trigger, std::unique_ptr<Event> behaviour,
                                             double minTime, double maxTime) {
    return std::make_unique<Pattern>(PatternKind::PREVENTION, std::move(behaviour), std::move(trigger), minTime, maxTime);
}


//
// Properties
//

Property::Property(std::unique_ptr<Scope> scope_, std::unique_ptr<Pattern> pattern_, std::map<std::string, std::string> metadata)
        : scope(std::move(scope_)), pattern(std::move(pattern_)), metadata(std::move(metadata)) {
    if (!scope) throw ConstructionError(ConstructionErrorKind::INVALID_SCOPE, "property", "scope required");
    if (!pattern) throw ConstructionError(ConstructionErrorKind::INVALID_PATTERN, "property", "pattern required");
}

std::optional<std::string> Property::Uid() const {
    auto find = metadata.find("id");
    if (find == metadata.end()) return std::nullopt;
    return find->second;
}

bool Property::IsSafety() const { return pattern && pattern->IsSafety(); }

bool Property::IsLiveness() const { return pattern && pattern->IsLiveness(); }

std::deque<const Event*> Property::Events() const {
    std::deque<const Event*> result;
    if (scope && scope->activator) result.push_back(scope->activator.get());
    if (pattern && pattern->behaviour) result.push_back(pattern->behaviour.get());
    if (pattern && pattern->trigger) result.push_back(pattern->trigger.get());
    if (scope && scope->terminator) result.push_back(scope->terminator.get());
    return result;
}

Specification::Specification(std::deque<std::unique_ptr<Property>> properties) : properties(std::move(properties)) {}
