#include "ast/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>

using namespace hpl;


constexpr std::string_view LITERAL_TRUE = "True";
constexpr std::string_view LITERAL_FALSE = "False";
constexpr std::string_view LITERAL_UNKNOWN = "Unknown";
constexpr std::string_view SYMBOL_VARIABLE = "@";
constexpr std::string_view SYMBOL_NOT = "not ";
constexpr std::string_view SYMBOL_AND = " and ";
constexpr std::string_view SYMBOL_OR = " or ";
constexpr std::string_view SYMBOL_IMPLIES = " implies ";
constexpr std::string_view SYMBOL_IFF = " iff ";
constexpr std::string_view SYMBOL_MINUS = "-";
constexpr std::string_view SYMBOL_RANGE = " to ";
constexpr std::string_view SYMBOL_RANGE_EXCLUDE = "!";
constexpr std::string_view SYMBOL_ALIAS = " as ";
constexpr std::string_view SYMBOL_PREDICATE_OPEN = "{ ";
constexpr std::string_view SYMBOL_PREDICATE_CLOSE = " }";
constexpr std::string_view SYMBOL_SCOPE_SEPARATOR = ": ";
constexpr std::string_view KEYWORD_AFTER = "after ";
constexpr std::string_view KEYWORD_UNTIL = "until ";
constexpr std::string_view KEYWORD_SOME = "some ";
constexpr std::string_view KEYWORD_NO = "no ";
constexpr std::string_view KEYWORD_CAUSES = " causes ";
constexpr std::string_view KEYWORD_REQUIRES = " requires ";
constexpr std::string_view KEYWORD_FORBIDS = " forbids ";
constexpr std::string_view KEYWORD_WITHIN = " within ";


//
// Wrappers
//

template<typename T>
std::string MakeString(const T& object) {
    std::stringstream stream;
    stream << object;
    return stream.str();
}

std::string hpl::ToString(const AstObject& object) { return MakeString(object); }

std::string hpl::ToString(ScopeKind kind) {
    switch (kind) {
        case ScopeKind::GLOBAL: return "globally";
        case ScopeKind::AFTER: return "after";
        case ScopeKind::UNTIL: return "until";
        case ScopeKind::AFTER_UNTIL: return "after-until";
    }
    throw std::logic_error("Internal error: unknown scope kind.");
}

std::string hpl::ToString(PatternKind kind) {
    switch (kind) {
        case PatternKind::EXISTENCE: return "existence";
        case PatternKind::ABSENCE: return "absence";
        case PatternKind::RESPONSE: return "response";
        case PatternKind::REQUIREMENT: return "requirement";
        case PatternKind::PREVENTION: return "prevention";
    }
    throw std::logic_error("Internal error: unknown pattern kind.");
}

std::string hpl::ToString(ArithmeticOperator op) {
    switch (op) {
        case ArithmeticOperator::ADD: return "+";
        case ArithmeticOperator::SUB: return "-";
        case ArithmeticOperator::MUL: return "*";
        case ArithmeticOperator::DIV: return "/";
        case ArithmeticOperator::POW: return "**";
    }
    throw std::logic_error("Internal error: unknown arithmetic operator.");
}

std::string hpl::ToString(ComparisonOperator op) {
    switch (op) {
        case ComparisonOperator::EQ: return "=";
        case ComparisonOperator::NEQ: return "!=";
        case ComparisonOperator::LT: return "<";
        case ComparisonOperator::LEQ: return "<=";
        case ComparisonOperator::GT: return ">";
        case ComparisonOperator::GEQ: return ">=";
        case ComparisonOperator::IN: return "in";
    }
    throw std::logic_error("Internal error: unknown comparison operator.");
}

std::string hpl::ToString(QuantifierKind kind) {
    switch (kind) {
        case QuantifierKind::FORALL: return "forall";
        case QuantifierKind::EXISTS: return "exists";
    }
    throw std::logic_error("Internal error: unknown quantifier kind.");
}

std::ostream& hpl::operator<<(std::ostream& stream, const AstObject& object) {
    hpl::Print(object, stream);
    return stream;
}


//
// Printing AST
//

struct AstPrinter : public AstVisitor {
    std::ostream& stream;
    explicit AstPrinter(std::ostream& stream_) : stream(stream_) {}

    template<typename T>
    inline void PrintSequence(const T& container, std::string_view join) {
        bool first = true;
        for (const auto& elem : container) {
            if (first) first = false;
            else stream << join;
            elem->Accept(*this);
        }
    }

    template<typename T>
    inline void PrintBinary(const T& lhs, std::string_view op, const T& rhs) {
        stream << "(";
        lhs->Accept(*this);
        stream << op;
        rhs->Accept(*this);
        stream << ")";
    }

    void Visit(const LogicValue& expression) override {
        switch (expression.value) {
            case Truth::TRUE: stream << LITERAL_TRUE; break;
            case Truth::FALSE: stream << LITERAL_FALSE; break;
            case Truth::UNKNOWN: stream << LITERAL_UNKNOWN; break;
        }
    }
    void Visit(const Negation& expression) override {
        stream << "(" << SYMBOL_NOT;
        expression.operand->Accept(*this);
        stream << ")";
    }
    void Visit(const Conjunction& expression) override {
        stream << "(";
        PrintSequence(expression.operands, SYMBOL_AND);
        stream << ")";
    }
    void Visit(const Disjunction& expression) override {
        stream << "(";
        PrintSequence(expression.operands, SYMBOL_OR);
        stream << ")";
    }
    void Visit(const Implication& expression) override {
        PrintBinary(expression.premise, SYMBOL_IMPLIES, expression.conclusion);
    }
    void Visit(const Equivalence& expression) override {
        PrintBinary(expression.lhs, SYMBOL_IFF, expression.rhs);
    }
    void Visit(const Literal& expression) override { stream << expression.token; }
    void Visit(const ThisMessage& /*expression*/) override { /* printed implicitly */ }
    void Visit(const VariableReference& expression) override { stream << SYMBOL_VARIABLE << expression.name; }
    void Visit(const FieldAccess& expression) override {
        if (dynamic_cast<const ThisMessage*>(expression.message.get()) == nullptr) {
            expression.message->Accept(*this);
            stream << ".";
        }
        stream << expression.field;
    }
    void Visit(const ArrayAccess& expression) override {
        expression.array->Accept(*this);
        stream << "[";
        expression.index->Accept(*this);
        stream << "]";
    }
    void Visit(const SetValue& expression) override {
        stream << "{";
        PrintSequence(expression.values, ", ");
        stream << "}";
    }
    void Visit(const RangeValue& expression) override {
        if (expression.excludeLow) stream << SYMBOL_RANGE_EXCLUDE;
        stream << "[";
        expression.low->Accept(*this);
        stream << SYMBOL_RANGE;
        expression.high->Accept(*this);
        stream << "]";
        if (expression.excludeHigh) stream << SYMBOL_RANGE_EXCLUDE;
    }
    void Visit(const NumericNegation& expression) override {
        stream << "(" << SYMBOL_MINUS;
        expression.operand->Accept(*this);
        stream << ")";
    }
    void Visit(const Arithmetic& expression) override {
        PrintBinary(expression.lhs, " " + ToString(expression.op) + " ", expression.rhs);
    }
    void Visit(const Comparison& expression) override {
        PrintBinary(expression.lhs, " " + ToString(expression.op) + " ", expression.rhs);
    }
    void Visit(const FunctionCall& expression) override {
        stream << expression.name << "(";
        PrintSequence(expression.arguments, ", ");
        stream << ")";
    }
    void Visit(const Quantifier& expression) override {
        stream << "(" << ToString(expression.kind) << " " << expression.variable << " in ";
        expression.domain->Accept(*this);
        stream << ": ";
        expression.condition->Accept(*this);
        stream << ")";
    }

    void Visit(const Predicate& predicate) override {
        stream << SYMBOL_PREDICATE_OPEN;
        predicate.condition->Accept(*this);
        stream << SYMBOL_PREDICATE_CLOSE;
    }
    void Visit(const AtomicEvent& event) override {
        stream << event.channel;
        if (event.alias) stream << SYMBOL_ALIAS << event.alias.value();
        if (event.predicate && !event.predicate->IsVacuous()) {
            stream << " ";
            event.predicate->Accept(*this);
        }
    }
    void Visit(const EventDisjunction& event) override {
        stream << "(";
        PrintSequence(event.disjuncts, SYMBOL_OR);
        stream << ")";
    }

    void PrintOptional(const std::unique_ptr<Event>& event) {
        if (event) event->Accept(*this);
        else stream << "?";
    }

    void Visit(const Scope& scope) override {
        switch (scope.kind) {
            case ScopeKind::GLOBAL:
                stream << ToString(scope.kind);
                break;
            case ScopeKind::AFTER:
                stream << KEYWORD_AFTER;
                PrintOptional(scope.activator);
                break;
            case ScopeKind::UNTIL:
                stream << KEYWORD_UNTIL;
                PrintOptional(scope.terminator);
                break;
            case ScopeKind::AFTER_UNTIL:
                stream << KEYWORD_AFTER;
                PrintOptional(scope.activator);
                stream << " " << KEYWORD_UNTIL;
                PrintOptional(scope.terminator);
                break;
        }
    }
    void Visit(const Pattern& pattern) override {
        switch (pattern.kind) {
            case PatternKind::EXISTENCE:
                stream << KEYWORD_SOME;
                PrintOptional(pattern.behaviour);
                break;
            case PatternKind::ABSENCE:
                stream << KEYWORD_NO;
                PrintOptional(pattern.behaviour);
                break;
            case PatternKind::RESPONSE:
                PrintOptional(pattern.trigger);
                stream << KEYWORD_CAUSES;
                PrintOptional(pattern.behaviour);
                break;
            case PatternKind::REQUIREMENT:
                PrintOptional(pattern.behaviour);
                stream << KEYWORD_REQUIRES;
                PrintOptional(pattern.trigger);
                break;
            case PatternKind::PREVENTION:
                PrintOptional(pattern.trigger);
                stream << KEYWORD_FORBIDS;
                PrintOptional(pattern.behaviour);
                break;
        }
        if (pattern.minTime > 0) stream << KEYWORD_WITHIN << "[" << pattern.minTime << ", " << pattern.maxTime << "]s";
        else if (pattern.maxTime < INFINITE_TIME) stream << KEYWORD_WITHIN << pattern.maxTime << "s";
    }
    void Visit(const Property& property) override {
        if (property.scope) property.scope->Accept(*this);
        stream << SYMBOL_SCOPE_SEPARATOR;
        if (property.pattern) property.pattern->Accept(*this);
    }
};

void hpl::Print(const AstObject& object, std::ostream& out) {
    AstPrinter printer(out);
    object.Accept(printer);
}
