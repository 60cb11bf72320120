#pragma once
#ifndef HPL_AST_AST_HPP
#define HPL_AST_AST_HPP

#include <map>
#include <deque>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <ostream>
#include <optional>
#include "visitors.hpp"
#include "types.hpp"

namespace hpl {

    using NodeId = std::uint64_t;

    struct AstObject {
        explicit AstObject();
        AstObject(const AstObject& other) = delete;
        virtual ~AstObject() = default;

        [[nodiscard]] inline NodeId Id() const { return id; }

        virtual void Accept(AstVisitor& visitor) const = 0;
        virtual void Accept(MutableAstVisitor& visitor) = 0;

        private:
            NodeId id;
    };

    #define ACCEPT_AST_VISITOR \
        void Accept(AstVisitor& visitor) const override { visitor.Visit(*this); } \
        void Accept(MutableAstVisitor& visitor) override { visitor.Visit(*this); }

    //
    // Expressions
    //

    struct Expression : public AstObject {
        /**
         * Kinds this expression may evaluate to, judged from its own shape only.
         * Context dependent inference happens during validation.
         */
        [[nodiscard]] virtual TypeSet GetType() const = 0;
        [[nodiscard]] inline bool CanBe(TypeSet type) const { return GetType().CanBe(type); }
    };

    enum struct Truth {
        FALSE, TRUE, UNKNOWN
    };

    struct LogicValue final : public Expression {
        Truth value;

        explicit LogicValue(Truth value);
        explicit LogicValue(bool value);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct Negation final : public Expression {
        std::unique_ptr<Expression> operand;

        explicit Negation(std::unique_ptr<Expression> operand);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct Conjunction final : public Expression {
        std::deque<std::unique_ptr<Expression>> operands;

        explicit Conjunction(std::deque<std::unique_ptr<Expression>> operands);
        explicit Conjunction(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct Disjunction final : public Expression {
        std::deque<std::unique_ptr<Expression>> operands;

        explicit Disjunction(std::deque<std::unique_ptr<Expression>> operands);
        explicit Disjunction(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct Implication final : public Expression {
        std::unique_ptr<Expression> premise;
        std::unique_ptr<Expression> conclusion;

        explicit Implication(std::unique_ptr<Expression> premise, std::unique_ptr<Expression> conclusion);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct Equivalence final : public Expression {
        std::unique_ptr<Expression> lhs;
        std::unique_ptr<Expression> rhs;

        explicit Equivalence(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct Literal final : public Expression {
        using Value = std::variant<bool, double, std::string>;
        std::string token;
        Value value;

        explicit Literal(bool value);
        explicit Literal(int value);
        explicit Literal(double value);
        explicit Literal(const char* value);
        explicit Literal(std::string value);
        explicit Literal(std::string token, Value value);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    /**
     * The message of the event whose predicate contains this expression.
     */
    struct ThisMessage final : public Expression {
        explicit ThisMessage();
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    /**
     * Reference to an event alias or to a quantified variable.
     */
    struct VariableReference final : public Expression {
        std::string name;

        explicit VariableReference(std::string name);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct FieldAccess final : public Expression {
        std::unique_ptr<Expression> message;
        std::string field;

        explicit FieldAccess(std::unique_ptr<Expression> message, std::string field);
        [[nodiscard]] TypeSet GetType() const override;

        [[nodiscard]] const Expression& Root() const;
        [[nodiscard]] std::string Path() const;
        [[nodiscard]] std::optional<std::string> RootAlias() const;
        [[nodiscard]] bool IsSelfReference() const;
        ACCEPT_AST_VISITOR
    };

    struct ArrayAccess final : public Expression {
        std::unique_ptr<Expression> array;
        std::unique_ptr<Expression> index;

        explicit ArrayAccess(std::unique_ptr<Expression> array, std::unique_ptr<Expression> index);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct SetValue final : public Expression {
        std::deque<std::unique_ptr<Expression>> values;

        explicit SetValue(std::deque<std::unique_ptr<Expression>> values);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct RangeValue final : public Expression {
        std::unique_ptr<Expression> low;
        std::unique_ptr<Expression> high;
        bool excludeLow;
        bool excludeHigh;

        explicit RangeValue(std::unique_ptr<Expression> low, std::unique_ptr<Expression> high,
                            bool excludeLow = false, bool excludeHigh = false);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    struct NumericNegation final : public Expression {
        std::unique_ptr<Expression> operand;

        explicit NumericNegation(std::unique_ptr<Expression> operand);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    enum struct ArithmeticOperator {
        ADD, SUB, MUL, DIV, POW
    };

    struct Arithmetic final : public Expression {
        ArithmeticOperator op;
        std::unique_ptr<Expression> lhs;
        std::unique_ptr<Expression> rhs;

        explicit Arithmetic(ArithmeticOperator op, std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    enum struct ComparisonOperator {
        EQ, NEQ, LT, LEQ, GT, GEQ, IN
    };

    struct Comparison final : public Expression {
        ComparisonOperator op;
        std::unique_ptr<Expression> lhs;
        std::unique_ptr<Expression> rhs;

        explicit Comparison(ComparisonOperator op, std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    /**
     * Call to a builtin function. The name is resolved against a function registry during validation only.
     */
    struct FunctionCall final : public Expression {
        std::string name;
        std::deque<std::unique_ptr<Expression>> arguments;

        explicit FunctionCall(std::string name, std::deque<std::unique_ptr<Expression>> arguments);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    enum struct QuantifierKind {
        FORALL, EXISTS
    };

    struct Quantifier final : public Expression {
        QuantifierKind kind;
        std::string variable;
        std::unique_ptr<Expression> domain;
        std::unique_ptr<Expression> condition;

        explicit Quantifier(QuantifierKind kind, std::string variable, std::unique_ptr<Expression> domain,
                            std::unique_ptr<Expression> condition);
        [[nodiscard]] TypeSet GetType() const override;
        ACCEPT_AST_VISITOR
    };

    //
    // Predicates
    //

    struct Predicate final : public AstObject {
        std::unique_ptr<Expression> condition;

        explicit Predicate(std::unique_ptr<Expression> condition);
        [[nodiscard]] bool IsVacuous() const;
        [[nodiscard]] bool IsUnsatisfiable() const;
        ACCEPT_AST_VISITOR

        static std::unique_ptr<Predicate> Vacuous();
    };

    //
    // Events
    //

    struct Event : public AstObject {
        /**
         * Atomic events contained in this event, in order, nested disjunctions flattened.
         */
        [[nodiscard]] virtual std::deque<const AtomicEvent*> SimpleEvents() const = 0;
        [[nodiscard]] std::vector<std::string> Channels() const;
        [[nodiscard]] std::vector<std::string> Aliases() const;
    };

    struct AtomicEvent final : public Event {
        std::string channel;
        std::unique_ptr<Predicate> predicate;
        std::optional<std::string> alias;
        std::optional<std::string> messageType;

        explicit AtomicEvent(std::string channel, std::unique_ptr<Predicate> predicate = nullptr,
                             std::optional<std::string> alias = std::nullopt,
                             std::optional<std::string> messageType = std::nullopt);
        [[nodiscard]] std::deque<const AtomicEvent*> SimpleEvents() const override;
        ACCEPT_AST_VISITOR
    };

    struct EventDisjunction final : public Event {
        std::deque<std::unique_ptr<Event>> disjuncts;

        explicit EventDisjunction(std::deque<std::unique_ptr<Event>> disjuncts);
        explicit EventDisjunction(std::unique_ptr<Event> lhs, std::unique_ptr<Event> rhs);
        [[nodiscard]] std::deque<const AtomicEvent*> SimpleEvents() const override;
        ACCEPT_AST_VISITOR
    };

    //
    // Properties
    //

    enum struct ScopeKind {
        GLOBAL, AFTER, UNTIL, AFTER_UNTIL
    };

    struct Scope final : public AstObject {
        ScopeKind kind;
        std::unique_ptr<Event> activator;
        std::unique_ptr<Event> terminator;

        explicit Scope(ScopeKind kind, std::unique_ptr<Event> activator = nullptr, std::unique_ptr<Event> terminator = nullptr);
        [[nodiscard]] bool HasActivator() const;
        [[nodiscard]] bool HasTerminator() const;
        ACCEPT_AST_VISITOR

        static std::unique_ptr<Scope> Global();
        static std::unique_ptr<Scope> After(std::unique_ptr<Event> activator);
        static std::unique_ptr<Scope> Until(std::unique_ptr<Event> terminator);
        static std::unique_ptr<Scope> AfterUntil(std::unique_ptr<Event> activator, std::unique_ptr<Event> terminator);
    };

    enum struct PatternKind {
        EXISTENCE, ABSENCE, RESPONSE, REQUIREMENT, PREVENTION
    };

    constexpr double INFINITE_TIME = std::numeric_limits<double>::infinity();

    struct Pattern final : public AstObject {
        PatternKind kind;
        std::unique_ptr<Event> behaviour;
        std::unique_ptr<Event> trigger;
        double minTime;
        double maxTime;

        explicit Pattern(PatternKind kind, std::unique_ptr<Event> behaviour, std::unique_ptr<Event> trigger = nullptr,
                         double minTime = 0, double maxTime = INFINITE_TIME);
        [[nodiscard]] bool HasTimeBounds() const;
        [[nodiscard]] bool IsSafety() const;
        [[nodiscard]] bool IsLiveness() const;
        ACCEPT_AST_VISITOR

        static std::unique_ptr<Pattern> Existence(std::unique_ptr<Event> behaviour, double minTime = 0, double maxTime = INFINITE_TIME);
        static std::unique_ptr<Pattern> Absence(std::unique_ptr<Event> behaviour, double minTime = 0, double maxTime = INFINITE_TIME);
        static std::unique_ptr<Pattern> Response(std::unique_ptr<Event> trigger, std::unique_ptr<Event> behaviour,
                                                 double minTime = 0, double maxTime = INFINITE_TIME);
        static std::unique_ptr<Pattern> Requirement(std::unique_ptr<Event> behaviour, std::unique_ptr<Event> required,
                                                    double minTime = 0, double maxTime = INFINITE_TIME);
        static std::unique_ptr<Pattern> Prevention(std::unique_ptr<Event> trigger, std::unique_ptr<Event> behaviour,
                                                   double minTime = 0, double maxTime = INFINITE_TIME);
    };

    [[nodiscard]] bool RequiresTrigger(PatternKind kind);

    struct Property final : public AstObject {
        std::unique_ptr<Scope> scope;
        std::unique_ptr<Pattern> pattern;
        std::map<std::string, std::string> metadata;

        explicit Property(std::unique_ptr<Scope> scope, std::unique_ptr<Pattern> pattern,
                          std::map<std::string, std::string> metadata = {});
        [[nodiscard]] std::optional<std::string> Uid() const;
        [[nodiscard]] bool IsSafety() const;
        [[nodiscard]] bool IsLiveness() const;

        /**
         * Events present in this property: activator, behaviour, trigger, terminator (absent slots are skipped).
         */
        [[nodiscard]] std::deque<const Event*> Events() const;
        ACCEPT_AST_VISITOR
    };

    /**
     * Collection of independent properties.
     */
    struct Specification final {
        std::deque<std::unique_ptr<Property>> properties;

        explicit Specification() = default;
        explicit Specification(std::deque<std::unique_ptr<Property>> properties);
        Specification(Specification&& other) = default;
        Specification(const Specification& other) = delete;
    };

    std::ostream& operator<<(std::ostream& stream, const AstObject& object);

} // namespace hpl

#endif //HPL_AST_AST_HPP
