#include "logics/encoding.hpp"

#include <cmath>
#include <atomic>
#include <sstream>
#include <iomanip>
#include <variant>
#include <optional>
#include <stdexcept>
#include "internal.hpp"
#include "ast/util.hpp"

using namespace hpl;


enum struct Sort { BOOL, REAL, STRING };

inline std::string SortName(Sort sort) {
    switch (sort) {
        case Sort::BOOL: return "Bool";
        case Sort::REAL: return "Real";
        case Sort::STRING: return "String";
    }
    throw std::logic_error("Internal error: unknown sort.");
}

inline std::optional<Sort> InferSort(const Expression& expression) {
    if (auto literal = dynamic_cast<const Literal*>(&expression)) {
        if (std::holds_alternative<bool>(literal->value)) return Sort::BOOL;
        if (std::holds_alternative<double>(literal->value)) return Sort::REAL;
        return Sort::STRING;
    }
    auto type = expression.GetType();
    if (type.IsExact()) {
        if (type == TypeSet::Bool()) return Sort::BOOL;
        if (type == TypeSet::Number()) return Sort::REAL;
        if (type == TypeSet::String()) return Sort::STRING;
    }
    return std::nullopt;
}

inline Sort InferSort(const Expression& expression, const Expression& other) {
    if (auto sort = InferSort(expression)) return sort.value();
    if (auto sort = InferSort(other)) return sort.value();
    return Sort::REAL;
}

// Z3 numerals are unsigned and written in scientific notation with an upper case exponent marker
inline std::string MakeNumeral(double value) {
    std::stringstream stream;
    stream << std::scientific << std::setprecision(17) << std::fabs(value);
    auto result = stream.str();
    for (auto& chr : result) if (chr == 'e') chr = 'E';
    return result;
}


static std::atomic<std::size_t> freshCounter{0};

struct Encoder : public AstVisitor {
    z3::context& context;
    Sort sort = Sort::BOOL;
    std::optional<z3::expr> result;

    explicit Encoder(z3::context& context) : context(context) {}

    z3::expr Encode(const Expression& expression, Sort target) {
        auto outer = sort;
        sort = target;
        result = std::nullopt;
        expression.Accept(*this);
        sort = outer;
        if (!result) throw InternalEncodingError("no encoding for '" + ToString(expression) + "'");
        auto encoded = result.value();
        result = std::nullopt;
        return encoded;
    }

    z3::expr MakeConstant(const std::string& name, Sort target) {
        auto symbol = name + ":" + SortName(target);
        switch (target) {
            case Sort::BOOL: return context.bool_const(symbol.c_str());
            case Sort::REAL: return context.real_const(symbol.c_str());
            case Sort::STRING: return context.constant(symbol.c_str(), context.string_sort());
        }
        throw std::logic_error("Internal error: unknown sort.");
    }

    void Abstract(const Expression& expression) {
        result = MakeConstant(ToString(expression), sort);
    }

    bool IsTarget(Sort target) const { return sort == target; }

    //
    // Boolean connectives
    //

    void Visit(const LogicValue& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        switch (object.value) {
            case Truth::TRUE: result = context.bool_val(true); break;
            case Truth::FALSE: result = context.bool_val(false); break;
            case Truth::UNKNOWN: result = MakeConstant("Unknown!" + std::to_string(freshCounter++), Sort::BOOL); break;
        }
    }

    void Visit(const Negation& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        result = !Encode(*object.operand, Sort::BOOL);
    }

    void Visit(const Conjunction& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        z3::expr_vector vector(context);
        for (const auto& elem : object.operands) vector.push_back(Encode(*elem, Sort::BOOL));
        result = z3::mk_and(vector);
    }

    void Visit(const Disjunction& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        z3::expr_vector vector(context);
        for (const auto& elem : object.operands) vector.push_back(Encode(*elem, Sort::BOOL));
        result = z3::mk_or(vector);
    }

    void Visit(const Implication& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        result = z3::implies(Encode(*object.premise, Sort::BOOL), Encode(*object.conclusion, Sort::BOOL));
    }

    void Visit(const Equivalence& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        result = Encode(*object.lhs, Sort::BOOL) == Encode(*object.rhs, Sort::BOOL);
    }

    //
    // Values
    //

    void Visit(const Literal& object) override {
        if (auto boolean = std::get_if<bool>(&object.value)) {
            if (IsTarget(Sort::BOOL)) result = context.bool_val(*boolean);
            else Abstract(object);
        } else if (auto number = std::get_if<double>(&object.value)) {
            if (IsTarget(Sort::REAL) && std::isfinite(*number)) {
                auto numeral = context.real_val(MakeNumeral(*number).c_str());
                result = *number < 0 ? -numeral : numeral;
            } else {
                Abstract(object);
            }
        } else {
            if (IsTarget(Sort::STRING)) result = context.string_val(std::get<std::string>(object.value));
            else Abstract(object);
        }
    }

    void Visit(const ThisMessage& /*object*/) override { result = MakeConstant("this", sort); }
    void Visit(const VariableReference& object) override { Abstract(object); }
    void Visit(const FieldAccess& object) override { Abstract(object); }
    void Visit(const ArrayAccess& object) override { Abstract(object); }
    void Visit(const SetValue& object) override { Abstract(object); }
    void Visit(const RangeValue& object) override { Abstract(object); }
    void Visit(const FunctionCall& object) override { Abstract(object); }
    void Visit(const Quantifier& object) override { Abstract(object); }

    //
    // Arithmetic
    //

    void Visit(const NumericNegation& object) override {
        if (!IsTarget(Sort::REAL)) { Abstract(object); return; }
        result = -Encode(*object.operand, Sort::REAL);
    }

    void Visit(const Arithmetic& object) override {
        if (!IsTarget(Sort::REAL) || object.op == ArithmeticOperator::POW) { Abstract(object); return; }
        auto lhs = Encode(*object.lhs, Sort::REAL);
        auto rhs = Encode(*object.rhs, Sort::REAL);
        switch (object.op) {
            case ArithmeticOperator::ADD: result = lhs + rhs; break;
            case ArithmeticOperator::SUB: result = lhs - rhs; break;
            case ArithmeticOperator::MUL: result = lhs * rhs; break;
            case ArithmeticOperator::DIV: result = lhs / rhs; break;
            case ArithmeticOperator::POW: Abstract(object); break;
        }
    }

    //
    // Comparisons
    //

    z3::expr EncodeMembership(const Expression& element, const RangeValue& range) {
        auto value = Encode(element, Sort::REAL);
        auto low = Encode(*range.low, Sort::REAL);
        auto high = Encode(*range.high, Sort::REAL);
        auto lower = range.excludeLow ? low < value : low <= value;
        auto upper = range.excludeHigh ? value < high : value <= high;
        return lower && upper;
    }

    z3::expr EncodeMembership(const Expression& element, const SetValue& set) {
        z3::expr_vector vector(context);
        for (const auto& value : set.values) {
            auto target = InferSort(element, *value);
            vector.push_back(Encode(element, target) == Encode(*value, target));
        }
        return z3::mk_or(vector);
    }

    void Visit(const Comparison& object) override {
        if (!IsTarget(Sort::BOOL)) { Abstract(object); return; }
        switch (object.op) {
            case ComparisonOperator::EQ:
            case ComparisonOperator::NEQ: {
                auto target = InferSort(*object.lhs, *object.rhs);
                auto equal = Encode(*object.lhs, target) == Encode(*object.rhs, target);
                result = object.op == ComparisonOperator::EQ ? equal : !equal;
                break;
            }
            case ComparisonOperator::LT: result = Encode(*object.lhs, Sort::REAL) < Encode(*object.rhs, Sort::REAL); break;
            case ComparisonOperator::LEQ: result = Encode(*object.lhs, Sort::REAL) <= Encode(*object.rhs, Sort::REAL); break;
            case ComparisonOperator::GT: result = Encode(*object.lhs, Sort::REAL) > Encode(*object.rhs, Sort::REAL); break;
            case ComparisonOperator::GEQ: result = Encode(*object.lhs, Sort::REAL) >= Encode(*object.rhs, Sort::REAL); break;
            case ComparisonOperator::IN:
                if (auto range = dynamic_cast<const RangeValue*>(object.rhs.get())) result = EncodeMembership(*object.lhs, *range);
                else if (auto set = dynamic_cast<const SetValue*>(object.rhs.get())) result = EncodeMembership(*object.lhs, *set);
                else Abstract(object);
                break;
        }
    }

    //
    // Non-expressions
    //

    void Visit(const Predicate& object) override { result = Encode(*object.condition, Sort::BOOL); }
    void Visit(const AtomicEvent& /*object*/) override { throw InternalEncodingError("cannot encode events"); }
    void Visit(const EventDisjunction& /*object*/) override { throw InternalEncodingError("cannot encode events"); }
    void Visit(const Scope& /*object*/) override { throw InternalEncodingError("cannot encode scopes"); }
    void Visit(const Pattern& /*object*/) override { throw InternalEncodingError("cannot encode patterns"); }
    void Visit(const Property& /*object*/) override { throw InternalEncodingError("cannot encode properties"); }
};

z3::expr hpl::EncodeExpression(z3::context& context, const Expression& expression) {
    Encoder encoder(context);
    return encoder.Encode(expression, Sort::BOOL);
}
