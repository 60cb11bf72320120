#include "internal.hpp"

#include <set>
#include <optional>
#include "validation/validate.hpp"

using namespace hpl;


inline std::string Quote(const AstObject& object) {
    return "'" + ToString(object) + "'";
}

inline std::string Describe(TypeSet type) {
    return "(" + ToString(type) + ")";
}

struct TypeChecker : public BaseAstVisitor {
    const FunctionRegistry& registry;
    const FieldResolution& fields;
    std::deque<Diagnostic> result;
    std::map<std::string, TypeSet> references;
    std::map<std::string, TypeSet> variables;
    std::set<std::string> inconsistent;
    TypeSet expected = TypeSet::Any();
    TypeSet inferred = TypeSet::Any();

    explicit TypeChecker(const FunctionRegistry& registry, const FieldResolution& fields)
            : registry(registry), fields(fields) {}

    TypeSet Infer(const Expression& expression, TypeSet expectation) {
        auto outer = expected;
        expected = expectation;
        expression.Accept(*this);
        expected = outer;
        return inferred;
    }

    void Report(DiagnosticKind kind, std::string subject, const AstObject& node, std::string message,
                std::optional<std::size_t> position = std::nullopt) {
        result.emplace_back(kind, std::move(subject), node.Id(), std::move(message), position);
    }

    //
    // Kinds
    //

    static std::string GetKey(const Expression& expression) {
        if (auto variable = dynamic_cast<const VariableReference*>(&expression)) return "variable " + variable->name;
        return "field " + ToString(expression);
    }

    TypeSet GetBaseType(const Expression& expression) const {
        if (auto variable = dynamic_cast<const VariableReference*>(&expression)) {
            auto find = variables.find(variable->name);
            if (find != variables.end()) return find->second;
            return TypeSet::Message(); // event alias
        }
        if (auto type = fields.GetType(expression)) return type->GetKinds();
        return expression.GetType();
    }

    // kinds of 'expression' as far as known without inspecting it, never reports
    TypeSet GetNaturalType(const Expression& expression) const {
        if (auto call = dynamic_cast<const FunctionCall*>(&expression)) {
            if (auto signature = registry.Lookup(call->name)) return signature->result;
            return TypeSet::Any();
        }
        if (dynamic_cast<const VariableReference*>(&expression) || dynamic_cast<const FieldAccess*>(&expression) ||
            dynamic_cast<const ArrayAccess*>(&expression)) {
            auto find = references.find(GetKey(expression));
            if (find != references.end()) return find->second;
            return GetBaseType(expression);
        }
        return expression.GetType();
    }

    void Check(const Expression& expression, TypeSet type) {
        auto narrowed = type & expected;
        if (!narrowed.IsEmpty()) {
            inferred = narrowed;
            return;
        }
        Report(DiagnosticKind::TYPE_MISMATCH, ToString(expression), expression,
               "expected " + Describe(expected) + " but found " + Describe(type) + ": " + Quote(expression));
        inferred = type;
    }

    // all occurrences of the same field or variable must agree on their kind
    void CheckReference(const Expression& expression) {
        auto type = GetBaseType(expression);
        auto narrowed = type & expected;
        if (narrowed.IsEmpty()) {
            Check(expression, type);
            return;
        }
        auto key = GetKey(expression);
        auto find = references.find(key);
        if (find == references.end()) {
            references.emplace(key, narrowed);
            inferred = narrowed;
            return;
        }
        auto combined = find->second & narrowed;
        if (combined.IsEmpty()) {
            if (inconsistent.insert(key).second) {
                Report(DiagnosticKind::INCONSISTENT_REFERENCE_TYPE, ToString(expression), expression,
                       "multiple occurrences of " + Quote(expression) + " with incompatible types: found " +
                       Describe(find->second) + " and " + Describe(narrowed));
            }
            inferred = narrowed;
            return;
        }
        find->second = combined;
        inferred = combined;
    }

    //
    // Connectives
    //

    void Visit(const LogicValue& object) override { Check(object, TypeSet::Bool()); }

    void Visit(const Negation& object) override {
        Infer(*object.operand, TypeSet::Bool());
        Check(object, TypeSet::Bool());
    }
    void Visit(const Conjunction& object) override {
        for (const auto& elem : object.operands) Infer(*elem, TypeSet::Bool());
        Check(object, TypeSet::Bool());
    }
    void Visit(const Disjunction& object) override {
        for (const auto& elem : object.operands) Infer(*elem, TypeSet::Bool());
        Check(object, TypeSet::Bool());
    }
    void Visit(const Implication& object) override {
        Infer(*object.premise, TypeSet::Bool());
        Infer(*object.conclusion, TypeSet::Bool());
        Check(object, TypeSet::Bool());
    }
    void Visit(const Equivalence& object) override {
        Infer(*object.lhs, TypeSet::Bool());
        Infer(*object.rhs, TypeSet::Bool());
        Check(object, TypeSet::Bool());
    }

    //
    // Values
    //

    void Visit(const Literal& object) override { Check(object, object.GetType()); }
    void Visit(const ThisMessage& object) override { Check(object, TypeSet::Message()); }
    void Visit(const VariableReference& object) override { CheckReference(object); }

    void Visit(const FieldAccess& object) override {
        Infer(*object.message, TypeSet::Message());
        CheckReference(object);
    }

    void Visit(const ArrayAccess& object) override {
        Infer(*object.array, TypeSet::Array());
        Infer(*object.index, TypeSet::Number());
        CheckReference(object);
    }

    void Visit(const SetValue& object) override {
        for (const auto& elem : object.values) Infer(*elem, TypeSet::Primitive());
        Check(object, TypeSet::Set());
    }

    void Visit(const RangeValue& object) override {
        Infer(*object.low, TypeSet::Number());
        Infer(*object.high, TypeSet::Number());
        Check(object, TypeSet::Range());
    }

    void Visit(const NumericNegation& object) override {
        Infer(*object.operand, TypeSet::Number());
        Check(object, TypeSet::Number());
    }

    void Visit(const Arithmetic& object) override {
        Infer(*object.lhs, TypeSet::Number());
        Infer(*object.rhs, TypeSet::Number());
        Check(object, TypeSet::Number());
    }

    //
    // Comparisons
    //

    static TypeSet Restrict(TypeSet type, TypeSet restriction) {
        auto restricted = type & restriction;
        return restricted.IsEmpty() ? type : restricted;
    }

    void HandleEquality(const Comparison& object) {
        auto primitive = TypeSet::Primitive();
        auto before = result.size();
        auto lhsType = Infer(*object.lhs, Restrict(primitive, GetNaturalType(*object.rhs)));
        if (result.size() != before) Infer(*object.rhs, primitive);
        else Infer(*object.rhs, Restrict(primitive, lhsType));
    }

    void HandleMembership(const Comparison& object) {
        Infer(*object.rhs, TypeSet::Composite());
        auto element = dynamic_cast<const RangeValue*>(object.rhs.get()) ? TypeSet::Number() : TypeSet::Primitive();
        Infer(*object.lhs, element);
    }

    void Visit(const Comparison& object) override {
        switch (object.op) {
            case ComparisonOperator::EQ:
            case ComparisonOperator::NEQ:
                HandleEquality(object);
                break;
            case ComparisonOperator::LT:
            case ComparisonOperator::LEQ:
            case ComparisonOperator::GT:
            case ComparisonOperator::GEQ:
                Infer(*object.lhs, TypeSet::Number());
                Infer(*object.rhs, TypeSet::Number());
                break;
            case ComparisonOperator::IN:
                HandleMembership(object);
                break;
        }
        Check(object, TypeSet::Bool());
    }

    //
    // Function calls
    //

    void InferArguments(const FunctionCall& object) {
        for (const auto& elem : object.arguments) Infer(*elem, TypeSet::Any());
    }

    void Visit(const FunctionCall& object) override {
        auto signature = registry.Lookup(object.name);
        if (!signature) {
            Report(DiagnosticKind::UNKNOWN_FUNCTION, object.name, object, "undefined function '" + object.name + "'");
            InferArguments(object);
            Check(object, TypeSet::Any());
            return;
        }

        std::vector<TypeSet> kinds;
        kinds.reserve(object.arguments.size());
        for (const auto& elem : object.arguments) kinds.push_back(GetNaturalType(*elem));
        auto resolution = Resolve(*signature, kinds);

        switch (resolution.status) {
            case CallStatus::OK:
                for (std::size_t index = 0; index < object.arguments.size(); ++index) {
                    Infer(*object.arguments.at(index), resolution.overload->KindAt(index));
                }
                break;
            case CallStatus::ARITY_MISMATCH:
                Report(DiagnosticKind::FUNCTION_ARITY_MISMATCH, object.name, object,
                       "function '" + object.name + "' does not accept " + std::to_string(object.arguments.size()) +
                       " argument(s): " + Quote(object));
                InferArguments(object);
                break;
            case CallStatus::ARGUMENT_TYPE_MISMATCH:
                Report(DiagnosticKind::FUNCTION_ARG_TYPE_MISMATCH, object.name, object,
                       "argument " + std::to_string(resolution.position) + " of function '" + object.name +
                       "' expects " + Describe(resolution.expected) + " but found " +
                       Describe(kinds.at(resolution.position)) + ": " + Quote(object), resolution.position);
                InferArguments(object);
                break;
        }
        Check(object, signature->result);
    }

    //
    // Quantifiers
    //

    TypeSet GetVariableType(const Expression& domain) const {
        if (dynamic_cast<const RangeValue*>(&domain)) return TypeSet::Number();
        if (auto set = dynamic_cast<const SetValue*>(&domain)) {
            auto type = TypeSet::None();
            for (const auto& elem : set->values) type = type | GetNaturalType(*elem);
            return Restrict(TypeSet::Primitive(), type);
        }
        return TypeSet::Primitive();
    }

    void Visit(const Quantifier& object) override {
        const auto& variable = object.variable;
        if (variables.count(variable) != 0) {
            Report(DiagnosticKind::REDEFINED_QUANTIFIER_VARIABLE, variable, object,
                   "multiple definitions of variable '" + variable + "' in " + Quote(object));
        }
        if (References(*object.domain, variable)) {
            Report(DiagnosticKind::QUANTIFIER_DOMAIN_REFERENCE, variable, object,
                   "cannot reference quantified variable '" + variable + "' in the domain of " + Quote(object));
        }
        Infer(*object.domain, TypeSet::Composite());

        // bind
        auto key = "variable " + variable;
        std::optional<TypeSet> outerVariable, outerReference;
        if (auto find = variables.find(variable); find != variables.end()) outerVariable = find->second;
        if (auto find = references.find(key); find != references.end()) outerReference = find->second;
        variables.insert_or_assign(variable, GetVariableType(*object.domain));
        references.erase(key);

        Infer(*object.condition, TypeSet::Bool());
        if (!References(*object.condition, variable)) {
            Report(DiagnosticKind::UNUSED_QUANTIFIER_VARIABLE, variable, object,
                   "quantified variable '" + variable + "' is never used in " + Quote(object));
        }

        // unbind
        variables.erase(variable);
        references.erase(key);
        if (outerVariable) variables.emplace(variable, outerVariable.value());
        if (outerReference) references.emplace(key, outerReference.value());
        Check(object, TypeSet::Bool());
    }
};


std::deque<Diagnostic> hpl::CheckTypes(const Expression& expression, const FunctionRegistry& registry,
                                       const FieldResolution& fields) {
    TypeChecker checker(registry, fields);
    checker.Infer(expression, TypeSet::Any());
    return std::move(checker.result);
}

std::deque<Diagnostic> hpl::CheckTypes(const Predicate& predicate, const FunctionRegistry& registry,
                                       const FieldResolution& fields) {
    TypeChecker checker(registry, fields);
    checker.Infer(*predicate.condition, TypeSet::Bool());
    return std::move(checker.result);
}

std::deque<Diagnostic> hpl::TypeCheck(const FunctionCall& call, const FunctionRegistry& registry) {
    FieldResolution fields;
    return CheckTypes(call, registry, fields);
}
