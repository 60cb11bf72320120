#include "ast/util.hpp"

#include <set>
#include <stdexcept>
#include "ast/error.hpp"

using namespace hpl;


//
// Enumerating children
//

template<typename V, typename O>
struct ChildCollector : public V {
    std::deque<O*> result;
    bool entered = false;

    template<typename T>
    inline void Handle(T& object) {
        if (entered) {
            result.push_back(&object);
            return;
        }
        entered = true;
        this->Walk(object);
    }
};

struct ConstChildCollector : public ChildCollector<AstVisitor, const AstObject> {
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

struct MutableChildCollector : public ChildCollector<MutableAstVisitor, AstObject> {
    void Visit(LogicValue& object) override { Handle(object); }
    void Visit(Negation& object) override { Handle(object); }
    void Visit(Conjunction& object) override { Handle(object); }
    void Visit(Disjunction& object) override { Handle(object); }
    void Visit(Implication& object) override { Handle(object); }
    void Visit(Equivalence& object) override { Handle(object); }
    void Visit(Literal& object) override { Handle(object); }
    void Visit(ThisMessage& object) override { Handle(object); }
    void Visit(VariableReference& object) override { Handle(object); }
    void Visit(FieldAccess& object) override { Handle(object); }
    void Visit(ArrayAccess& object) override { Handle(object); }
    void Visit(SetValue& object) override { Handle(object); }
    void Visit(RangeValue& object) override { Handle(object); }
    void Visit(NumericNegation& object) override { Handle(object); }
    void Visit(Arithmetic& object) override { Handle(object); }
    void Visit(Comparison& object) override { Handle(object); }
    void Visit(FunctionCall& object) override { Handle(object); }
    void Visit(Quantifier& object) override { Handle(object); }
    void Visit(Predicate& object) override { Handle(object); }
    void Visit(AtomicEvent& object) override { Handle(object); }
    void Visit(EventDisjunction& object) override { Handle(object); }
    void Visit(Scope& object) override { Handle(object); }
    void Visit(Pattern& object) override { Handle(object); }
    void Visit(Property& object) override { Handle(object); }
};

std::deque<const AstObject*> hpl::Children(const AstObject& object) {
    ConstChildCollector collector;
    object.Accept(collector);
    return std::move(collector.result);
}

std::deque<AstObject*> hpl::MutableChildren(AstObject& object) {
    MutableChildCollector collector;
    object.Accept(collector);
    return std::move(collector.result);
}

const AstObject* hpl::FindNode(const AstObject& root, NodeId id) {
    if (root.Id() == id) return &root;
    for (const auto* child : Children(root)) {
        if (auto result = FindNode(*child, id)) return result;
    }
    return nullptr;
}


//
// Replacing children
//

struct ChildReplacer : public MutableAstVisitor {
    const NodeId child;
    std::unique_ptr<AstObject> replacement;
    std::unique_ptr<AstObject> result;

    explicit ChildReplacer(NodeId child, std::unique_ptr<AstObject> replacement)
            : child(child), replacement(std::move(replacement)) {}

    template<typename T>
    bool TrySwap(std::unique_ptr<T>& slot) {
        if (result || !slot || slot->Id() != child) return false;
        auto cast = dynamic_cast<T*>(replacement.get());
        if (!cast) {
            throw ConstructionError(ConstructionErrorKind::INVALID_REPLACEMENT, std::to_string(child),
                                    "replacement does not fit the slot of the replaced child");
        }
        replacement.release();
        std::unique_ptr<T> swapped(cast);
        std::swap(swapped, slot);
        result = std::move(swapped);
        return true;
    }

    template<typename T>
    void TrySwap(std::deque<std::unique_ptr<T>>& slots) {
        for (auto& slot : slots) TrySwap(slot);
    }

    void Visit(LogicValue& /*object*/) override { /* no children */ }
    void Visit(Negation& object) override { TrySwap(object.operand); }
    void Visit(Conjunction& object) override { TrySwap(object.operands); }
    void Visit(Disjunction& object) override { TrySwap(object.operands); }
    void Visit(Implication& object) override { TrySwap(object.premise); TrySwap(object.conclusion); }
    void Visit(Equivalence& object) override { TrySwap(object.lhs); TrySwap(object.rhs); }
    void Visit(Literal& /*object*/) override { /* no children */ }
    void Visit(ThisMessage& /*object*/) override { /* no children */ }
    void Visit(VariableReference& /*object*/) override { /* no children */ }
    void Visit(FieldAccess& object) override { TrySwap(object.message); }
    void Visit(ArrayAccess& object) override { TrySwap(object.array); TrySwap(object.index); }
    void Visit(SetValue& object) override { TrySwap(object.values); }
    void Visit(RangeValue& object) override { TrySwap(object.low); TrySwap(object.high); }
    void Visit(NumericNegation& object) override { TrySwap(object.operand); }
    void Visit(Arithmetic& object) override { TrySwap(object.lhs); TrySwap(object.rhs); }
    void Visit(Comparison& object) override { TrySwap(object.lhs); TrySwap(object.rhs); }
    void Visit(FunctionCall& object) override { TrySwap(object.arguments); }
    void Visit(AtomicEvent& object) override { TrySwap(object.predicate); }
    void Visit(Scope& object) override { TrySwap(object.activator); TrySwap(object.terminator); }
    void Visit(Pattern& object) override { TrySwap(object.behaviour); TrySwap(object.trigger); }
    void Visit(Property& object) override { TrySwap(object.scope); TrySwap(object.pattern); }

    void Visit(Quantifier& object) override {
        TrySwap(object.domain);
        if (!TrySwap(object.condition)) return;
        if (object.condition->CanBe(TypeSet::Bool())) return;
        Undo(object.condition);
        throw ConstructionError(ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION, object.variable,
                                "quantifier condition must be boolean");
    }

    void Visit(Predicate& object) override {
        if (!TrySwap(object.condition)) return;
        if (object.condition->CanBe(TypeSet::Bool())) return;
        Undo(object.condition);
        throw ConstructionError(ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION, "predicate", "condition must be boolean");
    }

    void Visit(EventDisjunction& object) override {
        for (auto& slot : object.disjuncts) {
            if (!TrySwap(slot)) continue;
            std::set<std::string> seen;
            for (const auto& channel : object.Channels()) {
                if (seen.insert(channel).second) continue;
                Undo(slot);
                throw ConstructionError(ConstructionErrorKind::NON_UNIQUE_DISJUNCT_CHANNEL, channel,
                                        "channel appears multiple times in an event disjunction");
            }
            return;
        }
    }

    template<typename T>
    void Undo(std::unique_ptr<T>& slot) {
        auto previous = dynamic_cast<T*>(result.get());
        if (!previous) throw std::logic_error("Internal error: cannot restore replaced child.");
        result.release();
        replacement = std::move(slot);
        slot.reset(previous);
    }
};

std::unique_ptr<AstObject> hpl::ReplaceChild(AstObject& parent, NodeId child, std::unique_ptr<AstObject> replacement) {
    if (!replacement) {
        throw ConstructionError(ConstructionErrorKind::INVALID_REPLACEMENT, std::to_string(child), "replacement missing");
    }
    ChildReplacer replacer(child, std::move(replacement));
    parent.Accept(replacer);
    if (!replacer.result) {
        throw ConstructionError(ConstructionErrorKind::NOT_A_CHILD, std::to_string(child),
                                "node is not an immediate child of node " + std::to_string(parent.Id()));
    }
    return std::move(replacer.result);
}
