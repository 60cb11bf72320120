#pragma once
#ifndef HPL_AST_UTIL_HPP
#define HPL_AST_UTIL_HPP

#include <set>
#include <map>
#include <deque>
#include <memory>
#include <string>
#include <ostream>
#include <optional>
#include <functional>
#include "ast.hpp"
#include "util/shortcuts.hpp"

namespace hpl {

    std::string ToString(const AstObject& object);
    std::string ToString(ScopeKind kind);
    std::string ToString(PatternKind kind);
    std::string ToString(ArithmeticOperator op);
    std::string ToString(ComparisonOperator op);
    std::string ToString(QuantifierKind kind);

    void Print(const AstObject& object, std::ostream& out);

    template<typename T>
    std::unique_ptr<T> Copy(const T& object);

    /**
     * Structural equality: same node kinds and recursively equal children, in order. Node identities are ignored.
     */
    bool SyntacticalEqual(const AstObject& object, const AstObject& other);

    /**
     * Immediate sub-nodes of 'object', in order. Absent optional slots are skipped.
     */
    std::deque<const AstObject*> Children(const AstObject& object);
    std::deque<AstObject*> MutableChildren(AstObject& object);

    /**
     * Replaces the immediate child of 'parent' identified by 'child' with 'replacement' and returns the detached child.
     * Throws a ConstructionError of kind NOT_A_CHILD if no such child exists, or of kind INVALID_REPLACEMENT if
     * 'replacement' cannot occupy the child's slot.
     */
    std::unique_ptr<AstObject> ReplaceChild(AstObject& parent, NodeId child, std::unique_ptr<AstObject> replacement);

    const AstObject* FindNode(const AstObject& root, NodeId id);

    template<typename T>
    std::deque<const T*> Collect(const AstObject& object,
                                 const std::function<bool(const T&)>& filter = [](auto&){ return true; });
    template<typename T>
    std::deque<T*> CollectMutable(AstObject& object,
                                  const std::function<bool(const T&)>& filter = [](auto&) { return true; });

    /**
     * Builds a nested field access for a dotted path like "a.b.c", rooted at the alias 'alias'
     * or at the enclosing event's own message if 'alias' is empty.
     */
    std::unique_ptr<FieldAccess> MakeFieldAccess(const std::string& alias, const std::string& path);

    //
    // Aliases
    //

    /**
     * Names referenced by variable references in 'object' that are not bound by an enclosing quantifier.
     */
    std::set<std::string> ReferencedAliases(const AstObject& object);
    bool References(const AstObject& object, const std::string& alias);

    /**
     * Whether 'predicate' reads its own message, either directly or through the event's own alias.
     */
    bool ReferencesSelf(const Predicate& predicate, const std::optional<std::string>& ownAlias = std::nullopt);

    using AliasTable = std::map<std::string, std::reference_wrapper<const AtomicEvent>>;

    /**
     * Maps every alias bound in 'property' to the atomic event that introduces it first,
     * following the order of Property::Events().
     */
    AliasTable ComputeAliasTable(const Property& property);

} // namespace hpl

#endif //HPL_AST_UTIL_HPP
