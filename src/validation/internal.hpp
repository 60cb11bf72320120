#pragma once
#ifndef HPL_VALIDATION_INTERNAL_HPP
#define HPL_VALIDATION_INTERNAL_HPP

#include <map>
#include <deque>
#include <string>
#include <vector>
#include "ast/ast.hpp"
#include "ast/util.hpp"
#include "validation/config.hpp"
#include "validation/diagnostics.hpp"

namespace hpl {

    /**
     * An event slot of a property, named after its role.
     */
    struct EventSlot {
        std::string name;
        const Event* event;
    };

    /**
     * Present slots in binding order: activator, then the pattern's first and second slot, then terminator.
     */
    std::deque<EventSlot> GetSlots(const Property& property, const ValidationConfig& config);

    /**
     * The rule for the property's pattern. Kinds missing from the configured catalog fall back to the builtin rules.
     */
    const PatternRule& GetRule(const Pattern& pattern, const ValidationConfig& config);

    /**
     * Message schemas of field and array accesses, as far as they can be derived from the configuration.
     * Resolving reports unknown fields, out-of-bounds indices, accesses into values of the wrong sort,
     * and channels without schema.
     */
    struct FieldResolution {
        std::map<NodeId, const FieldType*> types;
        std::deque<Diagnostic> diagnostics;

        [[nodiscard]] const FieldType* GetType(const Expression& access) const;
    };

    FieldResolution ResolveFields(const Property& property, const ValidationConfig& config, const AliasTable& aliases);

    /**
     * Infers the value kinds of a predicate, reporting kind conflicts, function signature violations
     * and ill-formed quantifiers.
     */
    std::deque<Diagnostic> CheckTypes(const Predicate& predicate, const FunctionRegistry& registry,
                                      const FieldResolution& fields);
    std::deque<Diagnostic> CheckTypes(const Expression& expression, const FunctionRegistry& registry,
                                      const FieldResolution& fields);

    std::deque<Diagnostic> CheckStructure(const Property& property, const ValidationConfig& config,
                                          const FieldResolution& fields);
    std::deque<Diagnostic> CheckBindings(const Property& property, const ValidationConfig& config,
                                         FieldResolution& fields);
    std::deque<Diagnostic> CheckPatternSanity(const Property& property, const ValidationConfig& config);

} // namespace hpl

#endif //HPL_VALIDATION_INTERNAL_HPP
