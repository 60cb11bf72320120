#pragma once
#ifndef HPL_AST_ERROR_HPP
#define HPL_AST_ERROR_HPP

#include <string>
#include "util/shortcuts.hpp"

namespace hpl {

    enum struct ConstructionErrorKind {
        INVALID_DISJUNCTION_ARITY,
        NON_UNIQUE_DISJUNCT_CHANNEL,
        EMPTY_NAME,
        EMPTY_OPERANDS,
        INVALID_SCOPE,
        INVALID_PATTERN,
        INVALID_TIME_BOUNDS,
        NOT_A_BOOLEAN_EXPRESSION,
        NOT_A_CHILD,
        INVALID_REPLACEMENT
    };

    std::string ToString(ConstructionErrorKind kind);

    /**
     * Raised by node constructors and tree mutators when a local invariant is violated.
     * The subject names the offending channel, identifier, or node.
     */
    struct ConstructionError : public ExceptionWithMessage {
        const ConstructionErrorKind kind;
        const std::string subject;

        explicit ConstructionError(ConstructionErrorKind kind, std::string subject, const std::string& detail);
    };

} // namespace hpl

#endif //HPL_AST_ERROR_HPP
