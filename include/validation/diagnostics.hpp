#pragma once
#ifndef HPL_VALIDATION_DIAGNOSTICS_HPP
#define HPL_VALIDATION_DIAGNOSTICS_HPP

#include <deque>
#include <string>
#include <ostream>
#include <optional>
#include "ast/ast.hpp"

namespace hpl {

    enum struct DiagnosticKind {
        // structural
        INVALID_DISJUNCTION_ARITY,
        NON_UNIQUE_DISJUNCT_CHANNEL,
        DUPLICATE_ALIAS,
        INCONSISTENT_DISJUNCTION_ALIAS,
        UNKNOWN_FUNCTION,
        FUNCTION_ARITY_MISMATCH,
        FUNCTION_ARG_TYPE_MISMATCH,
        TYPE_MISMATCH,
        INCONSISTENT_REFERENCE_TYPE,
        UNUSED_QUANTIFIER_VARIABLE,
        QUANTIFIER_DOMAIN_REFERENCE,
        REDEFINED_QUANTIFIER_VARIABLE,
        EMPTY_CONNECTIVE,
        // binding
        UNBOUND_ALIAS,
        UNKNOWN_FIELD,
        INDEX_OUT_OF_BOUNDS,
        UNDECLARED_CHANNEL,
        // pattern sanity
        MISSING_EVENT,
        MISSING_TRIGGER,
        SUSPICIOUS_UNBOUND_RESPONSE,
        PREDICATE_IGNORES_OWN_MESSAGE,
        UNSATISFIABLE_PREDICATE,
        TAUTOLOGICAL_PREDICATE,
        UNDECIDED_PREDICATE
    };

    enum struct Severity {
        ERROR, WARNING
    };

    std::string ToString(DiagnosticKind kind);
    std::string ToString(Severity severity);
    [[nodiscard]] Severity DefaultSeverity(DiagnosticKind kind);

    struct Diagnostic final {
        DiagnosticKind kind;
        Severity severity;
        std::string subject; // alias, channel, function or field name the diagnostic is about
        std::optional<std::size_t> position; // argument position, for function calls
        NodeId node;
        std::string message;

        explicit Diagnostic(DiagnosticKind kind, std::string subject, NodeId node, std::string message,
                            std::optional<std::size_t> position = std::nullopt);

        [[nodiscard]] bool operator==(const Diagnostic& other) const;
        [[nodiscard]] bool operator!=(const Diagnostic& other) const;
    };

    std::ostream& operator<<(std::ostream& stream, const Diagnostic& diagnostic);

    struct ValidationReport final {
        std::deque<Diagnostic> errors;
        std::deque<Diagnostic> warnings;

        void Add(Diagnostic diagnostic);
        void Add(ValidationReport other);

        /**
         * A property is accepted iff validation found no errors. Warnings do not prevent acceptance.
         */
        [[nodiscard]] bool IsAccepted() const;
        [[nodiscard]] std::size_t Count(DiagnosticKind kind) const;
        [[nodiscard]] bool Contains(DiagnosticKind kind) const;
        [[nodiscard]] bool Contains(DiagnosticKind kind, const std::string& subject) const;

        [[nodiscard]] bool operator==(const ValidationReport& other) const;
        [[nodiscard]] bool operator!=(const ValidationReport& other) const;
    };

    std::ostream& operator<<(std::ostream& stream, const ValidationReport& report);

} // namespace hpl

#endif //HPL_VALIDATION_DIAGNOSTICS_HPP
