#include "validation/diagnostics.hpp"

#include <stdexcept>
#include <algorithm>
#include "util/shortcuts.hpp"

using namespace hpl;


std::string hpl::ToString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::INVALID_DISJUNCTION_ARITY: return "InvalidDisjunctionArity";
        case DiagnosticKind::NON_UNIQUE_DISJUNCT_CHANNEL: return "NonUniqueDisjunctChannel";
        case DiagnosticKind::DUPLICATE_ALIAS: return "DuplicateAlias";
        case DiagnosticKind::INCONSISTENT_DISJUNCTION_ALIAS: return "InconsistentDisjunctionAlias";
        case DiagnosticKind::UNKNOWN_FUNCTION: return "UnknownFunction";
        case DiagnosticKind::FUNCTION_ARITY_MISMATCH: return "FunctionArityMismatch";
        case DiagnosticKind::FUNCTION_ARG_TYPE_MISMATCH: return "FunctionArgTypeMismatch";
        case DiagnosticKind::TYPE_MISMATCH: return "TypeMismatch";
        case DiagnosticKind::INCONSISTENT_REFERENCE_TYPE: return "InconsistentReferenceType";
        case DiagnosticKind::UNUSED_QUANTIFIER_VARIABLE: return "UnusedQuantifierVariable";
        case DiagnosticKind::QUANTIFIER_DOMAIN_REFERENCE: return "QuantifierDomainReference";
        case DiagnosticKind::REDEFINED_QUANTIFIER_VARIABLE: return "RedefinedQuantifierVariable";
        case DiagnosticKind::EMPTY_CONNECTIVE: return "EmptyConnective";
        case DiagnosticKind::UNBOUND_ALIAS: return "UnboundAlias";
        case DiagnosticKind::UNKNOWN_FIELD: return "UnknownField";
        case DiagnosticKind::INDEX_OUT_OF_BOUNDS: return "IndexOutOfBounds";
        case DiagnosticKind::UNDECLARED_CHANNEL: return "UndeclaredChannel";
        case DiagnosticKind::MISSING_EVENT: return "MissingEvent";
        case DiagnosticKind::MISSING_TRIGGER: return "MissingTrigger";
        case DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE: return "SuspiciousUnboundResponse";
        case DiagnosticKind::PREDICATE_IGNORES_OWN_MESSAGE: return "PredicateIgnoresOwnMessage";
        case DiagnosticKind::UNSATISFIABLE_PREDICATE: return "UnsatisfiablePredicate";
        case DiagnosticKind::TAUTOLOGICAL_PREDICATE: return "TautologicalPredicate";
        case DiagnosticKind::UNDECIDED_PREDICATE: return "UndecidedPredicate";
    }
    throw std::logic_error("Internal error: unknown diagnostic kind.");
}

std::string hpl::ToString(Severity severity) {
    switch (severity) {
        case Severity::ERROR: return "error";
        case Severity::WARNING: return "warning";
    }
    throw std::logic_error("Internal error: unknown severity.");
}

Severity hpl::DefaultSeverity(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::INCONSISTENT_DISJUNCTION_ALIAS:
        case DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE:
        case DiagnosticKind::PREDICATE_IGNORES_OWN_MESSAGE:
        case DiagnosticKind::UNSATISFIABLE_PREDICATE:
        case DiagnosticKind::TAUTOLOGICAL_PREDICATE:
        case DiagnosticKind::UNDECIDED_PREDICATE:
            return Severity::WARNING;
        default:
            return Severity::ERROR;
    }
}


//
// Diagnostic
//

Diagnostic::Diagnostic(DiagnosticKind kind, std::string subject_, NodeId node, std::string message_,
                       std::optional<std::size_t> position)
        : kind(kind), severity(DefaultSeverity(kind)), subject(std::move(subject_)), position(position), node(node),
          message(std::move(message_)) {}

bool Diagnostic::operator==(const Diagnostic& other) const {
    return kind == other.kind && severity == other.severity && subject == other.subject &&
           position == other.position && node == other.node && message == other.message;
}

bool Diagnostic::operator!=(const Diagnostic& other) const {
    return !(*this == other);
}

std::ostream& hpl::operator<<(std::ostream& stream, const Diagnostic& diagnostic) {
    stream << ToString(diagnostic.severity) << ": " << ToString(diagnostic.kind) << "(" << diagnostic.subject;
    if (diagnostic.position) stream << ", " << diagnostic.position.value();
    stream << "): " << diagnostic.message;
    return stream;
}


//
// Report
//

void ValidationReport::Add(Diagnostic diagnostic) {
    auto& target = diagnostic.severity == Severity::ERROR ? errors : warnings;
    target.push_back(std::move(diagnostic));
}

void ValidationReport::Add(ValidationReport other) {
    MoveInto(std::move(other.errors), errors);
    MoveInto(std::move(other.warnings), warnings);
}

bool ValidationReport::IsAccepted() const {
    return errors.empty();
}

std::size_t ValidationReport::Count(DiagnosticKind kind) const {
    auto isKind = [kind](const auto& elem) { return elem.kind == kind; };
    auto count = std::count_if(errors.begin(), errors.end(), isKind) + std::count_if(warnings.begin(), warnings.end(), isKind);
    return static_cast<std::size_t>(count);
}

bool ValidationReport::Contains(DiagnosticKind kind) const {
    return Count(kind) > 0;
}

bool ValidationReport::Contains(DiagnosticKind kind, const std::string& subject) const {
    auto matches = [&](const auto& elem) { return elem.kind == kind && elem.subject == subject; };
    return ContainsIf(errors, matches) || ContainsIf(warnings, matches);
}

bool ValidationReport::operator==(const ValidationReport& other) const {
    return errors == other.errors && warnings == other.warnings;
}

bool ValidationReport::operator!=(const ValidationReport& other) const {
    return !(*this == other);
}

std::ostream& hpl::operator<<(std::ostream& stream, const ValidationReport& report) {
    for (const auto& elem : report.errors) stream << elem << std::endl;
    for (const auto& elem : report.warnings) stream << elem << std::endl;
    return stream;
}
