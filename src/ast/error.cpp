#include "ast/error.hpp"

#include <stdexcept>

using namespace hpl;


std::string hpl::ToString(ConstructionErrorKind kind) {
    switch (kind) {
        case ConstructionErrorKind::INVALID_DISJUNCTION_ARITY: return "InvalidDisjunctionArity";
        case ConstructionErrorKind::NON_UNIQUE_DISJUNCT_CHANNEL: return "NonUniqueDisjunctChannel";
        case ConstructionErrorKind::EMPTY_NAME: return "EmptyName";
        case ConstructionErrorKind::EMPTY_OPERANDS: return "EmptyOperands";
        case ConstructionErrorKind::INVALID_SCOPE: return "InvalidScope";
        case ConstructionErrorKind::INVALID_PATTERN: return "InvalidPattern";
        case ConstructionErrorKind::INVALID_TIME_BOUNDS: return "InvalidTimeBounds";
        case ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION: return "NotABooleanExpression";
        case ConstructionErrorKind::NOT_A_CHILD: return "NotAChild";
        case ConstructionErrorKind::INVALID_REPLACEMENT: return "InvalidReplacement";
    }
    throw std::logic_error("Internal error: unknown construction error kind.");
}

inline std::string MakeMessage(ConstructionErrorKind kind, const std::string& subject, const std::string& detail) {
    std::string result = ToString(kind);
    if (!subject.empty()) result += "(" + subject + ")";
    if (!detail.empty()) result += ": " + detail;
    return result;
}

ConstructionError::ConstructionError(ConstructionErrorKind kind, std::string subject_, const std::string& detail)
        : ExceptionWithMessage(MakeMessage(kind, subject_, detail)), kind(kind), subject(std::move(subject_)) {}
