#include "logics/encoding.hpp"

#include "internal.hpp"

using namespace hpl;


//
// EExpr
//

EExpr EExpr::operator!() const { return EExpr(repr->Negate()); }
EExpr EExpr::operator==(const EExpr& other) const { return EExpr(repr->Eq(*other.repr)); }

const InternalExpr& EExpr::Repr() const { return *repr; }

EExpr::EExpr(std::unique_ptr<InternalExpr> repr_) : repr(std::move(repr_)) {
    if (!repr) throw InternalEncodingError("expression must not be null");
}

EExpr::EExpr(const EExpr& other) : EExpr(other.repr->Copy()) {
}

EExpr& EExpr::operator=(const EExpr& other) {
    repr = other.repr->Copy();
    return *this;
}


//
// Encoding
//

SolvingError::SolvingError(const std::string& query)
        : ExceptionWithMessage("SMT solving failed: Z3 was unable to prove/disprove satisfiability of '" + query + "'.") {}

Encoding::Encoding(unsigned int timeoutMilliseconds) : internal(std::make_unique<Z3InternalStorage>()) {
    if (timeoutMilliseconds == 0) return;
    z3::params params(AsContext(internal));
    params.set("timeout", timeoutMilliseconds);
    AsSolver(internal).set(params);
}

EExpr Encoding::Encode(const Expression& expression) {
    return AsEExpr(EncodeExpression(AsContext(internal), expression));
}

EExpr Encoding::Encode(const Predicate& predicate) {
    return Encode(*predicate.condition);
}
