#pragma once
#ifndef HPL_LOGICS_ENCODING_INTERNAL_HPP
#define HPL_LOGICS_ENCODING_INTERNAL_HPP

#include "z3++.h"
#include "logics/encoding.hpp"

namespace hpl {

    struct InternalEncodingError : public ExceptionWithMessage {
        explicit InternalEncodingError(const std::string& detail)
                : ExceptionWithMessage("Internal error while encoding predicate: " + detail + ".") {}
    };

    inline const z3::expr& AsExpr(const InternalExpr& expr);

    /**
     * Z3 term behind an EExpr. Negation and equality produce Bool terms in the context of 'repr'.
     */
    struct Z3Expr : public InternalExpr {
        z3::expr repr;

        explicit Z3Expr(z3::expr term) : repr(std::move(term)) {}

        [[nodiscard]] std::unique_ptr<InternalExpr> Negate() const override { return std::make_unique<Z3Expr>(!repr); }
        [[nodiscard]] std::unique_ptr<InternalExpr> Copy() const override { return std::make_unique<Z3Expr>(repr); }

        [[nodiscard]] std::unique_ptr<InternalExpr> Eq(const InternalExpr& rhs) const override {
            return std::make_unique<Z3Expr>(repr == AsExpr(rhs));
        }
    };

    inline const z3::expr& AsExpr(const InternalExpr& expr) {
        auto term = dynamic_cast<const Z3Expr*>(&expr);
        if (!term) throw InternalEncodingError("expression was not produced by the Z3 backend");
        return term->repr;
    }

    inline const z3::expr& AsExpr(const EExpr& expr) { return AsExpr(expr.Repr()); }

    /**
     * Owns the Z3 context and the solver of one Encoding. Neither is shared between threads.
     */
    struct Z3InternalStorage : public InternalStorage {
        z3::context context;
        z3::solver solver;

        Z3InternalStorage() : context(), solver(context) {}
    };

    inline Z3InternalStorage& AsInternal(const std::unique_ptr<InternalStorage>& storage) {
        auto z3Storage = dynamic_cast<Z3InternalStorage*>(storage.get());
        if (!z3Storage) throw InternalEncodingError("encoding storage is not backed by Z3");
        return *z3Storage;
    }

    inline z3::context& AsContext(const std::unique_ptr<InternalStorage>& storage) { return AsInternal(storage).context; }
    inline z3::solver& AsSolver(const std::unique_ptr<InternalStorage>& storage) { return AsInternal(storage).solver; }

    inline EExpr AsEExpr(const z3::expr& expr) {
        return EExpr(std::make_unique<Z3Expr>(expr));
    }

    z3::expr EncodeExpression(z3::context& context, const Expression& expression);

} // namespace hpl

#endif //HPL_LOGICS_ENCODING_INTERNAL_HPP
