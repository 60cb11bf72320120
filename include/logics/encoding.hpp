#pragma once
#ifndef HPL_LOGICS_ENCODING_HPP
#define HPL_LOGICS_ENCODING_HPP

#include <memory>
#include <string>
#include "ast/ast.hpp"
#include "util/shortcuts.hpp"

namespace hpl {

    /**
     * Raised when the SMT backend can neither prove nor refute a query.
     */
    struct SolvingError : public ExceptionWithMessage {
        explicit SolvingError(const std::string& query);
    };

    struct InternalExpr {
        virtual ~InternalExpr() = default;
        [[nodiscard]] virtual std::unique_ptr<InternalExpr> Negate() const = 0;
        [[nodiscard]] virtual std::unique_ptr<InternalExpr> Eq(const InternalExpr& other) const = 0;
        [[nodiscard]] virtual std::unique_ptr<InternalExpr> Copy() const = 0;
    };

    struct InternalStorage {
        virtual ~InternalStorage() = default;
    };

    struct EExpr {
        EExpr operator!() const;
        EExpr operator==(const EExpr& other) const;

        [[nodiscard]] const InternalExpr& Repr() const;
        explicit EExpr(std::unique_ptr<InternalExpr> repr);
        EExpr(const EExpr& other);
        EExpr& operator=(const EExpr& other);

        private:
            std::unique_ptr<InternalExpr> repr;
    };

    /**
     * Translates predicate expressions into an SMT solver. Numbers are encoded as reals, strings as SMT strings.
     * Sub-expressions without a faithful encoding (function calls, quantifiers, field and array accesses, powers,
     * and unknown truth values) become uninterpreted constants named after their printed form, so that equal
     * sub-expressions share a constant. Hence, 'unsatisfiable' and 'valid' answers are sound.
     * Each instance owns a separate solver context.
     */
    struct Encoding {
        explicit Encoding(unsigned int timeoutMilliseconds = 0);
        virtual ~Encoding() = default;

        EExpr Encode(const Expression& expression);
        EExpr Encode(const Predicate& predicate);

        /**
         * Every other query is answered through this one.
         * @throws SolvingError if the solver answers 'unknown' or fails.
         */
        virtual bool IsSatisfiable(const EExpr& expr);
        bool IsValid(const EExpr& expr);
        bool IsSatisfiable(const Expression& expression);
        bool IsValid(const Expression& expression);
        bool AreEquivalent(const Expression& expression, const Expression& other);

        private:
            std::unique_ptr<InternalStorage> internal;
    };

} // namespace hpl

#endif //HPL_LOGICS_ENCODING_HPP
