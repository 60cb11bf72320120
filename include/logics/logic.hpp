#pragma once
#ifndef HPL_LOGICS_LOGIC_HPP
#define HPL_LOGICS_LOGIC_HPP

#include <deque>
#include <memory>
#include <functional>
#include "ast/ast.hpp"

namespace hpl {

    //
    // Connectives
    //

    std::unique_ptr<Expression> Negate(std::unique_ptr<Expression> expression);
    std::unique_ptr<Expression> Conjoin(std::deque<std::unique_ptr<Expression>> operands);
    std::unique_ptr<Expression> Conjoin(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
    std::unique_ptr<Expression> Disjoin(std::deque<std::unique_ptr<Expression>> operands);
    std::unique_ptr<Expression> Disjoin(std::unique_ptr<Expression> lhs, std::unique_ptr<Expression> rhs);
    std::unique_ptr<Expression> Implies(std::unique_ptr<Expression> premise, std::unique_ptr<Expression> conclusion);

    [[nodiscard]] bool IsConnective(const Expression& expression);

    std::unique_ptr<Predicate> Negate(const Predicate& predicate);
    std::unique_ptr<Predicate> Join(const Predicate& predicate, const Predicate& other);

    //
    // Simplification
    //

    /**
     * Rewrites 'expression' into an equivalent one: double negations are eliminated, nested connectives of the
     * same kind are flattened, neutral constants are dropped, dominating constants short-circuit, and repeated
     * operands are removed. Non-connective sub-expressions are treated as opaque atoms and left unchanged.
     * The result denotes the same three-valued truth value as the input for every valuation of the atoms,
     * and simplifying it again yields a structurally equal expression.
     */
    std::unique_ptr<Expression> Simplify(std::unique_ptr<Expression> expression);
    void Simplify(Predicate& predicate);

    //
    // Evaluation
    //

    Truth Not(Truth value);
    Truth And(Truth value, Truth other);
    Truth Or(Truth value, Truth other);

    using AtomValuation = std::function<Truth(const Expression&)>;

    /**
     * Evaluates the connective structure of 'expression' in Kleene's three-valued logic.
     * Atoms (every non-connective sub-expression) are evaluated by 'valuation'.
     */
    Truth Evaluate(const Expression& expression, const AtomValuation& valuation);

} // namespace hpl

#endif //HPL_LOGICS_LOGIC_HPP
