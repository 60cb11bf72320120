#pragma once
#ifndef HPL_VALIDATION_VALIDATE_HPP
#define HPL_VALIDATION_VALIDATE_HPP

#include <deque>
#include "ast/ast.hpp"
#include "config.hpp"
#include "diagnostics.hpp"

namespace hpl {

    /**
     * Checks a property and returns every problem found. Runs the structural pass, the binding pass
     * and the pattern-sanity pass to completion; diagnostics are ordered by pass, then by tree order.
     * Freezes the configuration's function registry. Does not modify the property.
     */
    ValidationReport Validate(const Property& property, const ValidationConfig& config);
    ValidationReport Validate(const Property& property);

    /**
     * Validates every property of 'specification' independently. The i-th report belongs to the i-th property.
     */
    std::deque<ValidationReport> Validate(const Specification& specification, const ValidationConfig& config);
    std::deque<ValidationReport> Validate(const Specification& specification);

    /**
     * Like 'Validate', but distributes the properties over 'threads' worker threads (0 picks the hardware
     * concurrency). The result is identical to the sequential validation.
     */
    std::deque<ValidationReport> ValidateParallel(const Specification& specification, const ValidationConfig& config,
                                                  std::size_t threads = 0);

    /**
     * Checks a function call and, recursively, the calls among its arguments against 'registry'.
     * Reports UnknownFunction, FunctionArityMismatch and FunctionArgTypeMismatch.
     */
    std::deque<Diagnostic> TypeCheck(const FunctionCall& call, const FunctionRegistry& registry);

    /**
     * Structural checks of an event on its own: disjunction arity and channel uniqueness, as well as
     * aliases bound by only some disjuncts.
     */
    std::deque<Diagnostic> CheckEvent(const Event& event);

} // namespace hpl

#endif //HPL_VALIDATION_VALIDATE_HPP
