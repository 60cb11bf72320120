#include "logics/encoding.hpp"

#include <sstream>
#include "internal.hpp"

using namespace hpl;


inline std::string Describe(const z3::expr& expr) {
    std::stringstream stream;
    stream << expr;
    return stream.str();
}

inline bool IsSat(z3::solver& solver, const z3::expr& expr) {
    z3::check_result res;
    solver.push();
    try {
        solver.add(expr);
        res = solver.check();
    } catch (const z3::exception& err) {
        solver.pop();
        throw SolvingError(Describe(expr) + " [" + err.msg() + "]");
    }
    solver.pop();
    switch (res) {
        case z3::unsat: return false;
        case z3::sat: return true;
        case z3::unknown: throw SolvingError(Describe(expr));
    }
    throw SolvingError(Describe(expr));
}

bool Encoding::IsSatisfiable(const EExpr& expr) {
    return IsSat(AsSolver(internal), AsExpr(expr));
}

bool Encoding::IsValid(const EExpr& expr) {
    return !IsSatisfiable(!expr);
}

bool Encoding::IsSatisfiable(const Expression& expression) {
    return IsSatisfiable(Encode(expression));
}

bool Encoding::IsValid(const Expression& expression) {
    return IsValid(Encode(expression));
}

bool Encoding::AreEquivalent(const Expression& expression, const Expression& other) {
    return IsValid(Encode(expression) == Encode(other));
}
