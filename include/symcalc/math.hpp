#ifndef SYMCALC_MATH_HPP
#define SYMCALC_MATH_HPP

#include <utility>

#include <symcalc/constants.hpp>
#include <symcalc/expr.hpp>

namespace symcalc {

// Negation is (-1) * e; there is no dedicated node.
inline Expr negate(Expr e) { return mul(constants::minus_one(), std::move(e)); }

// --- Operator sugar ---

inline Expr operator+(Expr lhs, Expr rhs) {
    return add(std::move(lhs), std::move(rhs));
}
inline Expr operator-(Expr lhs, Expr rhs) {
    return sub(std::move(lhs), std::move(rhs));
}
inline Expr operator*(Expr lhs, Expr rhs) {
    return mul(std::move(lhs), std::move(rhs));
}
inline Expr operator/(Expr lhs, Expr rhs) {
    return divide(std::move(lhs), std::move(rhs));
}
inline Expr operator-(Expr x) { return negate(std::move(x)); }

// double on LHS
inline Expr operator+(double lhs, Expr rhs) {
    return add(Expr::lit(lhs), std::move(rhs));
}
inline Expr operator-(double lhs, Expr rhs) {
    return sub(Expr::lit(lhs), std::move(rhs));
}
inline Expr operator*(double lhs, Expr rhs) {
    return mul(Expr::lit(lhs), std::move(rhs));
}
inline Expr operator/(double lhs, Expr rhs) {
    return divide(Expr::lit(lhs), std::move(rhs));
}

// double on RHS
inline Expr operator+(Expr lhs, double rhs) {
    return add(std::move(lhs), Expr::lit(rhs));
}
inline Expr operator-(Expr lhs, double rhs) {
    return sub(std::move(lhs), Expr::lit(rhs));
}
inline Expr operator*(Expr lhs, double rhs) {
    return mul(std::move(lhs), Expr::lit(rhs));
}
inline Expr operator/(Expr lhs, double rhs) {
    return divide(std::move(lhs), Expr::lit(rhs));
}

inline Expr pow(Expr base, double exponent) {
    return pow(std::move(base), Expr::lit(exponent));
}
inline Expr log(Expr value, double base) {
    return log(std::move(value), Expr::lit(base));
}

} // namespace symcalc

#endif // SYMCALC_MATH_HPP
