#ifndef SYMCALC_DIFFERENTIATE_HPP
#define SYMCALC_DIFFERENTIATE_HPP

#include <string_view>

#include <symcalc/constants.hpp>
#include <symcalc/expr.hpp>
#include <symcalc/math.hpp>
#include <symcalc/simplify.hpp>

namespace symcalc {

namespace detail {

// Structural recursion producing the raw derivative. Operand subtrees are
// shared with the input, never copied.
struct Differentiator {
    std::string_view var;

    Expr d(const Expr& e) const { return std::visit(*this, e.node().value); }

    Expr operator()(const Constant&) const { return constants::zero(); }
    Expr operator()(const Variable& n) const {
        return n.name == var ? constants::one() : constants::zero();
    }

    Expr operator()(const Add& n) const { return add(d(n.lhs), d(n.rhs)); }
    Expr operator()(const Subtract& n) const {
        return sub(d(n.lhs), d(n.rhs));
    }
    // (ab)' = a'b + ab'
    Expr operator()(const Multiply& n) const {
        return add(mul(d(n.lhs), n.rhs), mul(n.lhs, d(n.rhs)));
    }
    // (a/b)' = (a'b - ab') / b^2
    Expr operator()(const Divide& n) const {
        return divide(sub(mul(d(n.lhs), n.rhs), mul(n.lhs, d(n.rhs))),
                      pow(n.rhs, constants::two()));
    }

    Expr operator()(const Power& n) const {
        const Expr& b = n.base;
        const Expr& x = n.exponent;
        if (x.is_constant())
            return mul(mul(x, pow(b, sub(x, constants::one()))), d(b));
        if (b.is_constant())
            return mul(mul(pow(b, x), ln(b)), d(x));
        // Logarithmic differentiation: (b^x)' = b^x * (x' ln b + x b'/b)
        return mul(pow(b, x),
                   add(mul(d(x), ln(b)), divide(mul(x, d(b)), b)));
    }

    // The base is treated as fixed.
    Expr operator()(const Log& n) const {
        return divide(d(n.value), mul(n.value, ln(n.base)));
    }

    Expr operator()(const Ln& n) const { return divide(d(n.arg), n.arg); }
    Expr operator()(const Ld& n) const {
        return d(divide(ln(n.arg), constants::ln_two()));
    }
    Expr operator()(const Exp& n) const {
        return mul(exp(n.arg), d(n.arg));
    }

    Expr operator()(const Sqrt& n) const {
        return divide(d(n.arg), mul(constants::two(), sqrt(n.arg)));
    }
    Expr operator()(const Cbrt& n) const {
        return divide(d(n.arg), mul(constants::three(),
                                    pow(cbrt(n.arg), constants::two())));
    }
    // root(v, n)' = v' / (n * root(v, n)^(n-1))
    Expr operator()(const NthRoot& n) const {
        return divide(d(n.arg),
                      mul(constants::intern(n.degree),
                          pow(root(n.arg, n.degree),
                              constants::intern(n.degree - 1))));
    }

    Expr operator()(const Sin& n) const { return mul(cos(n.arg), d(n.arg)); }
    Expr operator()(const Cos& n) const {
        return mul(negate(sin(n.arg)), d(n.arg));
    }
    Expr operator()(const Tan& n) const {
        return divide(d(n.arg), pow(cos(n.arg), constants::two()));
    }
    Expr operator()(const Asin& n) const {
        return divide(d(n.arg), unit_circle(n.arg));
    }
    Expr operator()(const Acos& n) const {
        return negate(divide(d(n.arg), unit_circle(n.arg)));
    }
    Expr operator()(const Atan& n) const {
        return divide(d(n.arg),
                      add(constants::one(), pow(n.arg, constants::two())));
    }

    // Constant linear scale: the conversion wraps the inner derivative.
    Expr operator()(const ToRadians& n) const { return to_radians(d(n.arg)); }
    Expr operator()(const ToDegrees& n) const { return to_degrees(d(n.arg)); }

private:
    // sqrt(1 - v^2)
    static Expr unit_circle(const Expr& v) {
        return sqrt(sub(constants::one(), pow(v, constants::two())));
    }
};

inline Expr derive(const Expr& e, std::string_view var) {
    return Differentiator{var}.d(e);
}

} // namespace detail

// --- differentiate: simplified symbolic derivative ---

inline Expr differentiate(const Expr& e, std::string_view var = "x") {
    return simplify(detail::derive(e, var));
}

} // namespace symcalc

#endif // SYMCALC_DIFFERENTIATE_HPP
