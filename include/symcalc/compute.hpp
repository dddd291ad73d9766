#ifndef SYMCALC_COMPUTE_HPP
#define SYMCALC_COMPUTE_HPP

#include <cmath>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <symcalc/errors.hpp>
#include <symcalc/expr.hpp>
#include <symcalc/nth_root.hpp>

namespace symcalc {

// Variable name -> expression. Bound expressions are themselves computed
// against the same bindings, so a binding may substitute a subtree.
// A binding that reaches its own name again recurses without bound; keeping
// bindings acyclic is up to the caller.
using Bindings = std::map<std::string, Expr, std::less<>>;

inline double compute(const Expr& e, const Bindings& bindings);

namespace detail {

struct Evaluator {
    const Bindings& bindings;

    double eval(const Expr& e) const { return std::visit(*this, e.node().value); }

    double operator()(const Constant& n) const { return n.value; }

    double operator()(const Variable& n) const {
        auto it = bindings.find(n.name);
        if (it == bindings.end())
            throw UnboundVariable(n.name);
        return eval(it->second);
    }

    double operator()(const Add& n) const { return eval(n.lhs) + eval(n.rhs); }
    double operator()(const Subtract& n) const {
        return eval(n.lhs) - eval(n.rhs);
    }
    double operator()(const Multiply& n) const {
        return eval(n.lhs) * eval(n.rhs);
    }
    double operator()(const Divide& n) const {
        double divisor = eval(n.rhs);
        if (divisor == 0.0)
            throw DivisionByZero();
        return eval(n.lhs) / divisor;
    }
    double operator()(const Power& n) const {
        return std::pow(eval(n.base), eval(n.exponent));
    }
    double operator()(const Log& n) const {
        return std::log(eval(n.value)) / std::log(eval(n.base));
    }
    double operator()(const NthRoot& n) const {
        return nth_root(eval(n.arg), n.degree);
    }
    template <typename Fn> double operator()(const Unary<Fn>& n) const {
        return Fn::apply(eval(n.arg));
    }
};

} // namespace detail

// --- compute: numeric evaluation ---

inline double compute(const Expr& e, const Bindings& bindings) {
    return detail::Evaluator{bindings}.eval(e);
}

inline double compute(const Expr& e, const Expr& x) {
    return compute(e, Bindings{{"x", x}});
}

inline double compute(const Expr& e, double x) {
    return compute(e, Expr::lit(x));
}

inline double compute(const Expr& e) { return compute(e, Bindings{}); }

// Finite value of a variable-free tree, or nullopt when the tree has free
// variables or its evaluation fails or leaves the reals.
inline std::optional<double> constant_value(const Expr& e) {
    if (!e.is_constant())
        return std::nullopt;
    if (const auto* c = e.get_if<Constant>())
        return c->value;
    try {
        double v = compute(e);
        if (!std::isfinite(v))
            return std::nullopt;
        return v;
    } catch (const Error&) {
        return std::nullopt;
    }
}

} // namespace symcalc

#endif // SYMCALC_COMPUTE_HPP
