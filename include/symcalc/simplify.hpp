#ifndef SYMCALC_SIMPLIFY_HPP
#define SYMCALC_SIMPLIFY_HPP

#include <cmath>
#include <numbers>
#include <optional>

#include <symcalc/compute.hpp>
#include <symcalc/constants.hpp>
#include <symcalc/equal.hpp>
#include <symcalc/expr.hpp>
#include <symcalc/math.hpp>

namespace symcalc {

namespace detail {

// --- Pattern helpers ---

inline bool is_number(const Expr& e, double v) {
    const auto* c = e.get_if<Constant>();
    return c && c->value == v;
}

// Identity against the shared node first, then by value.
inline bool is_value(const Expr& e, const Expr& cached) {
    return e.same(cached) || is_number(e, cached.get_if<Constant>()->value);
}

inline bool is_zero(const Expr& e) { return is_value(e, constants::zero()); }
inline bool is_one(const Expr& e) { return is_value(e, constants::one()); }
inline bool is_minus_one(const Expr& e) {
    return is_value(e, constants::minus_one());
}

// Variable-free trees fold to their value. Folding that fails or leaves the
// reals keeps the tree as it is.
inline std::optional<Expr> fold(const Expr& e) {
    if (e.is<Constant>())
        return std::nullopt;
    auto v = constant_value(e);
    if (!v)
        return std::nullopt;
    return constants::intern(*v);
}

// Operand of a negation (-1) * v, or nullptr.
inline const Expr* negated(const Expr& e) {
    const auto* m = e.get_if<Multiply>();
    if (!m)
        return nullptr;
    if (is_minus_one(m->lhs))
        return &m->rhs;
    if (is_minus_one(m->rhs))
        return &m->lhs;
    return nullptr;
}

struct Term {
    Expr coefficient;
    Expr rest;
};

// c * rest for a constant c; any other tree is 1 * itself.
inline Term as_term(const Expr& e) {
    if (const auto* m = e.get_if<Multiply>(); m && m->lhs.is_constant())
        return {m->lhs, m->rhs};
    return {constants::one(), e};
}

struct PowerParts {
    Expr base;
    Expr exponent;
};

inline PowerParts as_power(const Expr& e) {
    if (const auto* p = e.get_if<Power>())
        return {p->base, p->exponent};
    return {e, constants::one()};
}

using Combine = Expr (*)(Expr, Expr);

// k*r op m*r -> (k op m) * r
inline std::optional<Expr> merge_like_terms(const Expr& a, const Expr& b,
                                            Combine combine) {
    Term l = as_term(a);
    Term r = as_term(b);
    if (l.rest.is_constant() || !equal(l.rest, r.rest))
        return std::nullopt;
    return mul(combine(l.coefficient, r.coefficient), l.rest);
}

// c*a op c*b -> c * (a op b); only for a non-constant c, constant factors
// are distributed by the Multiply rules instead.
inline std::optional<Expr> factor_out(const Expr& a, const Expr& b,
                                      Combine combine) {
    const auto* l = a.get_if<Multiply>();
    const auto* r = b.get_if<Multiply>();
    if (!l || !r)
        return std::nullopt;
    auto shared = [](const Expr& x, const Expr& y) {
        return !x.is_constant() && equal(x, y);
    };
    if (shared(l->lhs, r->lhs))
        return mul(l->lhs, combine(l->rhs, r->rhs));
    if (shared(l->lhs, r->rhs))
        return mul(l->lhs, combine(l->rhs, r->lhs));
    if (shared(l->rhs, r->lhs))
        return mul(l->rhs, combine(l->lhs, r->rhs));
    if (shared(l->rhs, r->rhs))
        return mul(l->rhs, combine(l->lhs, r->lhs));
    return std::nullopt;
}

// --- Exact values the floating point kernels would round ---

inline std::optional<Expr> sin_special(const Expr& arg) {
    auto v = constant_value(arg);
    if (!v)
        return std::nullopt;
    if (*v == 0.0 || *v == std::numbers::pi)
        return constants::zero();
    if (*v == std::numbers::pi / 2)
        return constants::one();
    return std::nullopt;
}

inline std::optional<Expr> cos_special(const Expr& arg) {
    auto v = constant_value(arg);
    if (!v)
        return std::nullopt;
    if (*v == 0.0)
        return constants::one();
    if (*v == std::numbers::pi)
        return constants::minus_one();
    if (*v == std::numbers::pi / 2)
        return constants::zero();
    return std::nullopt;
}

// --- Per-operator rewrites, applied to already simplified operands ---
//
// Each reducer folds first, then tries its identities in order; the first
// match wins. Results are not re-simplified here; simplify() repeats passes
// until nothing changes.

inline Expr reduce_add(const Expr& a, const Expr& b) {
    Expr sum = add(a, b);
    if (auto f = fold(sum))
        return *f;
    if (is_zero(a))
        return b;
    if (is_zero(b))
        return a;
    const Expr* neg_a = negated(a);
    const Expr* neg_b = negated(b);
    if ((neg_a && equal(*neg_a, b)) || (neg_b && equal(*neg_b, a)))
        return constants::zero();
    if (auto merged = merge_like_terms(a, b, add))
        return *merged;
    if (auto merged = factor_out(a, b, add))
        return *merged;
    if (neg_b)
        return sub(a, *neg_b);
    if (b.is_constant() && !a.is_constant())
        return add(b, a);
    return sum;
}

inline Expr reduce_sub(const Expr& a, const Expr& b) {
    Expr diff = sub(a, b);
    if (auto f = fold(diff))
        return *f;
    if (equal(a, b))
        return constants::zero();
    if (is_zero(b))
        return a;
    if (is_zero(a))
        return negate(b);
    if (const auto* c = b.get_if<Constant>(); c && c->value < 0)
        return add(a, constants::intern(-c->value));
    if (const Expr* neg_b = negated(b))
        return add(a, *neg_b);
    if (auto merged = merge_like_terms(a, b, sub))
        return *merged;
    if (auto merged = factor_out(a, b, sub))
        return *merged;
    return diff;
}

inline Expr reduce_mul(const Expr& a, const Expr& b) {
    Expr product = mul(a, b);
    if (auto f = fold(product))
        return *f;
    if (is_zero(a) || is_zero(b))
        return constants::zero();
    if (is_one(a))
        return b;
    if (is_one(b))
        return a;
    if (a.is_constant()) {
        // c * (d * r) -> (c*d) * r
        if (const auto* m = b.get_if<Multiply>(); m && m->lhs.is_constant())
            return mul(mul(a, m->lhs), m->rhs);
        if (const auto* s = b.get_if<Add>())
            return add(mul(a, s->lhs), mul(a, s->rhs));
    } else {
        if (b.is_constant())
            return mul(b, a);
        // Coefficients move outward: (c*p)*q and p*(c*q) -> c*(p*q)
        if (const auto* m = a.get_if<Multiply>(); m && m->lhs.is_constant())
            return mul(m->lhs, mul(m->rhs, b));
        if (const auto* m = b.get_if<Multiply>(); m && m->lhs.is_constant())
            return mul(m->lhs, mul(a, m->rhs));
    }
    if (equal(a, b))
        return pow(a, constants::two());
    if (a.is<Power>() || b.is<Power>()) {
        auto pa = as_power(a);
        auto pb = as_power(b);
        if (!pa.base.is_constant() && equal(pa.base, pb.base))
            return pow(pa.base, add(pa.exponent, pb.exponent));
    }
    return product;
}

inline Expr reduce_div(const Expr& a, const Expr& b) {
    Expr quotient = divide(a, b);
    if (auto f = fold(quotient))
        return *f;
    if (is_zero(a) && !is_zero(b))
        return constants::zero();
    if (is_one(b))
        return a;
    if (!is_zero(a) && equal(a, b))
        return constants::one();
    if (is_minus_one(b))
        return negate(a);

    const auto* num = a.get_if<Multiply>();
    const auto* den = b.get_if<Multiply>();
    if (num) {
        if (equal(num->rhs, b))
            return num->lhs;
        if (equal(num->lhs, b))
            return num->rhs;
    }
    if (den) {
        if (equal(den->lhs, a))
            return divide(constants::one(), den->rhs);
        if (equal(den->rhs, a))
            return divide(constants::one(), den->lhs);
    }
    if (num && den) {
        if (equal(num->lhs, den->lhs))
            return divide(num->rhs, den->rhs);
        if (equal(num->lhs, den->rhs))
            return divide(num->rhs, den->lhs);
        if (equal(num->rhs, den->lhs))
            return divide(num->lhs, den->rhs);
        if (equal(num->rhs, den->rhs))
            return divide(num->lhs, den->lhs);
    }
    if (a.is<Power>() || b.is<Power>()) {
        auto pa = as_power(a);
        auto pb = as_power(b);
        if (!pa.base.is_constant() && equal(pa.base, pb.base))
            return pow(pa.base, sub(pa.exponent, pb.exponent));
    }
    // a / c -> (1/c) * a, unless 1/c overflows
    if (auto c = constant_value(b); c && *c != 0.0) {
        double reciprocal = 1.0 / *c;
        if (std::isfinite(reciprocal))
            return mul(constants::intern(reciprocal), a);
    }
    return quotient;
}

inline Expr reduce_pow(const Expr& base, const Expr& exponent) {
    Expr power = pow(base, exponent);
    if (auto f = fold(power))
        return *f;
    if (is_zero(exponent) && !is_zero(base))
        return constants::one();
    if (is_one(exponent))
        return base;
    if (is_one(base))
        return constants::one();
    if (is_zero(base)) {
        if (auto v = constant_value(exponent); v && *v > 0)
            return constants::zero();
    }
    if (const auto* inner = base.get_if<Power>())
        return pow(inner->base, mul(inner->exponent, exponent));
    if (is_value(base, constants::e())) {
        if (const auto* l = exponent.get_if<Ln>())
            return l->arg;
    }
    return power;
}

inline Expr reduce_log(const Expr& value, const Expr& base) {
    Expr logarithm = log(value, base);
    if (auto f = fold(logarithm))
        return *f;
    if (equal(value, base))
        return constants::one();
    if (is_one(value))
        return constants::zero();
    return logarithm;
}

inline Expr reduce_ln(const Expr& arg) {
    if (is_one(arg))
        return constants::zero();
    if (is_value(arg, constants::e()))
        return constants::one();
    Expr logarithm = ln(arg);
    if (auto f = fold(logarithm))
        return *f;
    if (const auto* x = arg.get_if<Exp>())
        return x->arg;
    if (const auto* p = arg.get_if<Power>())
        return mul(p->exponent, ln(p->base));
    // Splitting is skipped when a factor is a non-positive constant.
    auto splits = [](const Expr& f) {
        if (!f.is_constant())
            return true;
        auto v = constant_value(f);
        return v && *v > 0;
    };
    if (const auto* m = arg.get_if<Multiply>();
        m && splits(m->lhs) && splits(m->rhs))
        return add(ln(m->lhs), ln(m->rhs));
    if (const auto* d = arg.get_if<Divide>();
        d && splits(d->lhs) && splits(d->rhs))
        return sub(ln(d->lhs), ln(d->rhs));
    return logarithm;
}

inline Expr reduce_exp(const Expr& arg) {
    if (is_zero(arg))
        return constants::one();
    if (is_one(arg))
        return constants::e();
    Expr exponential = exp(arg);
    if (auto f = fold(exponential))
        return *f;
    if (const auto* l = arg.get_if<Ln>())
        return l->arg;
    if (const auto* m = arg.get_if<Multiply>()) {
        if (const auto* l = m->rhs.get_if<Ln>())
            return pow(l->arg, m->lhs);
        if (const auto* l = m->lhs.get_if<Ln>())
            return pow(l->arg, m->rhs);
    }
    return exponential;
}

// root(v^n) -> v for a root of degree n
inline std::optional<Expr> unwrap_power(const Expr& arg, double degree) {
    if (const auto* p = arg.get_if<Power>(); p && is_number(p->exponent, degree))
        return p->base;
    return std::nullopt;
}

inline Expr reduce_sqrt(const Expr& arg) {
    if (is_zero(arg) || is_one(arg))
        return arg;
    Expr r = sqrt(arg);
    if (auto f = fold(r))
        return *f;
    if (auto base = unwrap_power(arg, 2.0))
        return *base;
    return r;
}

inline Expr reduce_cbrt(const Expr& arg) {
    if (is_zero(arg) || is_one(arg) || is_minus_one(arg))
        return arg;
    Expr r = cbrt(arg);
    if (auto f = fold(r))
        return *f;
    if (auto base = unwrap_power(arg, 3.0))
        return *base;
    return r;
}

inline Expr reduce_root(const Expr& arg, int degree) {
    if (is_zero(arg) || is_one(arg))
        return arg;
    if (degree % 2 == 1 && is_minus_one(arg))
        return arg;
    Expr r = root(arg, degree);
    if (auto f = fold(r))
        return *f;
    if (auto base = unwrap_power(arg, degree))
        return *base;
    return r;
}

inline Expr reduce_sin(const Expr& arg) {
    if (auto v = sin_special(arg))
        return *v;
    Expr s = sin(arg);
    if (auto f = fold(s))
        return *f;
    if (const Expr* inner = negated(arg))
        return negate(sin(*inner));
    return s;
}

inline Expr reduce_cos(const Expr& arg) {
    if (auto v = cos_special(arg))
        return *v;
    Expr c = cos(arg);
    if (auto f = fold(c))
        return *f;
    if (const Expr* inner = negated(arg))
        return cos(*inner);
    return c;
}

// Remaining unary functions only fold.
template <typename Fn> Expr reduce_unary(const Expr& arg) {
    Expr e = make_expr(Unary<Fn>{arg});
    if (auto f = fold(e))
        return *f;
    return e;
}

inline Expr simplify_once(const Expr& e);

struct Simplifier {
    const Expr& self;

    Expr operator()(const Constant&) const { return self; }
    Expr operator()(const Variable&) const { return self; }
    Expr operator()(const Add& n) const {
        return reduce_add(simplify_once(n.lhs), simplify_once(n.rhs));
    }
    Expr operator()(const Subtract& n) const {
        return reduce_sub(simplify_once(n.lhs), simplify_once(n.rhs));
    }
    Expr operator()(const Multiply& n) const {
        return reduce_mul(simplify_once(n.lhs), simplify_once(n.rhs));
    }
    Expr operator()(const Divide& n) const {
        return reduce_div(simplify_once(n.lhs), simplify_once(n.rhs));
    }
    Expr operator()(const Power& n) const {
        return reduce_pow(simplify_once(n.base), simplify_once(n.exponent));
    }
    Expr operator()(const Log& n) const {
        return reduce_log(simplify_once(n.value), simplify_once(n.base));
    }
    Expr operator()(const NthRoot& n) const {
        return reduce_root(simplify_once(n.arg), n.degree);
    }
    Expr operator()(const Ln& n) const { return reduce_ln(simplify_once(n.arg)); }
    Expr operator()(const Exp& n) const {
        return reduce_exp(simplify_once(n.arg));
    }
    Expr operator()(const Sqrt& n) const {
        return reduce_sqrt(simplify_once(n.arg));
    }
    Expr operator()(const Cbrt& n) const {
        return reduce_cbrt(simplify_once(n.arg));
    }
    Expr operator()(const Sin& n) const {
        return reduce_sin(simplify_once(n.arg));
    }
    Expr operator()(const Cos& n) const {
        return reduce_cos(simplify_once(n.arg));
    }
    template <typename Fn> Expr operator()(const Unary<Fn>& n) const {
        return reduce_unary<Fn>(simplify_once(n.arg));
    }
};

// One bottom-up rewrite pass.
inline Expr simplify_once(const Expr& e) {
    return std::visit(Simplifier{e}, e.node().value);
}

} // namespace detail

// --- simplify: rewrite passes until a fixed point ---

inline Expr simplify(const Expr& e, int max_iters = 100) {
    Expr current = e;
    for (int iter = 0; iter < max_iters; ++iter) {
        Expr next = detail::simplify_once(current);
        if (equal(current, next))
            return next;
        current = next;
    }
    return current;
}

} // namespace symcalc

#endif // SYMCALC_SIMPLIFY_HPP
