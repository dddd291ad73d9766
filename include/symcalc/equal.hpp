#ifndef SYMCALC_EQUAL_HPP
#define SYMCALC_EQUAL_HPP

#include <type_traits>
#include <variant>

#include <symcalc/compute.hpp>
#include <symcalc/expr.hpp>

namespace symcalc {

inline bool equal(const Expr& a, const Expr& b);

namespace detail {

// Same variant on both sides: compare payloads and children. Distinct
// variants never match; there is no permissive fallback.
struct SameShape {
    bool operator()(const Constant& a, const Constant& b) const {
        return a.value == b.value;
    }
    bool operator()(const Variable& a, const Variable& b) const {
        return a.name == b.name;
    }
    template <typename Op>
    bool operator()(const Binary<Op>& a, const Binary<Op>& b) const {
        return equal(a.lhs, b.lhs) && equal(a.rhs, b.rhs);
    }
    bool operator()(const Power& a, const Power& b) const {
        return equal(a.base, b.base) && equal(a.exponent, b.exponent);
    }
    bool operator()(const Log& a, const Log& b) const {
        return equal(a.value, b.value) && equal(a.base, b.base);
    }
    bool operator()(const NthRoot& a, const NthRoot& b) const {
        return a.degree == b.degree && equal(a.arg, b.arg);
    }
    template <typename Fn>
    bool operator()(const Unary<Fn>& a, const Unary<Fn>& b) const {
        return equal(a.arg, b.arg);
    }
    template <typename A, typename B>
        requires(!std::is_same_v<A, B>)
    bool operator()(const A&, const B&) const {
        return false;
    }
};

} // namespace detail

// --- equal: structural equality used by the rewrite rules ---
//
// Two variable-free trees are equal when they evaluate to the same value;
// otherwise the variant tags must match with pairwise-equal children.

inline bool equal(const Expr& a, const Expr& b) {
    if (a.same(b))
        return true;
    if (a.is_constant() && b.is_constant()) {
        auto va = constant_value(a);
        auto vb = constant_value(b);
        if (va && vb)
            return *va == *vb;
    }
    return std::visit(detail::SameShape{}, a.node().value, b.node().value);
}

inline bool operator==(const Expr& a, const Expr& b) { return equal(a, b); }

} // namespace symcalc

#endif // SYMCALC_EQUAL_HPP
