#ifndef SYMCALC_CONSTANTS_HPP
#define SYMCALC_CONSTANTS_HPP

#include <cmath>
#include <initializer_list>
#include <numbers>

#include <symcalc/expr.hpp>

namespace symcalc {
namespace constants {

// --- Shared constant nodes, created once and compared by identity ---

inline const Expr& zero() {
    static const Expr c = Expr::lit(0.0);
    return c;
}
inline const Expr& one() {
    static const Expr c = Expr::lit(1.0);
    return c;
}
inline const Expr& two() {
    static const Expr c = Expr::lit(2.0);
    return c;
}
inline const Expr& three() {
    static const Expr c = Expr::lit(3.0);
    return c;
}
inline const Expr& minus_one() {
    static const Expr c = Expr::lit(-1.0);
    return c;
}
inline const Expr& e() {
    static const Expr c = Expr::lit(std::numbers::e);
    return c;
}
inline const Expr& pi() {
    static const Expr c = Expr::lit(std::numbers::pi);
    return c;
}

// ln(2), computed on first use
inline const Expr& ln_two() {
    static const Expr c = Expr::lit(std::log(2.0));
    return c;
}

// Returns the shared node for a cached value, a fresh literal otherwise.
inline Expr intern(double v) {
    for (const Expr* c : {&zero(), &one(), &two(), &three(), &minus_one(),
                          &e(), &pi()}) {
        if (c->get_if<Constant>()->value == v)
            return *c;
    }
    return Expr::lit(v);
}

} // namespace constants
} // namespace symcalc

#endif // SYMCALC_CONSTANTS_HPP
