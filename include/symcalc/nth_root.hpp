#ifndef SYMCALC_NTH_ROOT_HPP
#define SYMCALC_NTH_ROOT_HPP

#include <cmath>

#include <symcalc/errors.hpp>

namespace symcalc {

// --- nth_root: Newton fixed-point iteration ---
//
// g <- ((n-1)*g + value/g^(n-1)) / n, starting at g = value. A slow and a
// fast iterate are advanced together until they meet, which also ends the
// loop when rounding leaves the sequence in a short cycle.

inline double nth_root(double value, int degree) {
    if (degree < 2)
        throw InvalidDomain("root degree must be at least 2");
    if (!(value > 0.0) || !std::isfinite(value))
        throw InvalidDomain("root operand must be positive and finite");
    const double np = static_cast<double>(degree - 1);
    auto step = [&](double g) {
        return (np * g + value / std::pow(g, np)) / degree;
    };
    double slow = value;
    double fast = step(slow);
    while (slow != fast) {
        slow = step(slow);
        fast = step(step(fast));
    }
    return slow;
}

} // namespace symcalc

#endif // SYMCALC_NTH_ROOT_HPP
