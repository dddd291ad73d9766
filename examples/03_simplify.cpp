// 03_simplify.cpp - Algebraic simplification
//
// Shows: simplify() on folding, identities, like terms, logarithm and
//        exponential rules, the iteration limit, structural equality.

#include <iostream>
#include <numbers>
#include <symcalc/symcalc.hpp>

using namespace symcalc;

int main() {
    auto x = Expr::var("x");
    auto y = Expr::var("y");
    auto pi = Expr::lit(std::numbers::pi);

    auto show = [](const Expr& e) {
        std::cout << e << "  =>  " << simplify(e) << "\n";
    };

    // --- Folding and identities ---
    show(Expr::lit(2.0) + 3.0);
    show(sin(pi / 2.0));
    show(x * 1.0 + 0.0);
    show(x - x);

    // --- Collecting terms ---
    show(x + x);
    show(2.0 * x + 3.0 * x);
    show(pow(x, 2.0) * pow(x, 3.0));
    show(2.0 * (x + 3.0));
    show((x * y) / (x * 2.0));

    // --- Logarithms, exponentials, roots ---
    show(ln(pow(x, 2.0)));
    show(exp(2.0 * ln(x)));
    show(sqrt(pow(x, 2.0)));

    // --- One pass at a time ---
    for (int iters = 0; iters <= 2; ++iters) {
        std::cout << "max_iters = " << iters << ": "
                  << simplify(x + x, iters) << "\n";
    }

    // --- Structural equality ---
    std::cout << std::boolalpha;
    std::cout << "2 + 2 == 4: " << (Expr::lit(2.0) + 2.0 == Expr::lit(4.0))
              << "\n";
    std::cout << "x + 1 == 1 + x: " << (x + 1.0 == 1.0 + x) << "\n";
}
