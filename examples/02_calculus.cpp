// 02_calculus.cpp - Symbolic derivatives
//
// Shows: differentiate(), repeated differentiation, partial derivatives,
//        checking a derivative against a difference quotient.

#include <iostream>
#include <symcalc/symcalc.hpp>

using namespace symcalc;

int main() {
    auto x = Expr::var("x");
    auto y = Expr::var("y");

    // --- First and second derivatives ---
    auto f = pow(x, 3.0) - 2.0 * x + 1.0;
    auto df = differentiate(f);
    auto d2f = differentiate(df);
    std::cout << "f(x)   = " << f << "\n";
    std::cout << "f'(x)  = " << df << "\n";
    std::cout << "f''(x) = " << d2f << "\n";

    // --- Elementary functions ---
    for (const auto& g : {sin(x), cos(x), tan(x), exp(x), ln(x), sqrt(x),
                          atan(x), root(x, 5), log(x, 10.0)}) {
        std::cout << "d/dx " << g << " = " << differentiate(g) << "\n";
    }

    // --- Partial derivatives: other names are constants ---
    auto h = x * y + sin(y);
    std::cout << "d/dx " << h << " = " << differentiate(h, "x") << "\n";
    std::cout << "d/dy " << h << " = " << differentiate(h, "y") << "\n";

    // --- Numeric check at x = 0.5 ---
    auto g = pow(x, x);
    double dh = 1e-6;
    double numeric = (compute(g, 0.5 + dh) - compute(g, 0.5 - dh)) / (2 * dh);
    std::cout << "d/dx " << g << " at 0.5: symbolic "
              << compute(differentiate(g), 0.5) << ", numeric " << numeric
              << "\n";
}
