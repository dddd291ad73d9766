// 01_hello_expr.cpp - Building and evaluating your first expression
//
// Shows: Expr::lit(), Expr::var(), operator sugar, pretty_print(),
//        compute() with a value and with bindings.

#include <iostream>
#include <symcalc/symcalc.hpp>

using namespace symcalc;

int main() {
    // --- Build an expression: f(x) = x^2 + 2x + 1 ---
    auto x = Expr::var("x");
    auto f = pow(x, 2.0) + 2.0 * x + 1.0;

    std::cout << "f(x) = " << f << "\n";
    for (double v : {-2.0, -1.0, 0.0, 1.0, 2.0, 3.0}) {
        std::cout << "f(" << v << ") = " << compute(f, v) << "\n";
    }

    // Bindings may hold whole expressions; they are computed too
    auto y = Expr::var("y");
    Bindings env{{"x", y * 2.0}, {"y", Expr::lit(1.5)}};
    std::cout << "f(2y) at y = 1.5: " << compute(f, env) << "\n";

    // Free variables without a binding are reported by name
    try {
        compute(f + y, 1.0);
    } catch (const UnboundVariable& e) {
        std::cout << "error: " << e.what() << "\n";
    }
}
