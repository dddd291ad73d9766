// 04_transforms.cpp - Transforming, substituting, and folding trees
//
// Shows: transform() with a custom rule, substitute(), fold() for
//        bottom-up accumulation, node_count(), depth(), variables(),
//        chaining transforms with the pipe operator.

#include <cstddef>
#include <iostream>
#include <optional>
#include <vector>
#include <symcalc/symcalc.hpp>

using namespace symcalc;

int main() {
    auto x = Expr::var("x");
    auto y = Expr::var("y");
    auto f = sin(x * y) + pow(x, 2.0) * 3.0;

    // --- transform: swap sin for cos everywhere ---
    auto swapped = transform(f, [](const Expr& n) -> std::optional<Expr> {
        if (const auto* s = n.get_if<Sin>())
            return cos(s->arg);
        return std::nullopt;
    });
    std::cout << "swapped:    " << swapped << "\n";

    // --- substitute: x := y + 1 ---
    auto shifted = substitute(f, "x", y + 1.0);
    std::cout << "x := y + 1: " << shifted << "\n";

    // --- fold: count function applications ---
    auto calls = fold<std::size_t>(
        f, [](const Expr& n, const std::vector<std::size_t>& kids) {
            std::size_t sum = n.is<Sin>() || n.is<Cos>() ? 1 : 0;
            for (auto k : kids)
                sum += k;
            return sum;
        });
    std::cout << "nodes: " << node_count(f) << ", depth: " << depth(f)
              << ", trig calls: " << calls << "\n";

    std::cout << "variables:";
    for (const auto& name : variables(f))
        std::cout << " " << name;
    std::cout << "\n";

    // --- Pipe: substitute, differentiate, evaluate ---
    auto at_y = [](const Expr& e) { return substitute(e, "y", Expr::lit(2.0)); };
    auto d = [](const Expr& e) { return differentiate(e); };
    auto g = f | at_y | d;
    std::cout << "d/dx f(x, 2) = " << g << "\n";
    std::cout << "at x = 1: " << compute(g, 1.0) << "\n";
}
