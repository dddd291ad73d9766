#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <symcalc/compute.hpp>
#include <symcalc/differentiate.hpp>
#include <symcalc/math.hpp>
#include <symcalc/pretty_print.hpp>

using namespace symcalc;

namespace {
const Expr x = Expr::var("x");
const Expr y = Expr::var("y");

std::string derivative(const Expr& e) {
    return pretty_print(differentiate(e));
}

// Symmetric difference quotient of f at v.
double central_difference(const Expr& f, double v) {
    const double h = 1e-6;
    return (compute(f, v + h) - compute(f, v - h)) / (2 * h);
}
} // namespace

// --- Basic rules ---

TEST(Differentiate, Leaves) {
    EXPECT_EQ(derivative(Expr::lit(4.0)), "0");
    EXPECT_EQ(derivative(x), "1");
    EXPECT_EQ(derivative(y), "0");
}

TEST(Differentiate, Products) {
    EXPECT_EQ(derivative(x * 5.0), "5");
    EXPECT_EQ(derivative(x * 5.5), "5.5");
    EXPECT_EQ(derivative(pow(x, 3.0)), "3x^2");
    EXPECT_EQ(derivative(pow(x, 2.0) + 3.0 * x), "3 + 2x");
}

TEST(Differentiate, Quotients) {
    EXPECT_EQ(derivative(1.0 / x), "-1 / x^2");
}

TEST(Differentiate, Functions) {
    EXPECT_EQ(derivative(sin(x)), "cos(x)");
    EXPECT_EQ(derivative(cos(x)), "-sin(x)");
    EXPECT_EQ(derivative(exp(x)), "exp(x)");
    EXPECT_EQ(derivative(ln(x)), "1 / x");
}

TEST(Differentiate, SecondDerivative) {
    EXPECT_EQ(pretty_print(differentiate(differentiate(pow(x, 3.0)))), "6x");
}

// Other variables are treated as constants.
TEST(Differentiate, OtherVariable) {
    EXPECT_EQ(pretty_print(differentiate(x * y, "y")), "x");
    EXPECT_EQ(pretty_print(differentiate(sin(y), "x")), "0");
}

// --- Raw derivative ---

TEST(Differentiate, RawDerivativeIsUnsimplified) {
    auto raw = detail::derive(x * x, "x");
    EXPECT_TRUE(raw.is<Add>());
    EXPECT_EQ(pretty_print(raw), "x + x * 1");
    EXPECT_EQ(pretty_print(simplify(raw)), "2x");
}

TEST(Differentiate, LeavesInputUnchanged) {
    auto f = pow(x, 2.0) + sin(x);
    auto before = pretty_print(f);
    differentiate(f);
    EXPECT_EQ(pretty_print(f), before);
}

// --- Numeric cross-check against the difference quotient ---

TEST(Differentiate, MatchesCentralDifference) {
    std::vector<Expr> cases = {
        pow(x, 3.0) - 2.0 * x,
        pow(Expr::lit(2.0), x),
        pow(x, x),
        pow(sin(x) + 2.0, x * x),
        (x + 1.0) / (x - 2.0),
        x * exp(x) * ln(x),
        log(x, 3.0),
        log(x * x + 1.0, 2.0),
        ld(x),
        ln(x * x + 1.0),
        exp(sin(x)),
        sqrt(x * x + 1.0),
        cbrt(x + 2.0),
        root(x + 1.0, 5),
        sin(x * x),
        cos(3.0 * x),
        tan(x),
        asin(x),
        acos(x),
        atan(x * x),
        sin(to_radians(x)),
        to_degrees(x),
    };
    for (const auto& f : cases) {
        auto df = differentiate(f);
        for (double v : {0.3, 0.7}) {
            double expected = central_difference(f, v);
            EXPECT_NEAR(compute(df, v), expected,
                        1e-6 * std::max(1.0, std::fabs(expected)))
                << pretty_print(f) << " -> " << pretty_print(df) << " at "
                << v;
        }
    }
}

TEST(Differentiate, NthRootDerivative) {
    // d/dx root(x, 3) = 1 / (3 * root(x, 3)^2)
    auto df = differentiate(root(x, 3));
    EXPECT_NEAR(compute(df, 8.0), 1.0 / 12.0, 1e-12);
}
