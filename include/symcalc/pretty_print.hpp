#ifndef SYMCALC_PRETTY_PRINT_HPP
#define SYMCALC_PRETTY_PRINT_HPP

#include <charconv>
#include <cmath>
#include <numbers>
#include <ostream>
#include <string>
#include <string_view>

#include <symcalc/expr.hpp>

namespace symcalc {

namespace detail {

// Binding strength of the printed form; operands weaker than their parent
// get parentheses.
enum Prec : int { kSum = 1, kProduct = 2, kPower = 3, kAtom = 4 };

struct Printed {
    std::string text;
    int prec;
};

inline std::string format_number(double v) {
    if (v == std::numbers::pi)
        return "π";
    if (v == -std::numbers::pi)
        return "-π";
    if (v == std::numbers::e)
        return "e";
    if (v == -std::numbers::e)
        return "-e";
    if (std::trunc(v) == v && std::fabs(v) < 1e15)
        return std::to_string(static_cast<long long>(v));
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{})
        return std::to_string(v);
    return std::string(buf, end);
}

// Prefix form of a coefficient: 2 -> "2", -1 -> "-", 1 -> "".
inline std::string coefficient(double v) {
    if (v == 1.0)
        return "";
    if (v == -1.0)
        return "-";
    return format_number(v);
}

// x and x^k take a juxtaposed coefficient ("3x", "2.75x^2").
inline bool takes_coefficient(const Expr& e) {
    if (e.is<Variable>())
        return true;
    const auto* p = e.get_if<Power>();
    return p && p->base.is<Variable>() && p->exponent.is<Constant>();
}

struct Printer {
    Printed print(const Expr& e) const {
        return std::visit(*this, e.node().value);
    }

    std::string operand(const Expr& e, int min_prec) const {
        auto p = print(e);
        if (p.prec < min_prec)
            return "(" + p.text + ")";
        return p.text;
    }

    Printed operator()(const Constant& n) const {
        return {format_number(n.value), n.value < 0 ? kProduct : kAtom};
    }
    Printed operator()(const Variable& n) const { return {n.name, kAtom}; }

    Printed operator()(const Add& n) const {
        return {operand(n.lhs, kSum) + " + " + operand(n.rhs, kSum), kSum};
    }
    Printed operator()(const Subtract& n) const {
        return {operand(n.lhs, kSum) + " - " + operand(n.rhs, kProduct),
                kSum};
    }
    Printed operator()(const Multiply& n) const {
        const auto* c = n.lhs.get_if<Constant>();
        if (c && takes_coefficient(n.rhs))
            return {coefficient(c->value) + print(n.rhs).text, kProduct};
        if (n.lhs.is<Variable>() && n.rhs.is<Variable>())
            return {print(n.lhs).text + print(n.rhs).text, kProduct};
        if (c && c->value == -1.0)
            return {"-" + operand(n.rhs, kProduct), kProduct};
        return {operand(n.lhs, kProduct) + " * " + operand(n.rhs, kProduct),
                kProduct};
    }
    Printed operator()(const Divide& n) const {
        return {operand(n.lhs, kProduct) + " / " + operand(n.rhs, kPower),
                kProduct};
    }
    Printed operator()(const Power& n) const {
        return {operand(n.base, kAtom) + "^" + operand(n.exponent, kAtom),
                kPower};
    }
    Printed operator()(const Log& n) const {
        return {"log" + operand(n.base, kAtom) + "(" + print(n.value).text +
                    ")",
                kAtom};
    }
    Printed operator()(const NthRoot& n) const {
        return {"root" + std::to_string(n.degree) + "(" + print(n.arg).text +
                    ")",
                kAtom};
    }
    Printed operator()(const ToRadians& n) const { return print(n.arg); }
    Printed operator()(const ToDegrees& n) const { return print(n.arg); }
    template <typename Fn> Printed operator()(const Unary<Fn>& n) const {
        return {std::string(Fn::name) + "(" + print(n.arg).text + ")", kAtom};
    }
};

} // namespace detail

// --- pretty_print: human-readable algebraic form ---

inline std::string pretty_print(const Expr& e) {
    return detail::Printer{}.print(e).text;
}

inline std::ostream& operator<<(std::ostream& os, const Expr& e) {
    return os << pretty_print(e);
}

} // namespace symcalc

#endif // SYMCALC_PRETTY_PRINT_HPP
