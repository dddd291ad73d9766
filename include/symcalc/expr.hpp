#ifndef SYMCALC_EXPR_HPP
#define SYMCALC_EXPR_HPP

#include <cmath>
#include <memory>
#include <numbers>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <symcalc/errors.hpp>

namespace symcalc {

struct Node;

// --- Expr: shared handle to an immutable node ---
//
// Copying an Expr copies the handle, never the tree. Nodes are not mutated
// after construction, so subtrees are freely shared between trees and
// threads.

class Expr {
public:
    explicit Expr(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    static Expr lit(double v);
    static Expr var(std::string name);

    const Node& node() const { return *node_; }
    bool is_constant() const;

    template <typename T> const T* get_if() const;
    template <typename T> bool is() const { return get_if<T>() != nullptr; }

    // Identity of the underlying node (see equal.hpp for structural
    // equality).
    bool same(const Expr& other) const { return node_ == other.node_; }

private:
    std::shared_ptr<const Node> node_;
};

// --- Leaves ---

struct Constant {
    double value;
};

struct Variable {
    std::string name;
};

// --- Binary arithmetic ---

template <typename Op> struct Binary {
    Expr lhs;
    Expr rhs;
};

struct AddOp {};
struct SubtractOp {};
struct MultiplyOp {};
struct DivideOp {};

using Add = Binary<AddOp>;
using Subtract = Binary<SubtractOp>;
using Multiply = Binary<MultiplyOp>;
using Divide = Binary<DivideOp>;

struct Power {
    Expr base;
    Expr exponent;
};

struct Log {
    Expr value;
    Expr base;
};

struct NthRoot {
    Expr arg;
    int degree;
};

// --- Unary functions: Fn carries the display name and numeric kernel ---

template <typename Fn> struct Unary {
    Expr arg;
};

struct LnFn {
    static constexpr std::string_view name = "ln";
    static double apply(double v) { return std::log(v); }
};
struct LdFn {
    static constexpr std::string_view name = "ld";
    static double apply(double v) { return std::log2(v); }
};
struct ExpFn {
    static constexpr std::string_view name = "exp";
    static double apply(double v) { return std::exp(v); }
};
struct SqrtFn {
    static constexpr std::string_view name = "sqrt";
    static double apply(double v) { return std::sqrt(v); }
};
struct CbrtFn {
    static constexpr std::string_view name = "cbrt";
    static double apply(double v) { return std::cbrt(v); }
};
struct SinFn {
    static constexpr std::string_view name = "sin";
    static double apply(double v) { return std::sin(v); }
};
struct AsinFn {
    static constexpr std::string_view name = "asin";
    static double apply(double v) { return std::asin(v); }
};
struct CosFn {
    static constexpr std::string_view name = "cos";
    static double apply(double v) { return std::cos(v); }
};
struct AcosFn {
    static constexpr std::string_view name = "acos";
    static double apply(double v) { return std::acos(v); }
};
struct TanFn {
    static constexpr std::string_view name = "tan";
    static double apply(double v) { return std::tan(v); }
};
struct AtanFn {
    static constexpr std::string_view name = "atan";
    static double apply(double v) { return std::atan(v); }
};
// Angle conversions print transparently (see pretty_print.hpp).
struct ToRadiansFn {
    static constexpr std::string_view name = "rad";
    static double apply(double v) { return v * std::numbers::pi / 180.0; }
};
struct ToDegreesFn {
    static constexpr std::string_view name = "deg";
    static double apply(double v) { return v * 180.0 / std::numbers::pi; }
};

using Ln = Unary<LnFn>;
using Ld = Unary<LdFn>;
using Exp = Unary<ExpFn>;
using Sqrt = Unary<SqrtFn>;
using Cbrt = Unary<CbrtFn>;
using Sin = Unary<SinFn>;
using Asin = Unary<AsinFn>;
using Cos = Unary<CosFn>;
using Acos = Unary<AcosFn>;
using Tan = Unary<TanFn>;
using Atan = Unary<AtanFn>;
using ToRadians = Unary<ToRadiansFn>;
using ToDegrees = Unary<ToDegreesFn>;

// --- Node: closed set of variants ---

using NodeVariant =
    std::variant<Constant, Variable, Add, Subtract, Multiply, Divide, Power,
                 Log, NthRoot, Ln, Ld, Exp, Sqrt, Cbrt, Sin, Asin, Cos, Acos,
                 Tan, Atan, ToRadians, ToDegrees>;

struct Node {
    NodeVariant value;
    bool constant; // no Variable reachable
};

inline bool Expr::is_constant() const { return node_->constant; }

template <typename T> const T* Expr::get_if() const {
    return std::get_if<T>(&node_->value);
}

namespace detail {

struct ConstantFlag {
    bool operator()(const Constant&) const { return true; }
    bool operator()(const Variable&) const { return false; }
    template <typename Op> bool operator()(const Binary<Op>& n) const {
        return n.lhs.is_constant() && n.rhs.is_constant();
    }
    bool operator()(const Power& n) const {
        return n.base.is_constant() && n.exponent.is_constant();
    }
    bool operator()(const Log& n) const {
        return n.value.is_constant() && n.base.is_constant();
    }
    bool operator()(const NthRoot& n) const { return n.arg.is_constant(); }
    template <typename Fn> bool operator()(const Unary<Fn>& n) const {
        return n.arg.is_constant();
    }
};

} // namespace detail

inline Expr make_expr(NodeVariant v) {
    bool constant = std::visit(detail::ConstantFlag{}, v);
    return Expr(std::make_shared<const Node>(Node{std::move(v), constant}));
}

inline Expr Expr::lit(double v) {
    if (!std::isfinite(v))
        throw InvalidDomain("constant must be finite");
    return make_expr(Constant{v});
}

inline Expr Expr::var(std::string name) {
    return make_expr(Variable{std::move(name)});
}

// --- One constructor per variant ---

inline Expr add(Expr lhs, Expr rhs) {
    return make_expr(Add{std::move(lhs), std::move(rhs)});
}
inline Expr sub(Expr lhs, Expr rhs) {
    return make_expr(Subtract{std::move(lhs), std::move(rhs)});
}
inline Expr mul(Expr lhs, Expr rhs) {
    return make_expr(Multiply{std::move(lhs), std::move(rhs)});
}
inline Expr divide(Expr lhs, Expr rhs) {
    return make_expr(Divide{std::move(lhs), std::move(rhs)});
}
inline Expr pow(Expr base, Expr exponent) {
    return make_expr(Power{std::move(base), std::move(exponent)});
}
inline Expr log(Expr value, Expr base) {
    return make_expr(Log{std::move(value), std::move(base)});
}

inline Expr root(Expr arg, int degree) {
    if (degree < 2)
        throw InvalidDomain("root degree must be at least 2");
    return make_expr(NthRoot{std::move(arg), degree});
}

inline Expr ln(Expr arg) { return make_expr(Ln{std::move(arg)}); }
inline Expr ld(Expr arg) { return make_expr(Ld{std::move(arg)}); }
inline Expr exp(Expr arg) { return make_expr(Exp{std::move(arg)}); }
inline Expr sqrt(Expr arg) { return make_expr(Sqrt{std::move(arg)}); }
inline Expr cbrt(Expr arg) { return make_expr(Cbrt{std::move(arg)}); }
inline Expr sin(Expr arg) { return make_expr(Sin{std::move(arg)}); }
inline Expr asin(Expr arg) { return make_expr(Asin{std::move(arg)}); }
inline Expr cos(Expr arg) { return make_expr(Cos{std::move(arg)}); }
inline Expr acos(Expr arg) { return make_expr(Acos{std::move(arg)}); }
inline Expr tan(Expr arg) { return make_expr(Tan{std::move(arg)}); }
inline Expr atan(Expr arg) { return make_expr(Atan{std::move(arg)}); }
inline Expr to_radians(Expr arg) {
    return make_expr(ToRadians{std::move(arg)});
}
inline Expr to_degrees(Expr arg) {
    return make_expr(ToDegrees{std::move(arg)});
}

} // namespace symcalc

#endif // SYMCALC_EXPR_HPP
