#ifndef SYMCALC_TRANSFORMS_HPP
#define SYMCALC_TRANSFORMS_HPP

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <symcalc/expr.hpp>

namespace symcalc {

// --- children / with_children: uniform access to operands ---

namespace detail {

struct ChildList {
    std::vector<Expr> operator()(const Constant&) const { return {}; }
    std::vector<Expr> operator()(const Variable&) const { return {}; }
    template <typename Op>
    std::vector<Expr> operator()(const Binary<Op>& n) const {
        return {n.lhs, n.rhs};
    }
    std::vector<Expr> operator()(const Power& n) const {
        return {n.base, n.exponent};
    }
    std::vector<Expr> operator()(const Log& n) const {
        return {n.value, n.base};
    }
    std::vector<Expr> operator()(const NthRoot& n) const { return {n.arg}; }
    template <typename Fn>
    std::vector<Expr> operator()(const Unary<Fn>& n) const {
        return {n.arg};
    }
};

struct Rebuild {
    const Expr& self;
    const std::vector<Expr>& c;

    Expr operator()(const Constant&) const { return self; }
    Expr operator()(const Variable&) const { return self; }
    template <typename Op> Expr operator()(const Binary<Op>&) const {
        return make_expr(Binary<Op>{c[0], c[1]});
    }
    Expr operator()(const Power&) const { return make_expr(Power{c[0], c[1]}); }
    Expr operator()(const Log&) const { return make_expr(Log{c[0], c[1]}); }
    Expr operator()(const NthRoot& n) const {
        return make_expr(NthRoot{c[0], n.degree});
    }
    template <typename Fn> Expr operator()(const Unary<Fn>&) const {
        return make_expr(Unary<Fn>{c[0]});
    }
};

} // namespace detail

inline std::vector<Expr> children(const Expr& e) {
    return std::visit(detail::ChildList{}, e.node().value);
}

// Same variant and payload as e, with the given operands.
inline Expr with_children(const Expr& e, const std::vector<Expr>& c) {
    return std::visit(detail::Rebuild{e, c}, e.node().value);
}

// --- transform: bottom-up rebuild with a replacement rule ---
//
// The rule sees every node after its operands were rebuilt and returns a
// replacement or nullopt to keep it.

template <typename Rule> Expr transform(const Expr& e, Rule rule) {
    auto kids = children(e);
    Expr rebuilt = e;
    if (!kids.empty()) {
        std::vector<Expr> next;
        next.reserve(kids.size());
        bool changed = false;
        for (const auto& k : kids) {
            next.push_back(transform(k, rule));
            changed = changed || !next.back().same(k);
        }
        if (changed)
            rebuilt = with_children(e, next);
    }
    if (std::optional<Expr> replacement = rule(rebuilt))
        return *replacement;
    return rebuilt;
}

// --- fold: bottom-up accumulation ---

template <typename R, typename Visitor>
R fold(const Expr& e, Visitor visitor) {
    std::vector<R> results;
    for (const auto& k : children(e))
        results.push_back(fold<R>(k, visitor));
    return visitor(e, results);
}

inline std::size_t node_count(const Expr& e) {
    return fold<std::size_t>(e, [](const Expr&, const auto& kids) {
        std::size_t sum = 1;
        for (auto k : kids)
            sum += k;
        return sum;
    });
}

inline std::size_t depth(const Expr& e) {
    return fold<std::size_t>(e, [](const Expr&, const auto& kids) {
        std::size_t deepest = 0;
        for (auto k : kids)
            deepest = std::max(deepest, k);
        return deepest + 1;
    });
}

// Free variable names in order of first appearance.
inline std::vector<std::string> variables(const Expr& e) {
    using Names = std::vector<std::string>;
    return fold<Names>(e, [](const Expr& n, const std::vector<Names>& kids) {
        Names names;
        auto add_name = [&](const std::string& name) {
            if (std::find(names.begin(), names.end(), name) == names.end())
                names.push_back(name);
        };
        if (const auto* v = n.get_if<Variable>())
            add_name(v->name);
        for (const auto& k : kids)
            for (const auto& name : k)
                add_name(name);
        return names;
    });
}

// --- substitute: replace a variable by an expression ---

inline Expr substitute(const Expr& e, std::string_view name,
                       const Expr& replacement) {
    return transform(e, [&](const Expr& n) -> std::optional<Expr> {
        if (const auto* v = n.get_if<Variable>(); v && v->name == name)
            return replacement;
        return std::nullopt;
    });
}

// Pipe operator for transform composition
template <typename F> auto operator|(const Expr& e, F transform_fn) {
    return transform_fn(e);
}

} // namespace symcalc

#endif // SYMCALC_TRANSFORMS_HPP
