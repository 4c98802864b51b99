// 隶属度函数实现：
// - 三角形 / 梯形隶属度（退化边取平台值）
// - variant 穷举派发
// - 语言变量模糊化与断点检查
#include "membership.hpp"
#include <cmath>
#include <set>
#include <sstream>
#include <type_traits>

namespace fuzzybrake {

namespace {

template <class>
inline constexpr bool always_false_v = false;

void check_order(const std::string& where, const std::vector<double>& pts, std::vector<std::string>& out) {
    for (double v : pts) {
        if (!std::isfinite(v)) {
            out.push_back(where + ": non-finite breakpoint");
            return;
        }
    }
    for (std::size_t i = 1; i < pts.size(); ++i) {
        if (pts[i] < pts[i - 1]) {
            std::ostringstream os;
            os << where << ": breakpoints not monotonic (p" << (i - 1) << "=" << pts[i - 1]
               << " > p" << i << "=" << pts[i] << ")";
            out.push_back(os.str());
        }
    }
}

} // namespace

const MembershipFunction* LinguisticVariable::find(const std::string& label) const {
    for (const auto& mf : terms) {
        if (mf.name == label) return &mf;
    }
    return nullptr;
}

// 三角形：峰值点先判（a=b 或 b=c 时 x=b 取 1），支撑外为 0
double triangular(double x, double a, double b, double c) {
    if (std::isnan(x)) return 0.0;
    if (x == b) return 1.0;
    if (x <= a || x >= c) return 0.0;
    if (x < b) return (x - a) / (b - a);
    return (c - x) / (c - b);
}

// 梯形：平台 [b,c] 先判，两侧线性
double trapezoidal(double x, double a, double b, double c, double d) {
    if (std::isnan(x)) return 0.0;
    if (x >= b && x <= c) return 1.0;
    if (x <= a || x >= d) return 0.0;
    if (x < b) return (x - a) / (b - a);
    return (d - x) / (d - c);
}

double evaluate(const MembershipShape& shape, double x) {
    return std::visit([x](const auto& s) -> double {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Triangular>) {
            return triangular(x, s.a, s.b, s.c);
        } else if constexpr (std::is_same_v<T, Trapezoidal>) {
            return trapezoidal(x, s.a, s.b, s.c, s.d);
        } else {
            static_assert(always_false_v<T>, "unhandled membership shape");
        }
    }, shape);
}

double evaluate(const MembershipFunction& mf, double x) {
    return evaluate(mf.shape, x);
}

DegreeMap fuzzify(const LinguisticVariable& var, double x) {
    DegreeMap out;
    out.reserve(var.terms.size());
    for (const auto& mf : var.terms) {
        out[mf.name] = evaluate(mf, x);
    }
    return out;
}

std::pair<double, double> support(const MembershipShape& shape) {
    return std::visit([](const auto& s) -> std::pair<double, double> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Triangular>) {
            return {s.a, s.c};
        } else if constexpr (std::is_same_v<T, Trapezoidal>) {
            return {s.a, s.d};
        } else {
            static_assert(always_false_v<T>, "unhandled membership shape");
        }
    }, shape);
}

std::vector<std::string> validate(const LinguisticVariable& var) {
    std::vector<std::string> issues;
    if (var.terms.empty()) {
        issues.push_back(var.name + ": no membership functions");
    }
    std::set<std::string> seen;
    for (const auto& mf : var.terms) {
        const std::string where = var.name + "." + (mf.name.empty() ? std::string("<unnamed>") : mf.name);
        if (mf.name.empty()) {
            issues.push_back(where + ": empty name");
        } else if (!seen.insert(mf.name).second) {
            issues.push_back(where + ": duplicate name");
        }
        std::visit([&](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, Triangular>) {
                check_order(where, {s.a, s.b, s.c}, issues);
            } else if constexpr (std::is_same_v<T, Trapezoidal>) {
                check_order(where, {s.a, s.b, s.c, s.d}, issues);
            } else {
                static_assert(always_false_v<T>, "unhandled membership shape");
            }
        }, mf.shape);
    }
    return issues;
}

} // namespace fuzzybrake
