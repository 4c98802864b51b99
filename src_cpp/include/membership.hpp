// 隶属度函数与语言变量
#pragma once
// 形状：三角形 / 梯形（std::variant 和类型，新增形状时 evaluate 编译期报错）
// 语言变量：名字 + 有序隶属度函数列表（顺序仅影响显示，不影响推理）
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace fuzzybrake {

// 三角形：a ≤ b ≤ c，峰值在 b
struct Triangular {
    double a{0.0};
    double b{0.0};
    double c{0.0};
};

// 梯形：a ≤ b ≤ c ≤ d，平台 [b, c]
struct Trapezoidal {
    double a{0.0};
    double b{0.0};
    double c{0.0};
    double d{0.0};
};

using MembershipShape = std::variant<Triangular, Trapezoidal>;

// 命名隶属度函数（名字在所属变量内唯一）
struct MembershipFunction {
    std::string name;
    MembershipShape shape;
};

struct LinguisticVariable {
    std::string name;
    std::vector<MembershipFunction> terms;

    // 按名字查找，不存在返回 nullptr
    const MembershipFunction* find(const std::string& label) const;
};

// 隶属度计算，结果在 [0,1]；退化边（a=b 或 c=d）取平台值，不产生 NaN
double triangular(double x, double a, double b, double c);
double trapezoidal(double x, double a, double b, double c, double d);
double evaluate(const MembershipShape& shape, double x);
double evaluate(const MembershipFunction& mf, double x);

// 模糊化：label -> 隶属度
using DegreeMap = std::unordered_map<std::string, double>;
DegreeMap fuzzify(const LinguisticVariable& var, double x);

// 形状支撑区间 [lo, hi]
std::pair<double, double> support(const MembershipShape& shape);

// 断点检查（有限值、单调、名字非空且唯一），返回问题描述，空表示合法
std::vector<std::string> validate(const LinguisticVariable& var);

} // namespace fuzzybrake
