// Mamdani 模糊制动控制器
#pragma once
// 输入：速度 |v|（m/s）、到障碍物距离（m）；输出：制动强度 [0,1]
// AND = min，OR = max，离散重心法解模糊
#include <string>
#include <vector>
#include "membership.hpp"

namespace fuzzybrake {

// 默认离散采样数（输出域 [0,1] 上 samples+1 个点）
constexpr int kDefaultBrakeSamples = 200;

// 规则：IF distance IS <distance> AND speed IS <speed> THEN brake IS <brake>
struct Rule {
    std::string distance;
    std::string speed;
    std::string brake;
};

// 控制器配置：三个语言变量 + 固定规则库，整体替换
struct ControllerConfig {
    LinguisticVariable speed;
    LinguisticVariable distance;
    LinguisticVariable brake;
    std::vector<Rule> rules;
};

// 参考配置（速度 0-10 m/s，距离 0-20 m，制动 0-1）
ControllerConfig default_controller_config();

// 检查三个变量的断点，以及规则引用的标签是否存在
std::vector<std::string> validate(const ControllerConfig& cfg);

// 规则激活：每个制动标签取所有同标签规则激活度的最大值（未触发的标签为 0）
DegreeMap rule_activations(double speed, double distance, const ControllerConfig& cfg);

// 推理：纯函数，配置只读；分母为 0（无规则触发）时定义为 0
double infer(double speed, double distance, const ControllerConfig& cfg,
             int samples = kDefaultBrakeSamples);

// 配置持有者：单一所有者负责整体替换，读取返回深拷贝
class FuzzyBrakeController {
public:
    FuzzyBrakeController();

    // 制动强度 [0,1]
    double brake(double speed, double distance) const;

    // 整体替换；配置不合法时保留旧配置并返回 false（问题见 last_issues()）
    bool set_config(const ControllerConfig& cfg);
    ControllerConfig config() const { return cfg_; }
    void reset_to_defaults();

    int samples() const { return samples_; }
    void set_samples(int n);

    const std::vector<std::string>& last_issues() const { return issues_; }

private:
    ControllerConfig cfg_;
    int samples_{kDefaultBrakeSamples};
    std::vector<std::string> issues_;
};

} // namespace fuzzybrake
