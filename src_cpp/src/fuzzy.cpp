// 模糊推理实现：
// - 参考隶属度与规则库
// - 模糊化 -> 规则激活（min/max）-> 输出聚合 -> 离散重心
#include "fuzzy.hpp"
#include <algorithm>
#include <Eigen/Dense>

namespace fuzzybrake {

ControllerConfig default_controller_config() {
    ControllerConfig cfg;
    cfg.speed = {"Speed", {
        {"Low", Triangular{0.0, 0.0, 4.0}},
        {"Medium", Triangular{2.0, 5.0, 8.0}},
        {"High", Triangular{6.0, 10.0, 10.0}},
    }};
    cfg.distance = {"Distance", {
        {"Close", Triangular{0.0, 0.0, 5.0}},
        {"Medium", Triangular{3.0, 9.0, 15.0}},
        {"Far", Triangular{12.0, 20.0, 20.0}},
    }};
    cfg.brake = {"Brake", {
        {"Soft", Triangular{0.0, 0.0, 0.4}},
        {"Moderate", Triangular{0.2, 0.5, 0.8}},
        {"Hard", Triangular{0.6, 1.0, 1.0}},
    }};
    cfg.rules = {
        {"Close", "High", "Hard"},
        {"Close", "Medium", "Hard"},
        {"Close", "Low", "Moderate"},
        {"Medium", "High", "Moderate"},
        {"Medium", "Medium", "Moderate"},
        {"Medium", "Low", "Soft"},
        {"Far", "High", "Moderate"},
        {"Far", "Medium", "Soft"},
        {"Far", "Low", "Soft"},
    };
    return cfg;
}

std::vector<std::string> validate(const ControllerConfig& cfg) {
    std::vector<std::string> issues;
    for (const auto* var : {&cfg.speed, &cfg.distance, &cfg.brake}) {
        auto v = validate(*var);
        issues.insert(issues.end(), v.begin(), v.end());
    }
    if (cfg.rules.empty()) issues.push_back("rules: empty rule base");
    for (std::size_t i = 0; i < cfg.rules.size(); ++i) {
        const Rule& r = cfg.rules[i];
        const std::string where = "rule[" + std::to_string(i) + "]";
        if (!cfg.distance.find(r.distance)) issues.push_back(where + ": unknown distance label '" + r.distance + "'");
        if (!cfg.speed.find(r.speed)) issues.push_back(where + ": unknown speed label '" + r.speed + "'");
        if (!cfg.brake.find(r.brake)) issues.push_back(where + ": unknown brake label '" + r.brake + "'");
    }
    return issues;
}

DegreeMap rule_activations(double speed, double distance, const ControllerConfig& cfg) {
    const DegreeMap speed_deg = fuzzify(cfg.speed, speed);
    const DegreeMap dist_deg = fuzzify(cfg.distance, distance);

    DegreeMap act;
    for (const auto& mf : cfg.brake.terms) act[mf.name] = 0.0;

    // 未知标签按隶属度 0 处理
    auto degree = [](const DegreeMap& m, const std::string& k) {
        const auto it = m.find(k);
        return it == m.end() ? 0.0 : it->second;
    };
    for (const auto& r : cfg.rules) {
        const double w = std::min(degree(dist_deg, r.distance), degree(speed_deg, r.speed));
        double& slot = act[r.brake];
        slot = std::max(slot, w);
    }
    return act;
}

double infer(double speed, double distance, const ControllerConfig& cfg, int samples) {
    const DegreeMap act = rule_activations(speed, distance, cfg);

    // 输出域 [0,1] 离散化：xs(i) = i / n
    const int n = std::max(samples, 1);
    const Eigen::VectorXd xs = Eigen::VectorXd::LinSpaced(n + 1, 0.0, 1.0);
    Eigen::VectorXd mu = Eigen::VectorXd::Zero(n + 1);

    // 聚合：各输出函数按激活度削顶后取最大
    for (const auto& mf : cfg.brake.terms) {
        const auto it = act.find(mf.name);
        const double level = (it == act.end()) ? 0.0 : it->second;
        if (level <= 0.0) continue;
        for (int i = 0; i <= n; ++i) {
            const double clipped = std::min(evaluate(mf, xs(i)), level);
            if (clipped > mu(i)) mu(i) = clipped;
        }
    }

    // 离散重心：Σ x·μ / Σ μ
    const double den = mu.sum();
    if (den == 0.0) return 0.0;
    return std::clamp(xs.dot(mu) / den, 0.0, 1.0);
}

FuzzyBrakeController::FuzzyBrakeController() : cfg_(default_controller_config()) {}

double FuzzyBrakeController::brake(double speed, double distance) const {
    return infer(speed, distance, cfg_, samples_);
}

bool FuzzyBrakeController::set_config(const ControllerConfig& cfg) {
    issues_ = validate(cfg);
    if (!issues_.empty()) return false;
    cfg_ = cfg;
    return true;
}

void FuzzyBrakeController::reset_to_defaults() {
    cfg_ = default_controller_config();
    issues_.clear();
}

void FuzzyBrakeController::set_samples(int n) {
    samples_ = std::max(n, 1);
}

} // namespace fuzzybrake
