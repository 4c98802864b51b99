// 滑板 + 骑手参数与派生力
#pragma once
// 单位约定：SI（m, kg, s, rad, N）
// 目的：提供单自由度斜面制动仿真所需的参数结构与派生量
#include <string>
#include <unordered_map>

namespace fuzzybrake {

// 质量下限，避免 a = F/m 奇异
constexpr double kMassFloor = 0.1;

// 车辆（滑板 + 骑手）参数，运行期间不变
struct VehicleParams {
    double mass{70.0};
    double mu{0.7};                  // 最大制动摩擦系数
    double theta{0.0};               // 坡度（rad），正值使重力分量指向障碍物
    double c_roll{0.01};             // 滚动阻力系数
    double obstacle_position{20.0};
    double initial_speed{6.0};
    double eject_decel_threshold{8.0}; // m/s^2
    double g{9.81};

    // 有效质量：下限保护
    double mass_eff() const;
    // 法向力 N = m g cos(theta)
    double normal_force() const;
    // 沿坡重力分量 F_g = m g sin(theta)（带符号）
    double gravity_force() const;
    // 滚动阻力幅值 F_r = c_roll * N
    double rolling_force() const;
    // 最大制动力 F_bmax = mu * N
    double max_brake_force() const;
    // 恒定制动强度下的平地解析制动距离 v^2 / (2 g (c_roll + brake*mu))，无阻力时为 inf
    double stopping_distance(double v, double brake) const;

    // 输入清洗：质量/系数/位置/速度的下限截断
    VehicleParams sanitized() const;

    using DictMap = std::unordered_map<std::string, double>;

    // 返回数值参数与派生量：mass、mu、theta、c_roll、obstacle_position、initial_speed、
    // eject_decel_threshold、g、N、F_g、F_roll、F_brake_max
    DictMap to_map() const;
};

// 界面坡度（度，上坡为正）转为积分器使用的 theta（rad）
double incline_from_degrees(double deg);

} // namespace fuzzybrake
