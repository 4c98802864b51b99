// 单自由度斜面动力学与终止判定接口
#pragma once
// 固定步长半隐式欧拉积分；每步返回终止事件（静止 / 撞障 / 弹射）或继续
#include <optional>
#include <string>
#include <variant>
#include "vehicle.hpp"

namespace fuzzybrake {

constexpr double kDefaultDt = 1.0 / 120.0;
// |v| 小于该值视为静止
constexpr double kVelocityTolerance = 1e-3;

// 仿真状态：动态量 + 本次运行参数；reset 时整体重建
struct SimulationState {
    double t{0.0};
    double dt{kDefaultDt};
    double x{0.0};
    double v{0.0};
    double a{0.0};
    double brake{0.0};   // 最近一次控制器写入的制动强度 [0,1]
    VehicleParams params;
};

// 新状态：t=x=a=brake=0，v=初速度，参数经清洗
SimulationState make_state(const VehicleParams& p, double dt = kDefaultDt);

// 到障碍物距离，不小于 0
double distance_to_obstacle(const SimulationState& s);

// 瞬时减速度：v>0 且 a<0 时为 -a，否则为 0
double deceleration(double v, double a);

enum class StopReason { Rest, Obstacle, Eject };
enum class StopCause { Decel };

struct StopDetails {
    StopCause cause{StopCause::Decel};
    double decel{0.0};
    double decel_threshold{0.0};
};

// 终止事件：StopDetails 只存在于弹射分支
struct AtRest {};
struct HitObstacle {};
struct Ejected {
    StopDetails details;
};
using StopEvent = std::variant<AtRest, HitObstacle, Ejected>;

StopReason reason_of(const StopEvent& e);
const char* to_string(StopReason r);
// 面向用户的终止说明
std::string describe(const StopEvent& e);

// 沿坡受力分解（幅值，F_g 带符号）
struct SlopeForces {
    double N;
    double F_g;
    double F_roll;
    double F_brake_max;
    double F_brake;
};

SlopeForces slope_forces(const VehicleParams& p, double brake);

// 合力（指向障碍物为正）；近零速度且驱动力不足以克服阻力时返回 nullopt（静力平衡）
std::optional<double> net_force(double v, const SlopeForces& f, double vel_tol = kVelocityTolerance);

// 推进一个 dt，原地修改 s；继续运行时返回 nullopt
std::optional<StopEvent> step(SimulationState& s);

} // namespace fuzzybrake
