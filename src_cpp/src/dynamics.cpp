// 动力学实现：
// - 沿坡受力（重力分量、滚阻、制动）
// - 静止区间判定与合力方向
// - 弹射 / 静止 / 撞障 三类终止
#include "dynamics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace fuzzybrake {

SimulationState make_state(const VehicleParams& p, double dt) {
    SimulationState s;
    s.params = p.sanitized();
    s.dt = (dt > 0.0) ? dt : kDefaultDt;
    s.v = s.params.initial_speed;
    return s;
}

double distance_to_obstacle(const SimulationState& s) {
    return std::max(0.0, s.params.obstacle_position - s.x);
}

double deceleration(double v, double a) {
    return (v > 0.0 && a < 0.0) ? -a : 0.0;
}

StopReason reason_of(const StopEvent& e) {
    return std::visit([](const auto& ev) -> StopReason {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, AtRest>) {
            return StopReason::Rest;
        } else if constexpr (std::is_same_v<T, HitObstacle>) {
            return StopReason::Obstacle;
        } else {
            static_assert(std::is_same_v<T, Ejected>, "unhandled stop event");
            return StopReason::Eject;
        }
    }, e);
}

const char* to_string(StopReason r) {
    switch (r) {
    case StopReason::Rest: return "rest";
    case StopReason::Obstacle: return "obstacle";
    case StopReason::Eject: return "eject";
    }
    return "unknown";
}

std::string describe(const StopEvent& e) {
    if (const auto* ej = std::get_if<Ejected>(&e)) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(2)
           << "rider ejected (decel " << ej->details.decel
           << " m/s^2 >= threshold " << ej->details.decel_threshold << " m/s^2)";
        return os.str();
    }
    if (std::holds_alternative<HitObstacle>(e)) return "hit obstacle";
    return "at rest";
}

SlopeForces slope_forces(const VehicleParams& p, double brake) {
    SlopeForces f{};
    f.N = p.normal_force();
    f.F_g = p.gravity_force();
    f.F_roll = p.rolling_force();
    f.F_brake_max = p.max_brake_force();
    const double b = std::clamp(brake, 0.0, 1.0);
    f.F_brake = std::min(f.F_brake_max, b * f.F_brake_max);
    return f;
}

std::optional<double> net_force(double v, const SlopeForces& f, double vel_tol) {
    const double resist = f.F_roll + f.F_brake;
    if (std::abs(v) <= vel_tol) {
        // 起步：驱动力须克服滚阻 + 制动
        if (f.F_g > resist) return f.F_g - resist;
        if (f.F_g < -resist) return f.F_g + resist;
        return std::nullopt;
    }
    // 运动中：阻力与速度方向相反
    const double sgn = (v > 0.0) ? 1.0 : -1.0;
    return f.F_g - sgn * resist;
}

std::optional<StopEvent> step(SimulationState& s) {
    const VehicleParams& p = s.params;
    const double dt = s.dt;
    s.brake = std::clamp(s.brake, 0.0, 1.0);

    const SlopeForces f = slope_forces(p, s.brake);
    const auto F_net = net_force(s.v, f);
    if (!F_net) {
        s.v = 0.0;
        s.a = 0.0;
        s.t += dt;
        return AtRest{};
    }
    const double a = *F_net / p.mass_eff();

    // 弹射判定先于积分；t=0 的首步跳过
    if (s.t > 0.0) {
        const double decel = deceleration(s.v, a);
        if (decel > 0.0 && decel >= p.eject_decel_threshold) {
            s.v = 0.0;
            s.a = 0.0;
            s.t += dt;
            return Ejected{StopDetails{StopCause::Decel, decel, p.eject_decel_threshold}};
        }
    }

    // 半隐式欧拉：先速度后位置
    const double v_prev = s.v;
    const double v_new = v_prev + a * dt;
    const bool crossed = std::abs(v_prev) > kVelocityTolerance && v_new * v_prev < 0.0;
    if (crossed || std::abs(v_new) <= kVelocityTolerance) {
        // 不模拟越过静止点的反向运动，位置保持步前值
        s.v = 0.0;
        s.a = 0.0;
        s.t += dt;
        return AtRest{};
    }
    s.v = v_new;
    s.a = a;
    s.x += s.v * dt;
    s.t += dt;

    if (s.x >= p.obstacle_position) {
        s.x = p.obstacle_position;
        s.v = 0.0;
        s.a = 0.0;
        return HitObstacle{};
    }
    // 从静止向后滑出起点：停在起点
    if (s.x < 0.0) {
        s.x = 0.0;
        s.v = 0.0;
        s.a = 0.0;
        return AtRest{};
    }
    return std::nullopt;
}

} // namespace fuzzybrake
