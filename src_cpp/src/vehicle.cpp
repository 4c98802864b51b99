// 车辆参数派生量与输入清洗
#include "vehicle.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fuzzybrake {

double VehicleParams::mass_eff() const {
    return mass > kMassFloor ? mass : kMassFloor;
}

double VehicleParams::normal_force() const {
    return mass_eff() * g * std::cos(theta);
}

double VehicleParams::gravity_force() const {
    return mass_eff() * g * std::sin(theta);
}

double VehicleParams::rolling_force() const {
    return c_roll * normal_force();
}

double VehicleParams::max_brake_force() const {
    return mu * normal_force();
}

double VehicleParams::stopping_distance(double v, double brake) const {
    const double b = std::clamp(brake, 0.0, 1.0);
    const double decel = g * (c_roll + b * mu);
    if (decel <= 0.0) return std::numeric_limits<double>::infinity();
    return v * v / (2.0 * decel);
}

VehicleParams VehicleParams::sanitized() const {
    VehicleParams p = *this;
    p.mass = mass_eff();
    p.mu = std::max(0.0, mu);
    p.c_roll = std::max(0.0, c_roll);
    p.obstacle_position = std::max(0.0, obstacle_position);
    p.initial_speed = std::max(0.0, initial_speed);
    return p;
}

VehicleParams::DictMap VehicleParams::to_map() const {
    DictMap out;
    out["mass"] = mass;
    out["mu"] = mu;
    out["theta"] = theta;
    out["c_roll"] = c_roll;
    out["obstacle_position"] = obstacle_position;
    out["initial_speed"] = initial_speed;
    out["eject_decel_threshold"] = eject_decel_threshold;
    out["g"] = g;
    out["N"] = normal_force();
    out["F_g"] = gravity_force();
    out["F_roll"] = rolling_force();
    out["F_brake_max"] = max_brake_force();
    return out;
}

// 上坡为正：theta = -deg * pi / 180
double incline_from_degrees(double deg) {
    return -deg * M_PI / 180.0;
}

} // namespace fuzzybrake
