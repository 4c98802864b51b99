#include <cassert>
#include <cmath>
#include <iostream>
#include "vehicle.hpp"

using namespace fuzzybrake;

int main() {
    VehicleParams vp;
    vp.theta = incline_from_degrees(5.0);

    std::cout << "N=" << vp.normal_force() << "\n";
    std::cout << "F_g=" << vp.gravity_force() << "\n";
    std::cout << "F_roll=" << vp.rolling_force() << "\n";
    std::cout << "F_brake_max=" << vp.max_brake_force() << "\n";

    // 上坡为正：重力分量背离障碍物
    assert(vp.theta < 0.0);
    assert(vp.gravity_force() < 0.0);
    assert(std::abs(incline_from_degrees(10.0) + 10.0 * M_PI / 180.0) < 1e-15);

    auto m = vp.to_map();
    std::cout << "map[mass]=" << m["mass"] << ", map[N]=" << m["N"] << ", map[F_brake_max]=" << m["F_brake_max"] << "\n";
    assert(m.size() == 12u);
    assert(std::abs(m["F_brake_max"] - vp.mu * m["N"]) < 1e-9);

    // 平地、无制动：解析制动距离 v^2 / (2 g c_roll) ≈ 183 m
    VehicleParams flat;
    const double d0 = flat.stopping_distance(6.0, 0.0);
    std::cout << "stopping_distance(v=6, brake=0)=" << d0 << "\n";
    assert(std::abs(d0 - 36.0 / (2.0 * 9.81 * 0.01)) < 1e-9);
    assert(d0 > flat.obstacle_position);
    flat.c_roll = 0.0;
    assert(std::isinf(flat.stopping_distance(6.0, 0.0)));

    // 输入清洗
    VehicleParams raw;
    raw.mass = -3.0;
    raw.mu = -0.2;
    raw.c_roll = -0.01;
    raw.obstacle_position = -5.0;
    raw.initial_speed = -1.0;
    const VehicleParams clean = raw.sanitized();
    assert(clean.mass == kMassFloor);
    assert(clean.mu == 0.0 && clean.c_roll == 0.0);
    assert(clean.obstacle_position == 0.0 && clean.initial_speed == 0.0);
    assert(raw.mass_eff() == kMassFloor);

    std::cout << "[PASS] vehicle params checks\n";
    return 0;
}
