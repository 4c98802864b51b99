// 参数扫描实现：Eigen 汇总 + 可选 OpenMP 并行
#include "sweep.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <Eigen/Dense>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace fuzzybrake {

std::optional<SweepParam> parse_sweep_param(const std::string& name) {
    if (name == "speed" || name == "initial_speed") return SweepParam::InitialSpeed;
    if (name == "obstacle" || name == "obstacle_position") return SweepParam::ObstaclePosition;
    if (name == "mass") return SweepParam::Mass;
    if (name == "mu" || name == "friction") return SweepParam::Friction;
    if (name == "incline" || name == "incline_deg") return SweepParam::InclineDeg;
    if (name == "eject" || name == "eject_threshold") return SweepParam::EjectThreshold;
    return std::nullopt;
}

const char* to_string(SweepParam p) {
    switch (p) {
    case SweepParam::InitialSpeed: return "initial_speed";
    case SweepParam::ObstaclePosition: return "obstacle_position";
    case SweepParam::Mass: return "mass";
    case SweepParam::Friction: return "mu";
    case SweepParam::InclineDeg: return "incline_deg";
    case SweepParam::EjectThreshold: return "eject_threshold";
    }
    return "unknown";
}

double get_param(const VehicleParams& p, SweepParam which) {
    switch (which) {
    case SweepParam::InitialSpeed: return p.initial_speed;
    case SweepParam::ObstaclePosition: return p.obstacle_position;
    case SweepParam::Mass: return p.mass;
    case SweepParam::Friction: return p.mu;
    case SweepParam::InclineDeg: return -p.theta * 180.0 / M_PI;
    case SweepParam::EjectThreshold: return p.eject_decel_threshold;
    }
    return 0.0;
}

void set_param(VehicleParams& p, SweepParam which, double value) {
    switch (which) {
    case SweepParam::InitialSpeed: p.initial_speed = value; break;
    case SweepParam::ObstaclePosition: p.obstacle_position = value; break;
    case SweepParam::Mass: p.mass = value; break;
    case SweepParam::Friction: p.mu = value; break;
    case SweepParam::InclineDeg: p.theta = incline_from_degrees(value); break;
    case SweepParam::EjectThreshold: p.eject_decel_threshold = value; break;
    }
}

std::vector<SweepRow> sweep_parameter(const VehicleParams& base,
                                      const ControllerConfig& cfg,
                                      SweepParam which,
                                      const SweepRange& range,
                                      const SweepSettings& settings) {
    // 配置不合法时不运行
    if (!validate(cfg).empty()) return {};

    const int n = std::max(range.samples, 1);
    Eigen::VectorXd values;
    if (n == 1) {
        values = Eigen::VectorXd::Constant(1, range.min);
    } else {
        values = Eigen::VectorXd::LinSpaced(n, range.min, range.max);
    }

    std::vector<SweepRow> rows(static_cast<std::size_t>(n));

    // 每个样本持有独立会话与控制器配置
    #pragma omp parallel for if(n>1)
    for (int i = 0; i < n; ++i) {
        VehicleParams p = base;
        set_param(p, which, values(i));
        SimulationSession session(p, SchedulerSettings{}, RecorderSettings{false, 1}, settings.dt);
        rows[static_cast<std::size_t>(i)].value = values(i);
        if (!session.controller().set_config(cfg)) continue;
        rows[static_cast<std::size_t>(i)].summary =
            session.run_headless(settings.frame_interval, settings.max_sim_time);
    }
    return rows;
}

SweepStats summarize(const std::vector<SweepRow>& rows) {
    SweepStats st;
    if (rows.empty()) return st;

    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    Eigen::VectorXd peak(n), dist(n), stop_t(n);
    Eigen::Index finished = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const RunSummary& s = rows[static_cast<std::size_t>(i)].summary;
        peak(i) = s.peak_decel;
        dist(i) = s.min_distance;
        if (!s.stop) {
            ++st.unfinished;
            continue;
        }
        stop_t(finished++) = s.t;
        switch (reason_of(*s.stop)) {
        case StopReason::Rest: ++st.rest; break;
        case StopReason::Obstacle: ++st.obstacle; break;
        case StopReason::Eject: ++st.eject; break;
        }
    }
    st.mean_stop_time = finished > 0 ? stop_t.head(finished).mean() : 0.0;
    st.max_peak_decel = peak.maxCoeff();
    st.min_distance = dist.minCoeff();
    return st;
}

bool write_sweep_csv(const std::string& path, SweepParam which, const std::vector<SweepRow>& rows) {
    std::ofstream f(path);
    if (!f) return false;
    f.precision(10);
    f << to_string(which) << ",reason,t,x,v,peak_decel,min_distance,steps\n";
    for (const auto& r : rows) {
        const RunSummary& s = r.summary;
        f << r.value << ',' << (s.stop ? to_string(reason_of(*s.stop)) : "unfinished") << ','
          << s.t << ',' << s.x << ',' << s.v << ',' << s.peak_decel << ',' << s.min_distance << ','
          << s.steps << '\n';
    }
    return static_cast<bool>(f);
}

} // namespace fuzzybrake
