// 参数扫描：对单一参数取等距样本，独立会话离线运行并汇总终止结果
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "fuzzy.hpp"
#include "session.hpp"
#include "vehicle.hpp"

namespace fuzzybrake {

enum class SweepParam {
    InitialSpeed,
    ObstaclePosition,
    Mass,
    Friction,
    InclineDeg,
    EjectThreshold,
};

std::optional<SweepParam> parse_sweep_param(const std::string& name);
const char* to_string(SweepParam p);

// 参数当前值（InclineDeg 按上坡为正的度数返回）
double get_param(const VehicleParams& p, SweepParam which);
void set_param(VehicleParams& p, SweepParam which, double value);

struct SweepRange {
    double min{0.0};
    double max{0.0};
    int samples{5};
};

struct SweepSettings {
    double frame_interval{1.0 / 60.0};
    double max_sim_time{60.0};
    double dt{kDefaultDt};
};

struct SweepRow {
    double value{0.0};
    RunSummary summary;
};

struct SweepStats {
    int rest{0};
    int obstacle{0};
    int eject{0};
    int unfinished{0};
    double mean_stop_time{0.0};
    double max_peak_decel{0.0};
    double min_distance{0.0};
};

// 各样本互相独立；编译启用 OpenMP 时并行。cfg 不合法时返回空
std::vector<SweepRow> sweep_parameter(const VehicleParams& base,
                                      const ControllerConfig& cfg,
                                      SweepParam which,
                                      const SweepRange& range,
                                      const SweepSettings& settings = SweepSettings{});

SweepStats summarize(const std::vector<SweepRow>& rows);

// 表头 value,reason,t,x,v,peak_decel,min_distance,steps
bool write_sweep_csv(const std::string& path, SweepParam which, const std::vector<SweepRow>& rows);

} // namespace fuzzybrake
