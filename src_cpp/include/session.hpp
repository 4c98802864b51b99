// 仿真会话：持有参数、模糊控制器、状态、调度器与采样记录
#pragma once
// 调度器与积分器不依赖模糊控制器；由会话在单步回调中接线：
// 读状态 -> 距离/速度 -> 推理 -> 写回制动强度 -> 记录样本
#include <cstddef>
#include <optional>
#include <utility>
#include "dynamics.hpp"
#include "fuzzy.hpp"
#include "recorder.hpp"
#include "scheduler.hpp"
#include "vehicle.hpp"

namespace fuzzybrake {

// 单次运行摘要；stop 为空表示达到时长上限或被暂停
struct RunSummary {
    std::optional<StopEvent> stop;
    double t{0.0};
    double x{0.0};
    double v{0.0};
    double peak_decel{0.0};
    double min_distance{0.0};
    std::size_t steps{0};
    std::size_t frames{0};
};

class SimulationSession {
public:
    explicit SimulationSession(const VehicleParams& params = VehicleParams{},
                               const SchedulerSettings& sched = SchedulerSettings{},
                               const RecorderSettings& rec = RecorderSettings{},
                               double dt = kDefaultDt);

    // 回调捕获 this，禁止拷贝 / 移动
    SimulationSession(const SimulationSession&) = delete;
    SimulationSession& operator=(const SimulationSession&) = delete;

    // 参数与时间倍率仅在未运行时可改；修改后重建状态
    bool set_params(const VehicleParams& params);
    bool set_time_scale(double k);
    const VehicleParams& params() const { return params_; }

    FuzzyBrakeController& controller() { return controller_; }
    const FuzzyBrakeController& controller() const { return controller_; }

    // 重建状态并记录 t=0 样本
    void reset();
    // 总是从新状态开始（reset 后启动调度）
    void start();
    // 仅在 pause() 之后继续当前状态；未暂停或已终止时返回 false
    bool resume();
    void pause();
    bool running() const { return scheduler_.running(); }

    FrameReport frame(double elapsed_s);

    // 以固定帧间隔离线运行，直至终止或仿真时间达到上限
    RunSummary run_headless(double frame_interval_s, double max_sim_time_s);

    const SimulationState& state() const { return state_; }
    const SampleRecorder& recorder() const { return recorder_; }
    const std::optional<StopEvent>& last_stop() const { return last_stop_; }
    RunSummary summary() const;

    void set_end_listener(EndObserver fn) { end_listener_ = std::move(fn); }
    void set_ui_listener(UiCallback fn) { scheduler_.set_ui_callback(std::move(fn)); }

private:
    void on_step(SimulationState& s);
    void on_end(const StopEvent& e, const SimulationState& s);

    VehicleParams params_;
    double dt_;
    FuzzyBrakeController controller_;
    FixedStepScheduler scheduler_;
    SampleRecorder recorder_;
    SimulationState state_;
    std::optional<StopEvent> last_stop_;
    EndObserver end_listener_;
    bool paused_{false};
    double peak_decel_{0.0};
    double min_distance_{0.0};
    std::size_t steps_{0};
    std::size_t frames_{0};
};

} // namespace fuzzybrake
