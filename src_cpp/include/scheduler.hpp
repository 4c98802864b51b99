// 固定步长调度器：帧间隔 -> 整数个物理步
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include "dynamics.hpp"

namespace fuzzybrake {

struct SchedulerSettings {
    double max_accumulator{0.1};   // 累积时间上限（s），限制单帧追赶步数；实际上限不小于 dt
    double time_scale{1.0};        // 仿真时间 / 墙钟时间
    int ui_every_n_frames{1};      // UI 刷新节流
};

// 积分步、单步观察者、终止观察者、UI 刷新回调
using StepFn = std::function<std::optional<StopEvent>(SimulationState&)>;
using StepObserver = std::function<void(SimulationState&)>;
using EndObserver = std::function<void(const StopEvent&, const SimulationState&)>;
using UiCallback = std::function<void(const SimulationState&)>;

// 单帧结果
struct FrameReport {
    int steps{0};
    double accumulated{0.0};       // 截断后、开始步进前的累积时间
    std::optional<StopEvent> stop;
    bool scheduled_next{false};
};

class FixedStepScheduler {
public:
    // step_fn 为空时使用 fuzzybrake::step
    explicit FixedStepScheduler(const SchedulerSettings& cfg = SchedulerSettings{}, StepFn step_fn = nullptr);

    void set_step_observer(StepObserver fn) { on_step_ = std::move(fn); }
    void set_end_observer(EndObserver fn) { on_end_ = std::move(fn); }
    void set_ui_callback(UiCallback fn) { on_ui_ = std::move(fn); }

    void set_settings(const SchedulerSettings& cfg);
    const SchedulerSettings& settings() const { return cfg_; }

    // 开始调度（清空累积时间）
    void start();
    // 暂停：不再调度下一帧，不打断进行中的步
    void pause();
    bool running() const { return running_; }

    // 驱动一帧；未运行时不做任何事
    FrameReport frame(SimulationState& s, double elapsed_s);

    double accumulator() const { return accumulator_; }
    std::size_t frames() const { return frames_; }
    std::size_t total_steps() const { return total_steps_; }

private:
    SchedulerSettings cfg_;
    StepFn step_fn_;
    StepObserver on_step_;
    EndObserver on_end_;
    UiCallback on_ui_;
    bool running_{false};
    double accumulator_{0.0};
    std::size_t frames_{0};
    std::size_t total_steps_{0};
};

} // namespace fuzzybrake
