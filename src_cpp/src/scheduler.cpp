// 固定步长调度实现：时间累积、上限截断、逐步回调
#include "scheduler.hpp"
#include <algorithm>

namespace fuzzybrake {

namespace {

SchedulerSettings clean(SchedulerSettings cfg) {
    cfg.max_accumulator = std::max(0.0, cfg.max_accumulator);
    cfg.time_scale = std::max(1e-6, cfg.time_scale);
    cfg.ui_every_n_frames = std::max(1, cfg.ui_every_n_frames);
    return cfg;
}

} // namespace

FixedStepScheduler::FixedStepScheduler(const SchedulerSettings& cfg, StepFn step_fn)
    : cfg_(clean(cfg)), step_fn_(std::move(step_fn)) {
    if (!step_fn_) {
        step_fn_ = [](SimulationState& s) { return step(s); };
    }
}

void FixedStepScheduler::set_settings(const SchedulerSettings& cfg) {
    cfg_ = clean(cfg);
}

void FixedStepScheduler::start() {
    accumulator_ = 0.0;
    frames_ = 0;
    total_steps_ = 0;
    running_ = true;
}

void FixedStepScheduler::pause() {
    running_ = false;
}

FrameReport FixedStepScheduler::frame(SimulationState& s, double elapsed_s) {
    FrameReport rep;
    if (!running_ || !(s.dt > 0.0)) return rep;

    // 上限至少容纳一个 dt，否则永远无法推进
    const double cap = std::max(cfg_.max_accumulator, s.dt);
    accumulator_ += std::max(0.0, elapsed_s) * cfg_.time_scale;
    if (accumulator_ > cap) accumulator_ = cap;
    rep.accumulated = accumulator_;

    while (accumulator_ >= s.dt) {
        auto stop = step_fn_(s);
        accumulator_ -= s.dt;
        ++rep.steps;
        ++total_steps_;
        if (stop) {
            // 终止：停止调度，最后一次单步回调，再通知终止原因（仅一次）
            running_ = false;
            if (on_step_) on_step_(s);
            if (on_end_) on_end_(*stop, s);
            rep.stop = std::move(stop);
            return rep;
        }
        if (on_step_) on_step_(s);
    }

    ++frames_;
    if (on_ui_ && frames_ % static_cast<std::size_t>(cfg_.ui_every_n_frames) == 0) on_ui_(s);
    rep.scheduled_next = true;
    return rep;
}

} // namespace fuzzybrake
