// 会话实现：调度器回调接线与运行统计
#include "session.hpp"
#include <algorithm>
#include <cmath>

namespace fuzzybrake {

SimulationSession::SimulationSession(const VehicleParams& params,
                                     const SchedulerSettings& sched,
                                     const RecorderSettings& rec,
                                     double dt)
    : params_(params.sanitized()),
      dt_(dt > 0.0 ? dt : kDefaultDt),
      scheduler_(sched),
      recorder_(rec) {
    scheduler_.set_step_observer([this](SimulationState& s) { on_step(s); });
    scheduler_.set_end_observer([this](const StopEvent& e, const SimulationState& s) { on_end(e, s); });
    reset();
}

bool SimulationSession::set_params(const VehicleParams& params) {
    if (running()) return false;
    params_ = params.sanitized();
    reset();
    return true;
}

bool SimulationSession::set_time_scale(double k) {
    if (running() || !(k > 0.0)) return false;
    SchedulerSettings cfg = scheduler_.settings();
    cfg.time_scale = k;
    scheduler_.set_settings(cfg);
    return true;
}

void SimulationSession::reset() {
    scheduler_.pause();
    paused_ = false;
    state_ = make_state(params_, dt_);
    last_stop_.reset();
    peak_decel_ = 0.0;
    min_distance_ = distance_to_obstacle(state_);
    steps_ = 0;
    frames_ = 0;
    recorder_.clear();
    recorder_.push(Sample{state_.t, state_.x, state_.v, 0.0, 0.0, min_distance_});
}

void SimulationSession::start() {
    if (running()) return;
    reset();
    scheduler_.start();
}

bool SimulationSession::resume() {
    if (running() || !paused_) return false;
    paused_ = false;
    scheduler_.start();
    return true;
}

void SimulationSession::pause() {
    if (!running()) return;
    scheduler_.pause();
    paused_ = true;
}

FrameReport SimulationSession::frame(double elapsed_s) {
    FrameReport rep = scheduler_.frame(state_, elapsed_s);
    steps_ += static_cast<std::size_t>(rep.steps);
    if (rep.scheduled_next || rep.stop) ++frames_;
    return rep;
}

RunSummary SimulationSession::run_headless(double frame_interval_s, double max_sim_time_s) {
    if (!(frame_interval_s > 0.0)) frame_interval_s = 1.0 / 60.0;
    start();
    while (running()) {
        frame(frame_interval_s);
        if (running() && state_.t >= max_sim_time_s) {
            pause();
        }
    }
    return summary();
}

RunSummary SimulationSession::summary() const {
    RunSummary out;
    out.stop = last_stop_;
    out.t = state_.t;
    out.x = state_.x;
    out.v = state_.v;
    out.peak_decel = peak_decel_;
    out.min_distance = min_distance_;
    out.steps = steps_;
    out.frames = frames_;
    return out;
}

// 单步回调：推理并写回下一步使用的制动强度
void SimulationSession::on_step(SimulationState& s) {
    const double distance = distance_to_obstacle(s);
    const double brake = controller_.brake(std::abs(s.v), distance);
    s.brake = std::clamp(brake, 0.0, 1.0);

    peak_decel_ = std::max(peak_decel_, deceleration(s.v, s.a));
    min_distance_ = std::min(min_distance_, distance);
    recorder_.push(Sample{s.t, s.x, s.v, s.a, s.brake, distance});
}

void SimulationSession::on_end(const StopEvent& e, const SimulationState& s) {
    if (const auto* ej = std::get_if<Ejected>(&e)) {
        peak_decel_ = std::max(peak_decel_, ej->details.decel);
    }
    last_stop_ = e;
    paused_ = false;
    if (end_listener_) end_listener_(e, s);
}

} // namespace fuzzybrake
