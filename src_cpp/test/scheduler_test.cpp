#include <cassert>
#include <cmath>
#include <cstdio>
#include <vector>
#include "scheduler.hpp"

using namespace fuzzybrake;

int main() {
    // dt 取 2 的幂，累积与扣减均为精确运算
    const double dt = 1.0 / 128.0;

    // Test: 每帧步数 = floor(累积 / dt)，累积不超过上限
    {
        int calls = 0;
        StepFn counter = [&calls](SimulationState& s) -> std::optional<StopEvent> {
            ++calls;
            s.t += s.dt;
            return std::nullopt;
        };
        SchedulerSettings cfg;
        cfg.max_accumulator = 0.1;
        FixedStepScheduler sched(cfg, counter);
        SimulationState s;
        s.dt = dt;

        int observed = 0;
        sched.set_step_observer([&observed](SimulationState&) { ++observed; });
        sched.start();

        const std::vector<double> intervals = {0.016, 0.033, 0.5, 0.0, 0.004, 0.2, 0.0078125, 1e-4, 0.05};
        int total = 0;
        for (double e : intervals) {
            FrameReport rep = sched.frame(s, e);
            assert(rep.accumulated <= cfg.max_accumulator);
            assert(rep.steps == static_cast<int>(std::floor(rep.accumulated / dt)));
            assert(rep.scheduled_next);
            assert(!rep.stop.has_value());
            assert(sched.accumulator() < dt);
            total += rep.steps;
        }
        assert(calls == total);
        assert(observed == total);
        assert(sched.total_steps() == static_cast<std::size_t>(total));
        assert(sched.frames() == intervals.size());

        // 上限截断：大间隔只追赶 floor(0.1 / dt) 步
        FrameReport big = sched.frame(s, 10.0);
        assert(big.accumulated == cfg.max_accumulator);
        assert(big.steps == static_cast<int>(std::floor(0.1 / dt)));
    }

    // Test: 时间倍率与负间隔
    {
        StepFn noop = [](SimulationState&) -> std::optional<StopEvent> { return std::nullopt; };
        SchedulerSettings cfg;
        cfg.time_scale = 2.0;
        FixedStepScheduler sched(cfg, noop);
        SimulationState s;
        s.dt = dt;
        sched.start();
        FrameReport rep = sched.frame(s, 8.0 / 128.0);
        assert(rep.accumulated == 16.0 / 128.0 || rep.accumulated == cfg.max_accumulator);
        FrameReport neg = sched.frame(s, -1.0);
        assert(neg.steps == 0);
        assert(neg.scheduled_next);
    }

    // Test: 终止后最后一次单步回调，终止回调仅一次，不再调度
    {
        int calls = 0;
        StepFn stop_at_5 = [&calls](SimulationState& s) -> std::optional<StopEvent> {
            ++calls;
            s.t += s.dt;
            if (calls == 5) return HitObstacle{};
            return std::nullopt;
        };
        FixedStepScheduler sched(SchedulerSettings{}, stop_at_5);
        SimulationState s;
        s.dt = dt;
        int observed = 0;
        int ended = 0;
        int ui = 0;
        StopReason reason = StopReason::Rest;
        sched.set_step_observer([&observed](SimulationState&) { ++observed; });
        sched.set_end_observer([&](const StopEvent& e, const SimulationState&) {
            ++ended;
            reason = reason_of(e);
            assert(observed == 5);
        });
        sched.set_ui_callback([&ui](const SimulationState&) { ++ui; });
        sched.start();

        FrameReport rep = sched.frame(s, 0.1);
        assert(rep.steps == 5);
        assert(rep.stop.has_value());
        assert(!rep.scheduled_next);
        assert(!sched.running());
        assert(observed == 5);
        assert(ended == 1);
        assert(ui == 0);
        assert(reason == StopReason::Obstacle);

        FrameReport after = sched.frame(s, 0.1);
        assert(after.steps == 0);
        assert(!after.scheduled_next);
        assert(calls == 5);
        assert(ended == 1);
    }

    // Test: 暂停只阻止下一帧
    {
        StepFn noop = [](SimulationState& s) -> std::optional<StopEvent> { s.t += s.dt; return std::nullopt; };
        FixedStepScheduler sched(SchedulerSettings{}, noop);
        SimulationState s;
        s.dt = dt;
        FrameReport idle = sched.frame(s, 0.05);
        assert(idle.steps == 0 && !idle.scheduled_next);
        sched.start();
        sched.frame(s, 0.05);
        const double t1 = s.t;
        sched.pause();
        FrameReport paused = sched.frame(s, 0.05);
        assert(paused.steps == 0);
        assert(s.t == t1);
    }

    // Test: UI 刷新节流
    {
        StepFn noop = [](SimulationState&) -> std::optional<StopEvent> { return std::nullopt; };
        SchedulerSettings cfg;
        cfg.ui_every_n_frames = 3;
        FixedStepScheduler sched(cfg, noop);
        SimulationState s;
        s.dt = dt;
        int ui = 0;
        sched.set_ui_callback([&ui](const SimulationState&) { ++ui; });
        sched.start();
        for (int i = 0; i < 7; ++i) sched.frame(s, 0.01);
        assert(ui == 2);
    }

    // Test: dt 大于累积上限时上限抬到 dt，仍能推进
    {
        int calls = 0;
        StepFn counter = [&calls](SimulationState& s) -> std::optional<StopEvent> {
            ++calls;
            s.t += s.dt;
            return std::nullopt;
        };
        FixedStepScheduler sched(SchedulerSettings{}, counter);
        SimulationState s;
        s.dt = 0.25;
        sched.start();
        FrameReport big = sched.frame(s, 0.5);
        assert(big.accumulated == 0.25);
        assert(big.steps == 1);
        assert(s.t == 0.25);
        // 小间隔逐帧累积，直到满一个 dt
        int frames = 0;
        while (calls < 2 && frames < 100) {
            sched.frame(s, 1.0 / 64.0);
            ++frames;
        }
        assert(calls == 2);
        assert(frames == 16);

        SchedulerSettings zero;
        zero.max_accumulator = 0.0;
        FixedStepScheduler capped(zero, counter);
        SimulationState z;
        z.dt = dt;
        capped.start();
        FrameReport rep = capped.frame(z, 0.05);
        assert(rep.accumulated == dt);
        assert(rep.steps == 1);
    }

    // Test: 默认积分步（不注入 step_fn）
    {
        FixedStepScheduler sched;
        SimulationState s = make_state(VehicleParams{});
        sched.start();
        FrameReport rep = sched.frame(s, 0.05);
        assert(rep.steps >= 5 && rep.steps <= 6);
        assert(std::abs(s.t - rep.steps * s.dt) < 1e-12);
        assert(s.x > 0.0);
    }

    std::printf("PASS: scheduler basic checks\n");
    return 0;
}
