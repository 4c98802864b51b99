// 命令行仿真驱动：实时帧循环（单调时钟）或离线固定帧间隔
#include <chrono>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include "session.hpp"

using namespace fuzzybrake;

namespace {

void print_usage() {
    std::cout << "fuzzybrake_sim usage:\n"
              << "  fuzzybrake_sim [--mass kg] [--speed m/s] [--obstacle m] [--mu v] [--incline deg]\n"
              << "                 [--roll v] [--eject m/s^2] [--time-scale k] [--dt s] [--fps n]\n"
              << "                 [--max-time s] [--csv file] [--headless] [--quiet]\n";
}

void print_params(const VehicleParams& p) {
    std::printf("mass=%.1f kg  v0=%.2f m/s  obstacle=%.1f m  mu=%.2f  theta=%.4f rad  c_roll=%.3f  eject=%.2f m/s^2\n",
                p.mass, p.initial_speed, p.obstacle_position, p.mu, p.theta, p.c_roll, p.eject_decel_threshold);
}

void print_status(const SimulationState& s) {
    std::printf("t=%7.3f  x=%7.3f  v=%6.3f  a=%7.3f  brake=%5.1f%%  dist=%6.3f\n",
                s.t, s.x, s.v, s.a, s.brake * 100.0, distance_to_obstacle(s));
}

} // namespace

int main(int argc, char** argv) {
    VehicleParams p;
    double time_scale = 1.0;
    double dt = kDefaultDt;
    double fps = 60.0;
    double max_time = 60.0;
    std::string csv;
    bool headless = false;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--mass" && i + 1 < argc) {
                p.mass = std::stod(argv[++i]);
            } else if (arg == "--speed" && i + 1 < argc) {
                p.initial_speed = std::stod(argv[++i]);
            } else if (arg == "--obstacle" && i + 1 < argc) {
                p.obstacle_position = std::stod(argv[++i]);
            } else if (arg == "--mu" && i + 1 < argc) {
                p.mu = std::stod(argv[++i]);
            } else if (arg == "--incline" && i + 1 < argc) {
                p.theta = incline_from_degrees(std::stod(argv[++i]));
            } else if (arg == "--roll" && i + 1 < argc) {
                p.c_roll = std::stod(argv[++i]);
            } else if (arg == "--eject" && i + 1 < argc) {
                p.eject_decel_threshold = std::stod(argv[++i]);
            } else if (arg == "--time-scale" && i + 1 < argc) {
                time_scale = std::stod(argv[++i]);
            } else if (arg == "--dt" && i + 1 < argc) {
                dt = std::stod(argv[++i]);
            } else if (arg == "--fps" && i + 1 < argc) {
                fps = std::stod(argv[++i]);
            } else if (arg == "--max-time" && i + 1 < argc) {
                max_time = std::stod(argv[++i]);
            } else if (arg == "--csv" && i + 1 < argc) {
                csv = argv[++i];
            } else if (arg == "--headless") {
                headless = true;
            } else if (arg == "--quiet") {
                quiet = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                print_usage();
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cout << "Malformed numeric value (" << e.what() << ")\n";
        print_usage();
        return 1;
    } catch (const std::out_of_range& e) {
        std::cout << "Numeric value out of range (" << e.what() << ")\n";
        print_usage();
        return 1;
    }

    if (!(time_scale > 0.0) || !(dt > 0.0) || !(fps > 0.0)) {
        std::cout << "--time-scale, --dt and --fps must be positive\n";
        return 1;
    }

    SchedulerSettings sched;
    sched.time_scale = time_scale;
    sched.ui_every_n_frames = static_cast<int>(fps / 4.0) > 0 ? static_cast<int>(fps / 4.0) : 1;
    SimulationSession session(p, sched, RecorderSettings{}, dt);
    print_params(session.params());

    session.set_end_listener([](const StopEvent& e, const SimulationState& s) {
        std::printf("Simulation stopped: %s at t=%.3f s, x=%.3f m\n", describe(e).c_str(), s.t, s.x);
    });
    if (!quiet) {
        session.set_ui_listener([](const SimulationState& s) { print_status(s); });
    }

    RunSummary summary;
    const double frame_period = 1.0 / fps;
    if (headless) {
        summary = session.run_headless(frame_period, max_time);
    } else {
        // 实时：按墙钟测帧间隔，睡眠到下一帧
        using clock = std::chrono::steady_clock;
        const auto period = std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(frame_period));
        session.start();
        auto last = clock::now();
        auto next = last + period;
        while (session.running()) {
            std::this_thread::sleep_until(next);
            next += period;
            const auto now = clock::now();
            const double elapsed = std::chrono::duration<double>(now - last).count();
            last = now;
            session.frame(elapsed);
            if (session.running() && session.state().t >= max_time) {
                session.pause();
            }
        }
        summary = session.summary();
    }

    if (!summary.stop) {
        std::printf("Simulation paused at time limit t=%.3f s\n", summary.t);
    }
    std::printf("steps=%zu  frames=%zu  peak_decel=%.3f m/s^2  min_distance=%.3f m\n",
                summary.steps, summary.frames, summary.peak_decel, summary.min_distance);

    if (!csv.empty()) {
        if (!session.recorder().write_csv(csv)) {
            std::cout << "Failed to write CSV: " << csv << "\n";
            return 1;
        }
        std::cout << "Wrote " << session.recorder().size() << " samples to: " << csv << "\n";
    }
    return 0;
}
