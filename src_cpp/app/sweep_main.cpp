// 参数扫描工具：单参数等距样本，输出 CSV 与终止原因统计
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include "sweep.hpp"

using namespace fuzzybrake;

namespace {

void print_usage() {
    std::cout << "fuzzybrake_sweep usage:\n"
              << "  fuzzybrake_sweep --param <speed|obstacle|mass|mu|incline|eject> [--min v] [--max v]\n"
              << "                   [--samples n] [--max-time s] [--out file]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    bool min_set = false;
    bool max_set = false;
    int samples = 5;
    double max_time = 60.0;
    std::string out = "sweep.csv";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = argv[++i];
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--max-time" && i + 1 < argc) {
                max_time = std::stod(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
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
        return 1;
    } catch (const std::out_of_range& e) {
        std::cout << "Numeric value out of range (" << e.what() << ")\n";
        return 1;
    }

    const auto which = parse_sweep_param(param);
    if (!which) {
        std::cout << "Unsupported parameter: " << param << "\n";
        print_usage();
        return 1;
    }

    // 未指定范围时取当前值 ±25%
    const VehicleParams base{};
    const double nominal = get_param(base, *which);
    SweepRange range;
    range.min = min_set ? min_val : nominal * 0.75;
    range.max = max_set ? max_val : nominal * 1.25;
    range.samples = samples;

    SweepSettings settings;
    settings.max_sim_time = max_time;

    const auto rows = sweep_parameter(base, default_controller_config(), *which, range, settings);
    if (rows.empty()) {
        std::cout << "Sweep produced no rows\n";
        return 1;
    }
    const SweepStats st = summarize(rows);
    std::printf("%s in [%.3f, %.3f], %d samples: rest=%d obstacle=%d eject=%d unfinished=%d\n",
                to_string(*which), range.min, range.max, samples, st.rest, st.obstacle, st.eject, st.unfinished);
    std::printf("mean stop time=%.3f s  max peak decel=%.3f m/s^2  min distance=%.3f m\n",
                st.mean_stop_time, st.max_peak_decel, st.min_distance);

    if (!write_sweep_csv(out, *which, rows)) {
        std::cout << "Failed to write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sweep to: " << out << "\n";
    return 0;
}
