// 模糊推理测试：零激活、对称三角峰值、取值范围、确定性、配置替换
#include <cassert>
#include <cmath>
#include <cstdio>
#include "fuzzy.hpp"

using namespace fuzzybrake;

static inline bool near(double a, double b, double tol=1e-6) {
    return std::abs(a-b) <= tol;
}

int main() {
    const ControllerConfig cfg = default_controller_config();
    assert(validate(cfg).empty());
    assert(cfg.rules.size() == 9u);

    // 两个输入都在所有支撑外：无规则触发，定义为 0
    {
        const double b = infer(15.0, 50.0, cfg);
        assert(b == 0.0);
        auto act = rule_activations(15.0, 50.0, cfg);
        assert(act.size() == 3u);
        for (const auto& kv : act) assert(kv.second == 0.0);
    }

    // Close ∧ Low -> Moderate 满激活，重心在 Moderate 峰值 0.5
    {
        auto act = rule_activations(0.0, 0.0, cfg);
        assert(near(act["Moderate"], 1.0, 1e-12));
        assert(act["Soft"] == 0.0);
        assert(act["Hard"] == 0.0);
        const double b = infer(0.0, 0.0, cfg);
        assert(near(b, 0.5, 1.0 / 200.0));
    }

    // 部分激活（0.75）时对称三角的重心仍在峰值
    {
        auto act = rule_activations(1.0, 0.0, cfg);
        assert(near(act["Moderate"], 0.75, 1e-12));
        const double b = infer(1.0, 0.0, cfg);
        assert(near(b, 0.5, 1.0 / 200.0));
    }

    // 采样数是精度参数
    {
        const double b50 = infer(0.0, 0.0, cfg, 50);
        assert(near(b50, 0.5, 1.0 / 50.0));
        const double b1 = infer(0.0, 0.0, cfg, 0);
        assert(b1 >= 0.0 && b1 <= 1.0);
    }

    // 高速近距离：只有 Hard 触发
    {
        const double b = infer(10.0, 0.0, cfg);
        assert(b > 0.8 && b < 0.95);
        // 远距离低速偏软
        const double soft = infer(1.0, 20.0, cfg);
        assert(soft < 0.3);
        assert(b > soft);
    }

    // 取值范围与确定性
    {
        for (int i = 0; i <= 24; ++i) {
            for (int j = 0; j <= 30; ++j) {
                const double speed = 0.5 * i;
                const double dist = 1.0 * j;
                const double b1 = infer(speed, dist, cfg);
                const double b2 = infer(speed, dist, cfg);
                assert(std::isfinite(b1));
                assert(b1 >= 0.0 && b1 <= 1.0);
                assert(b1 == b2);
            }
        }
    }

    // 控制器：整体替换、非法配置拒绝、读取深拷贝
    {
        FuzzyBrakeController ctl;
        const double ref = ctl.brake(0.0, 0.0);
        assert(near(ref, infer(0.0, 0.0, cfg), 0.0));

        ControllerConfig copy = ctl.config();
        copy.brake.terms[1].shape = Triangular{0.0, 0.1, 0.2};
        assert(ctl.brake(0.0, 0.0) == ref);

        ControllerConfig bad = cfg;
        bad.speed.terms[0].shape = Triangular{4.0, 0.0, 0.0};
        bad.rules.push_back({"Close", "Warp", "Hard"});
        assert(!ctl.set_config(bad));
        assert(ctl.last_issues().size() == 2u);
        assert(ctl.brake(0.0, 0.0) == ref);

        // Moderate 改为对称梯形，峰区中心仍为 0.5
        ControllerConfig trap = cfg;
        trap.brake.terms[1].shape = Trapezoidal{0.3, 0.45, 0.55, 0.7};
        assert(ctl.set_config(trap));
        assert(ctl.last_issues().empty());
        assert(near(ctl.brake(0.0, 0.0), 0.5, 1.0 / 200.0));

        ctl.set_samples(-5);
        assert(ctl.samples() == 1);
        ctl.set_samples(kDefaultBrakeSamples);
        ctl.reset_to_defaults();
        assert(ctl.brake(0.0, 0.0) == ref);
    }

    std::printf("PASS: fuzzy inference checks\n");
    return 0;
}
