#include <cassert>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include "recorder.hpp"

using namespace fuzzybrake;

int main() {
    // 环形覆盖：容量 3，写入 5 条，保留最新 3 条且由旧到新
    {
        SampleRecorder rec(RecorderSettings{true, 3});
        assert(rec.capacity() == 3u);
        for (int i = 0; i < 5; ++i) {
            rec.push(Sample{0.1 * i, 1.0 * i, 2.0, -0.5, 0.25, 20.0 - i});
        }
        auto all = rec.all();
        assert(all.size() == 3u);
        assert(all[0].x == 2.0 && all[1].x == 3.0 && all[2].x == 4.0);

        const std::string csv = rec.to_csv();
        std::istringstream is(csv);
        std::string line;
        std::getline(is, line);
        assert(line == "t,x,v,a,brake,distance");
        int rows = 0;
        while (std::getline(is, line)) ++rows;
        assert(rows == 3);

        rec.clear();
        assert(rec.size() == 0u);
        assert(rec.all().empty());
        assert(rec.to_csv() == "t,x,v,a,brake,distance\n");
    }

    // 未满时顺序
    {
        SampleRecorder rec;
        rec.push(Sample{0.0, 0.0, 6.0, 0.0, 0.0, 20.0});
        rec.push(Sample{0.01, 0.06, 5.9, -1.0, 0.1, 19.94});
        auto all = rec.all();
        assert(all.size() == 2u);
        assert(all[0].t == 0.0 && all[1].t == 0.01);
    }

    // 禁用与零容量
    {
        SampleRecorder off(RecorderSettings{false, 10});
        off.push(Sample{});
        assert(off.size() == 0u);
        SampleRecorder tiny(RecorderSettings{true, 0});
        assert(tiny.capacity() == 1u);
        tiny.push(Sample{1.0, 0, 0, 0, 0, 0});
        tiny.push(Sample{2.0, 0, 0, 0, 0, 0});
        assert(tiny.size() == 1u && tiny.all()[0].t == 2.0);
    }

    // 写文件
    {
        SampleRecorder rec;
        rec.push(Sample{0.5, 1.5, 2.5, -0.5, 0.75, 18.5});
        const std::string path = "recorder_test_out.csv";
        assert(rec.write_csv(path));
        std::ifstream f(path);
        std::stringstream ss;
        ss << f.rdbuf();
        assert(ss.str() == rec.to_csv());
        std::remove(path.c_str());
        assert(!rec.write_csv("/nonexistent-dir/out.csv"));
    }

    std::printf("PASS: recorder checks\n");
    return 0;
}
