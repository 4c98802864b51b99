// 逐步采样记录：环形缓冲 + CSV 导出
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace fuzzybrake {

// 记录配置：是否启用、最大点数（超出后覆盖最旧样本）
struct RecorderSettings {
    bool enabled{true};
    std::size_t capacity{10000};
};

struct Sample {
    double t{0.0};
    double x{0.0};
    double v{0.0};
    double a{0.0};
    double brake{0.0};
    double distance{0.0};
};

class SampleRecorder {
public:
    explicit SampleRecorder(const RecorderSettings& cfg = RecorderSettings{});

    void push(const Sample& s);
    void clear();

    // 由旧到新
    std::vector<Sample> all() const;
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return buf_.size(); }
    bool enabled() const { return cfg_.enabled; }

    // 表头 t,x,v,a,brake,distance
    std::string to_csv() const;
    bool write_csv(const std::string& path) const;

private:
    RecorderSettings cfg_;
    std::vector<Sample> buf_;
    std::size_t idx_{0};
    std::size_t size_{0};
};

} // namespace fuzzybrake
