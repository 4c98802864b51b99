#include "recorder.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fuzzybrake {

SampleRecorder::SampleRecorder(const RecorderSettings& cfg)
    : cfg_(cfg), buf_(std::max<std::size_t>(1, cfg.capacity)) {}

void SampleRecorder::push(const Sample& s) {
    if (!cfg_.enabled) return;
    buf_[idx_] = s;
    idx_ = (idx_ + 1) % buf_.size();
    if (size_ < buf_.size()) ++size_;
}

void SampleRecorder::clear() {
    std::fill(buf_.begin(), buf_.end(), Sample{});
    idx_ = 0;
    size_ = 0;
}

std::vector<Sample> SampleRecorder::all() const {
    std::vector<Sample> out;
    out.reserve(size_);
    const std::size_t cap = buf_.size();
    const std::size_t start = (idx_ + cap - size_) % cap;
    for (std::size_t i = 0; i < size_; ++i) {
        out.push_back(buf_[(start + i) % cap]);
    }
    return out;
}

std::string SampleRecorder::to_csv() const {
    std::ostringstream os;
    os.precision(10);
    os << "t,x,v,a,brake,distance\n";
    for (const auto& s : all()) {
        os << s.t << ',' << s.x << ',' << s.v << ',' << s.a << ',' << s.brake << ',' << s.distance << '\n';
    }
    return os.str();
}

bool SampleRecorder::write_csv(const std::string& path) const {
    std::ofstream f(path);
    if (!f) return false;
    f << to_csv();
    return static_cast<bool>(f);
}

} // namespace fuzzybrake
