#include "rms_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

RmsTracker::RmsTracker(std::size_t capacity) : window_(capacity, 0.0) {
    if (capacity == 0) {
        throw std::invalid_argument("RMS window must hold at least one sample");
    }
}

std::size_t RmsTracker::window_for_rate(unsigned sample_rate) {
    return std::max<std::size_t>(sample_rate / 100, 10);
}

void RmsTracker::update(double sample) {
    double squared = sample * sample;
    if (filled_) {
        sum_ -= window_[index_];
    }
    window_[index_] = squared;
    sum_ += squared;

    index_ = (index_ + 1) % window_.size();
    if (index_ == 0) filled_ = true;
}

double RmsTracker::current_rms() const {
    std::size_t count = filled_ ? window_.size() : index_;
    if (count == 0) return 0.0;
    // Subtraction can leave a tiny negative residue after long runs of silence.
    double mean = std::max(sum_, 0.0) / static_cast<double>(count);
    return std::sqrt(mean);
}

void RmsTracker::reset() {
    std::fill(window_.begin(), window_.end(), 0.0);
    index_ = 0;
    sum_ = 0.0;
    filled_ = false;
}
