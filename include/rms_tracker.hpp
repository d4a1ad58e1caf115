#pragma once

#include <cstddef>
#include <vector>

// Sliding-window RMS over the most recent `capacity` samples.
class RmsTracker {
public:
    explicit RmsTracker(std::size_t capacity);

    // Window size used for a given sample rate: 10 ms, at least 10 samples.
    static std::size_t window_for_rate(unsigned sample_rate);

    void update(double sample);
    double current_rms() const;
    void reset();

    std::size_t capacity() const { return window_.size(); }

private:
    std::vector<double> window_;
    std::size_t index_{0};
    double sum_{0.0};
    bool filled_{false};
};
