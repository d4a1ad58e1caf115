#include "rms_tracker.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using test_utils::expect;
using test_utils::expect_near;

int main() {
    std::cout << "=== Testing RmsTracker ===" << std::endl;

    expect(RmsTracker::window_for_rate(8000) == 80, "8 kHz uses an 80 sample window");
    expect(RmsTracker::window_for_rate(44100) == 441, "44.1 kHz uses a 441 sample window");
    expect(RmsTracker::window_for_rate(500) == 10, "window never shrinks below 10 samples");

    RmsTracker tracker(80);
    expect(tracker.current_rms() == 0.0, "empty window reports zero");

    // Partial window averages only what has been written.
    tracker.update(0.5);
    tracker.update(-0.5);
    tracker.update(0.5);
    expect_near(tracker.current_rms(), 0.5, 1e-12, "partial window RMS");

    // Once full, the value must match the last `capacity` samples exactly.
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    std::vector<double> fed;
    for (int i = 0; i < 5000; ++i) {
        double s = dist(rng);
        // Bursts of loud and quiet passages stress the running sum.
        if ((i / 400) % 2 == 1) s *= 0.01;
        fed.push_back(s);
        tracker.update(s);

        if (fed.size() >= tracker.capacity() && i % 97 == 0) {
            double expected = rms(fed.data() + fed.size() - tracker.capacity(), tracker.capacity());
            expect_near(tracker.current_rms(), expected, 1e-9,
                        "sliding RMS after sample " + std::to_string(i));
        }
    }
    double expected = rms(fed.data() + fed.size() - tracker.capacity(), tracker.capacity());
    expect_near(tracker.current_rms(), expected, 1e-9, "sliding RMS at the end of the run");

    // A window full of silence after loud input settles at zero.
    for (std::size_t i = 0; i < tracker.capacity(); ++i) tracker.update(0.0);
    expect_near(tracker.current_rms(), 0.0, 1e-9, "silence after noise reads zero");

    tracker.reset();
    expect(tracker.current_rms() == 0.0, "reset empties the window");
    tracker.update(0.25);
    expect_near(tracker.current_rms(), 0.25, 1e-12, "reset restarts the partial window");

    bool threw = false;
    try {
        RmsTracker bad(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "zero capacity is rejected");

    return test_utils::finish("RmsTracker");
}
